// snapframe/system/exception.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once
#include "snapframe/system/common.hpp"
#include "snapframe/system/log.hpp"
#include <sstream>
#include <stdexcept>
#include <string>

namespace snapframe {

//! Thrown on broken preconditions; what() is "[file(line)][function] message"
class RuntimeError : public std::runtime_error {
public:
    RuntimeError(const char* _file, int _line, const char* _fnc, const std::string& _msg);
};

} // namespace snapframe

#if defined(__clang__) || defined(__GNUC__)
#define snapframe_likely(x) __builtin_expect(!!(x), 1)
#else
#define snapframe_likely(x) (!!(x))
#endif

#define snapframe_throw(x)                                                                                   \
    do {                                                                                                     \
        std::ostringstream snapframe_throw_os;                                                               \
        snapframe_throw_os << x;                                                                             \
        throw snapframe::RuntimeError(__FILE__, __LINE__, static_cast<const char*>(SNAPFRAME_FUNCTION_NAME), \
            snapframe_throw_os.str());                                                                       \
    } while (false)

#define snapframe_throw_log(l, x)          \
    do {                                   \
        snapframe_log(l, Exception, x);    \
        snapframe_throw(x);                \
    } while (false)

#define snapframe_check1(a)                               \
    do {                                                  \
        if (!snapframe_likely(a)) {                       \
            snapframe_throw("(" #a ") check failed");     \
        }                                                 \
    } while (false)

#define snapframe_check2(a, msg)                                  \
    do {                                                          \
        if (!snapframe_likely(a)) {                               \
            snapframe_throw("(" #a ") check failed: " << msg);    \
        }                                                         \
    } while (false)

#define snapframe_check_log2(a, l)                                \
    do {                                                          \
        if (!snapframe_likely(a)) {                               \
            snapframe_throw_log(l, "(" #a ") check failed");      \
        }                                                         \
    } while (false)

#define snapframe_check_log3(a, l, msg)                                    \
    do {                                                                   \
        if (!snapframe_likely(a)) {                                        \
            snapframe_throw_log(l, "(" #a ") check failed: " << msg);      \
        }                                                                  \
    } while (false)

#define snapframe_check(...) SNAPFRAME_CALL_OVERLOAD(snapframe_check, __VA_ARGS__)
#define snapframe_check_log(...) SNAPFRAME_CALL_OVERLOAD(snapframe_check_log, __VA_ARGS__)
