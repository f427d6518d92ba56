// snapframe/system/common.hpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "snapframe/snapframe_config.hpp"
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace snapframe {

class NonCopyable {
protected:
    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable(NonCopyable&&)                 = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable& operator=(NonCopyable&&)      = delete;

    NonCopyable() = default;
};

} // namespace snapframe

// Some macro helpers:

// adapted from: https://stackoverflow.com/questions/9183993/msvc-variadic-macro-expansion/9338429#9338429
#define SNAPFRAME_GLUE(x, y) x y

#define SNAPFRAME_RETURN_ARG_COUNT(_1_, _2_, _3_, _4_, _5_, count, ...) count
#define SNAPFRAME_EXPAND_ARGS(args) SNAPFRAME_RETURN_ARG_COUNT args
#define SNAPFRAME_COUNT_ARGS_MAX5(...) SNAPFRAME_EXPAND_ARGS((__VA_ARGS__, 5, 4, 3, 2, 1, 0))

#define SNAPFRAME_OVERLOAD_MACRO2(name, count) name##count
#define SNAPFRAME_OVERLOAD_MACRO1(name, count) SNAPFRAME_OVERLOAD_MACRO2(name, count)
#define SNAPFRAME_OVERLOAD_MACRO(name, count) SNAPFRAME_OVERLOAD_MACRO1(name, count)

#define SNAPFRAME_CALL_OVERLOAD(name, ...) SNAPFRAME_GLUE(SNAPFRAME_OVERLOAD_MACRO(name, SNAPFRAME_COUNT_ARGS_MAX5(__VA_ARGS__)), (__VA_ARGS__))

#ifndef SNAPFRAME_FUNCTION_NAME
#ifdef SNAPFRAME_ON_WINDOWS
#define SNAPFRAME_FUNCTION_NAME __func__
#else
#define SNAPFRAME_FUNCTION_NAME __FUNCTION__
#endif
#endif
