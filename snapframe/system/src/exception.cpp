// snapframe/system/src/exception.cpp
//
// Copyright (c) 2026 The SnapFrame Authors
//
// This file is part of SnapFrame library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "snapframe/system/exception.hpp"

namespace snapframe {

namespace {

std::string format_what(const char* _file, const int _line, const char* _fnc, const std::string& _msg)
{
    std::ostringstream oss;
    oss << '[' << _file << '(' << _line << ")][" << _fnc << "] " << _msg;
    return oss.str();
}

} // namespace

RuntimeError::RuntimeError(const char* _file, const int _line, const char* _fnc, const std::string& _msg)
    : std::runtime_error(format_what(_file, _line, _fnc, _msg))
{
}

} // namespace snapframe
