// snapframe/system/error.hpp
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

#include <ostream>
#include <system_error>

namespace snapframe {

typedef std::error_condition ErrorConditionT;
typedef std::error_code      ErrorCodeT;
typedef std::error_category  ErrorCategoryT;

} // namespace snapframe
