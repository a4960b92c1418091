// idpack/system/error.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/system/common.hpp"

#include <ostream>
#include <system_error>

namespace idpack {

typedef std::error_condition ErrorConditionT;
typedef std::error_category  ErrorCategoryT;

extern const ErrorConditionT error_check;

} //namespace idpack
