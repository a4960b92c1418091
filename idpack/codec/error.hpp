// idpack/codec/error.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/system/error.hpp"

namespace idpack {
namespace codec {

extern const ErrorConditionT error_converter_not_found;
extern const ErrorConditionT error_oversize;
extern const ErrorConditionT error_unknown_cookie;
extern const ErrorConditionT error_enum_value;
extern const ErrorConditionT error_short_input;
extern const ErrorConditionT error_limit_string;
extern const ErrorConditionT error_integer_range;
extern const ErrorConditionT error_value_type;

} //namespace codec
} //namespace idpack
