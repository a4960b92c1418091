// idpack/codec/src/error.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include <sstream>

#include "idpack/codec/error.hpp"

namespace idpack {
namespace codec {

namespace {

enum {
    Error_Converter_Not_Found_E = 1,
    Error_Oversize_E,
    Error_Unknown_Cookie_E,
    Error_Enum_Value_E,
    Error_Short_Input_E,
    Error_Limit_String_E,
    Error_Integer_Range_E,
    Error_Value_Type_E,
};

class ErrorCategory : public ErrorCategoryT {
public:
    ErrorCategory() {}
    const char* name() const noexcept override
    {
        return "idpack::codec";
    }
    std::string message(int _ev) const override;
};

const ErrorCategory category;

std::string ErrorCategory::message(int _ev) const
{
    std::ostringstream oss;

    oss << "(" << name() << ":" << _ev << "): ";

    switch (_ev) {
    case 0:
        oss << "Success";
        break;
    case Error_Converter_Not_Found_E:
        oss << "Converter not found";
        break;
    case Error_Oversize_E:
        oss << "Serialized identifier too long";
        break;
    case Error_Unknown_Cookie_E:
        oss << "Unknown component cookie";
        break;
    case Error_Enum_Value_E:
        oss << "Value is not a member of the enum";
        break;
    case Error_Short_Input_E:
        oss << "Input too short";
        break;
    case Error_Limit_String_E:
        oss << "Limit string";
        break;
    case Error_Integer_Range_E:
        oss << "Integer out of range";
        break;
    case Error_Value_Type_E:
        oss << "Value type not supported by converter";
        break;
    default:
        oss << "Unknown";
        break;
    }
    return oss.str();
}

} // namespace

/*extern*/ const ErrorConditionT error_converter_not_found(Error_Converter_Not_Found_E, category);
/*extern*/ const ErrorConditionT error_oversize(Error_Oversize_E, category);
/*extern*/ const ErrorConditionT error_unknown_cookie(Error_Unknown_Cookie_E, category);
/*extern*/ const ErrorConditionT error_enum_value(Error_Enum_Value_E, category);
/*extern*/ const ErrorConditionT error_short_input(Error_Short_Input_E, category);
/*extern*/ const ErrorConditionT error_limit_string(Error_Limit_String_E, category);
/*extern*/ const ErrorConditionT error_integer_range(Error_Integer_Range_E, category);
/*extern*/ const ErrorConditionT error_value_type(Error_Value_Type_E, category);

} // namespace codec
} // namespace idpack
