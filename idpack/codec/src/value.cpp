// idpack/codec/src/value.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/codec/value.hpp"
#include "idpack/codec/error.hpp"
#include "idpack/system/exception.hpp"
#include <iomanip>

namespace idpack {
namespace codec {

EnumValue enum_value(const TypeDescriptor& _type, const std::string& _name)
{
    const EnumMember* pmember = _type.findMember(_name);
    if (pmember == nullptr) {
        idpack_throw_error(error_enum_value, "'" << _name << "' is not a member of " << _type);
    }
    return EnumValue{_type, pmember->name, pmember->value};
}

EnumValue enum_value(const TypeDescriptor& _type, const int64_t _value)
{
    const EnumMember* pmember = _type.findMember(_value);
    if (pmember == nullptr) {
        idpack_throw_error(error_enum_value, _value << " is not a valid " << _type);
    }
    return EnumValue{_type, pmember->name, pmember->value};
}

std::ostream& operator<<(std::ostream& _ros, const EnumValue& _value)
{
    return _ros << _value.type << '.' << _value.name << '(' << _value.value << ')';
}

namespace {

struct PrintVisitor {
    std::ostream& ros_;

    void operator()(const std::monostate&) const
    {
        ros_ << "None";
    }
    void operator()(const int64_t _v) const
    {
        ros_ << _v;
    }
    void operator()(const double _v) const
    {
        ros_ << _v;
    }
    void operator()(const bool _v) const
    {
        ros_ << (_v ? "True" : "False");
    }
    void operator()(const EnumValue& _v) const
    {
        ros_ << _v;
    }
    void operator()(const std::string& _v) const
    {
        ros_ << '\'';
        for (const char c : _v) {
            const uchar uc = static_cast<uchar>(c);
            if (uc < 0x20 || uc >= 0x7f) {
                ros_ << "\\x" << std::hex << std::setw(2) << std::setfill('0') << static_cast<uint>(uc) << std::dec << std::setfill(' ');
            } else {
                ros_ << c;
            }
        }
        ros_ << '\'';
    }
};

} // namespace

std::ostream& operator<<(std::ostream& _ros, const Value& _value)
{
    std::visit(PrintVisitor{_ros}, _value.variant());
    return _ros;
}

} // namespace codec
} // namespace idpack
