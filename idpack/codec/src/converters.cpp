// idpack/codec/src/converters.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/codec/converters.hpp"
#include "idpack/codec/binarybasic.hpp"
#include "idpack/codec/error.hpp"
#include "idpack/codec/registry.hpp"
#include "idpack/system/exception.hpp"
#include <algorithm>

namespace idpack {
namespace codec {

/*virtual*/ Converter::~Converter() {}

namespace {

constexpr size_t max_integer_size = sizeof(uint64_t) + 1;

[[noreturn]] void throw_value_type(const Converter& _rconverter, const Value& _rvalue)
{
    idpack_throw_error(error_value_type, "converter for " << _rconverter.type() << " cannot encode " << _rvalue);
}

//! Unwraps the string produced by the str converter's fromStr
std::string loaded_string(ValueResultT& _rresult, const TypeDescriptor& _rtype)
{
    const Value value = _rresult.get();
    const auto* ps    = value.get<std::string>();
    if (ps == nullptr) {
        idpack_throw_error(error_value_type, "expected a string while decoding " << _rtype << " got " << value);
    }
    return *ps;
}

} // namespace

//-----------------------------------------------------------------------------
//  StringConverter
//-----------------------------------------------------------------------------

FragmentT StringConverter::toStr(const Value& _rvalue) const
{
    const auto* ps = _rvalue.get<std::string>();
    if (ps == nullptr) {
        throw_value_type(*this, _rvalue);
    }
    if (ps->size() > max_length) {
        idpack_throw_error(error_limit_string, "string of " << ps->size() << " characters for " << type() << ", at most " << max_length << " allowed");
    }

    std::string fragment;
    fragment.reserve(ps->size() + 1);
    fragment += static_cast<char>(static_cast<uchar>(ps->size()));
    fragment += *ps;
    return FragmentT(std::move(fragment));
}

Converter::LoadT StringConverter::fromStr(const std::string& _rtxt) const
{
    if (_rtxt.empty()) {
        idpack_throw_error(error_short_input, "missing length of " << type());
    }
    const size_t length = static_cast<uchar>(_rtxt[0]);
    if (_rtxt.size() < length + 1) {
        idpack_throw_error(error_short_input, type() << " needs " << length << " characters, " << (_rtxt.size() - 1) << " left");
    }
    return LoadT(_rtxt.substr(length + 1), ValueResultT(Value(_rtxt.substr(1, length))));
}

//-----------------------------------------------------------------------------
//  IntegerConverter
//-----------------------------------------------------------------------------

FragmentT IntegerConverter::toStr(const Value& _rvalue) const
{
    int64_t v = 0;
    if (const auto* pv = _rvalue.get<int64_t>()) {
        v = *pv;
    } else if (const auto* pe = _rvalue.get<EnumValue>()) {
        v = pe->value;
    } else if (const auto* pb = _rvalue.get<bool>()) {
        v = *pb ? 1 : 0;
    } else {
        throw_value_type(*this, _rvalue);
    }

    const uint64_t u         = static_cast<uint64_t>(v);
    const uint64_t magnitude = v < 0 ? (~u + 1) : u;
    const size_t   size      = binary::bit_length(magnitude) / 8 + 1;
    char           buf[max_integer_size];

    binary::store(buf, u, std::min(size, sizeof(uint64_t)));
    if (size > sizeof(uint64_t)) {
        buf[sizeof(uint64_t)] = v < 0 ? static_cast<char>(0xff) : 0;
    }

    return registry().resolve(type_str())->toStr(Value(std::string(buf, size)));
}

Converter::LoadT IntegerConverter::fromStr(const std::string& _rtxt) const
{
    LoadT             loaded = registry().resolve(type_str())->fromStr(_rtxt);
    const std::string bytes  = loaded_string(loaded.second, type());
    const size_t      size   = bytes.size();

    if (size > max_integer_size) {
        idpack_throw_error(error_integer_range, size << " bytes do not fit a 64 bit integer");
    }

    uint64_t u = 0;
    binary::load(bytes.data(), u, std::min(size, sizeof(uint64_t)));

    if (size > sizeof(uint64_t)) {
        const uchar fill = (u >> 63) != 0 ? 0xff : 0;
        if (static_cast<uchar>(bytes[sizeof(uint64_t)]) != fill) {
            idpack_throw_error(error_integer_range, "integer wider than 64 bits");
        }
    } else if (size != 0 && size < sizeof(uint64_t) && (static_cast<uchar>(bytes[size - 1]) & 0x80) != 0) {
        u |= ~uint64_t(0) << (size * 8);
    }

    const int64_t v = static_cast<int64_t>(u);
    if (type().isEnum()) {
        return LoadT(std::move(loaded.first), ValueResultT(Value(enum_value(type(), v))));
    }
    return LoadT(std::move(loaded.first), ValueResultT(Value(v)));
}

//-----------------------------------------------------------------------------
//  FloatConverter
//-----------------------------------------------------------------------------

FragmentT FloatConverter::toStr(const Value& _rvalue) const
{
    double v = 0;
    if (const auto* pv = _rvalue.get<double>()) {
        v = *pv;
    } else if (const auto* pi = _rvalue.get<int64_t>()) {
        v = static_cast<double>(*pi);
    } else {
        throw_value_type(*this, _rvalue);
    }

    char buf[width];
    binary::store(buf, v);
    return FragmentT(std::string(buf, width));
}

Converter::LoadT FloatConverter::fromStr(const std::string& _rtxt) const
{
    if (_rtxt.size() < width) {
        idpack_throw_error(error_short_input, type() << " needs " << width << " characters, " << _rtxt.size() << " left");
    }
    double v = 0;
    binary::load(_rtxt.data(), v);
    return LoadT(_rtxt.substr(width), ValueResultT(Value(v)));
}

//-----------------------------------------------------------------------------
//  EnumConverter
//-----------------------------------------------------------------------------

FragmentT EnumConverter::toStr(const Value& _rvalue) const
{
    const auto* pe = _rvalue.get<EnumValue>();
    if (pe == nullptr) {
        throw_value_type(*this, _rvalue);
    }
    return registry().resolve(type_int())->toStr(Value(pe->value));
}

Converter::LoadT EnumConverter::fromStr(const std::string& _rtxt) const
{
    LoadT       loaded = registry().resolve(type_int())->fromStr(_rtxt);
    const Value value  = loaded.second.get();
    const auto* pv     = value.get<int64_t>();
    if (pv == nullptr) {
        idpack_throw_error(error_value_type, "expected an integer while decoding " << type() << " got " << value);
    }
    return LoadT(std::move(loaded.first), ValueResultT(Value(enum_value(type(), *pv))));
}

//-----------------------------------------------------------------------------
//  BoolConverter
//-----------------------------------------------------------------------------

FragmentT BoolConverter::toStr(const Value& _rvalue) const
{
    const auto* pb = _rvalue.get<bool>();
    if (pb == nullptr) {
        throw_value_type(*this, _rvalue);
    }
    return FragmentT(std::string(1, *pb ? 't' : 'f'));
}

Converter::LoadT BoolConverter::fromStr(const std::string& _rtxt) const
{
    if (_rtxt.empty()) {
        idpack_throw_error(error_short_input, "missing character of " << type());
    }
    return LoadT(_rtxt.substr(1), ValueResultT(Value(_rtxt[0] == 't')));
}

} // namespace codec
} // namespace idpack
