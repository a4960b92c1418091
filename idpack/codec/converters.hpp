// idpack/codec/converters.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/codec/converter.hpp"

namespace idpack {
namespace codec {

//! One length character (0-255) followed by the raw characters
class StringConverter : public Converter {
public:
    static constexpr size_t max_length = 255;

    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override;
    LoadT     fromStr(const std::string& _rtxt) const override;
};

//! Minimal little-endian two's complement bytes, written through the str converter
/*!
 * Uses bit_length(|v|) / 8 + 1 bytes so the top bit of the last byte is
 * always the sign. When bound to an enum type (an int enum reached through
 * subclass fallback) it accepts and yields EnumValue.
 */
class IntegerConverter : public Converter {
public:
    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override;
    LoadT     fromStr(const std::string& _rtxt) const override;
};

//! 8 raw characters of the little-endian IEEE-754 double
class FloatConverter : public Converter {
public:
    static constexpr size_t width = sizeof(double);

    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override;
    LoadT     fromStr(const std::string& _rtxt) const override;
};

//! The member's integer value through the int converter
class EnumConverter : public Converter {
public:
    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override;
    LoadT     fromStr(const std::string& _rtxt) const override;
};

//! 't' or 'f'
class BoolConverter : public Converter {
public:
    using Converter::Converter;

    FragmentT toStr(const Value& _rvalue) const override;
    LoadT     fromStr(const std::string& _rtxt) const override;
};

} //namespace codec
} //namespace idpack
