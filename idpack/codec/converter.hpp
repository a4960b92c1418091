// idpack/codec/converter.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/codec/type.hpp"
#include "idpack/codec/value.hpp"
#include "idpack/system/common.hpp"
#include <functional>
#include <memory>
#include <string>
#include <utility>

namespace idpack {
namespace codec {

class ConverterRegistry;

//! Converts one value of a bound type to and from a string fragment
/*!
 * A converter is created by ConverterRegistry::resolve for a single use.
 * type() is the resolved type, which is the subclass and not the registered
 * base when the converter was found through subclass fallback.
 *
 * Fragments may only contain characters 0-255 (one byte per character) and
 * must describe their own length: fromStr consumes exactly the characters
 * toStr produced and hands back the rest.
 */
class Converter : NonCopyable {
    const ConverterRegistry& rregistry_;
    const TypeDescriptor     type_;

public:
    using LoadT = std::pair<std::string, ValueResultT>;

    Converter(const ConverterRegistry& _rregistry, const TypeDescriptor& _type)
        : rregistry_(_rregistry)
        , type_(_type)
    {
    }

    virtual ~Converter();

    const TypeDescriptor& type() const
    {
        return type_;
    }

    const ConverterRegistry& registry() const
    {
        return rregistry_;
    }

    virtual FragmentT toStr(const Value& _rvalue) const = 0;

    //! Returns (remainder, value)
    virtual LoadT fromStr(const std::string& _rtxt) const = 0;
};

using ConverterPointerT = std::unique_ptr<Converter>;
using ConverterFactoryT = std::function<ConverterPointerT(const ConverterRegistry&, const TypeDescriptor&)>;

template <class C>
ConverterFactoryT make_converter_factory()
{
    return [](const ConverterRegistry& _rregistry, const TypeDescriptor& _rtype) {
        return std::make_unique<C>(_rregistry, _rtype);
    };
}

} //namespace codec
} //namespace idpack
