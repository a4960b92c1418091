// idpack/codec/src/codec.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/codec/codec.hpp"
#include "idpack/system/exception.hpp"
#include <algorithm>

namespace idpack {
namespace codec {

Schema::Schema(std::initializer_list<Field> _fields)
{
    for (const auto& field : _fields) {
        add(field.name, field.type);
    }
}

Schema& Schema::add(const std::string& _name, const TypeDescriptor& _type)
{
    idpack_check(!_type.empty(), "field " << _name << " without type");
    idpack_check(
        std::none_of(field_vec_.begin(), field_vec_.end(), [&_name](const Field& _rf) { return _rf.name == _name; }),
        "duplicate field " << _name);
    field_vec_.push_back(Field{_name, _type});
    return *this;
}

//-----------------------------------------------------------------------------

Codec::Codec(const ConverterRegistry& _rregistry, const Configuration& _rconfig)
    : rregistry_(_rregistry)
    , config_(_rconfig)
{
}

std::string Codec::serialize(const std::string& _cookie, const Schema& _rschema, const ValueMapT& _rvalues) const
{
    static const Value none;

    std::vector<FragmentT> fragment_vec;
    fragment_vec.reserve(_rschema.size() + 1);

    fragment_vec.emplace_back(rregistry_.resolve(type_str())->toStr(Value(_cookie)));

    // start every conversion before waiting on any of them
    for (const auto& field : _rschema) {
        const auto it = _rvalues.find(field.name);
        fragment_vec.emplace_back(rregistry_.resolve(field.type)->toStr(it != _rvalues.end() ? it->second : none));
    }

    std::string out;
    for (auto& fragment : fragment_vec) {
        out += fragment.get();
    }

    if (out.size() > config_.max_size) {
        idpack_log(codec_logger(), Error, "identifier for " << _cookie << " is " << out.size() << " characters long");
        idpack_throw_error(
            error_oversize,
            "The serialized identifier for component " << _cookie << " may be too long."
                                                       << " Try reducing the number of parameters the component takes."
                                                       << " Got length: " << out.size() << " Expected length: " << config_.max_size << " or less");
    }

    idpack_log(codec_logger(), Verbose, "serialized " << _rschema.size() << " fields for " << _cookie << " into " << out.size() << " characters");
    return out;
}

std::string Codec::loadCookie(const std::string& _raw, std::string& _rremainder) const
{
    Converter::LoadT loaded = rregistry_.resolve(type_str())->fromStr(_raw);
    const Value      cookie = loaded.second.get();
    const auto*      pcookie = cookie.get<std::string>();

    idpack_check(pcookie != nullptr, "cookie decoded to " << cookie);

    _rremainder = std::move(loaded.first);
    return *pcookie;
}

std::pair<ValueMapT, std::string> Codec::deserializeFields(const std::string& _txt, const Schema& _rschema) const
{
    ValueMapT   values;
    std::string remainder = _txt;

    for (const auto& field : _rschema) {
        Converter::LoadT loaded = rregistry_.resolve(field.type)->fromStr(remainder);

        idpack_check_log(!loaded.second.isDeferred(), codec_logger(), "asynchronous value for field " << field.name << " is not supported");

        values[field.name] = loaded.second.get();
        remainder          = std::move(loaded.first);
    }

    if (!remainder.empty()) {
        idpack_log(codec_logger(), Verbose, "ignoring " << remainder.size() << " trailing characters");
    }
    return std::make_pair(std::move(values), std::move(remainder));
}

} // namespace codec
} // namespace idpack
