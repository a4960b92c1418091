// idpack/codec/codec.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/codec/error.hpp"
#include "idpack/codec/registry.hpp"
#include "idpack/codec/type.hpp"
#include "idpack/codec/value.hpp"
#include "idpack/system/exception.hpp"
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace idpack {
namespace codec {

struct Configuration {
    static constexpr size_t default_max_size = 100;

    //! Upper bound of the encoded identifier, cookie included
    size_t max_size;

    Configuration(const size_t _max_size = default_max_size)
        : max_size(_max_size)
    {
    }
};

struct Field {
    std::string    name;
    TypeDescriptor type;
};

//! Ordered field name to type hint list of one component kind
class Schema {
    using FieldVectorT = std::vector<Field>;

    FieldVectorT field_vec_;

public:
    using const_iterator = FieldVectorT::const_iterator;

    Schema() = default;

    Schema(std::initializer_list<Field> _fields);

    Schema& add(const std::string& _name, const TypeDescriptor& _type);

    const_iterator begin() const
    {
        return field_vec_.begin();
    }
    const_iterator end() const
    {
        return field_vec_.end();
    }
    size_t size() const
    {
        return field_vec_.size();
    }
    bool empty() const
    {
        return field_vec_.empty();
    }
    const Field& operator[](const size_t _idx) const
    {
        return field_vec_[_idx];
    }
};

template <class Kind>
using CookieMapT = std::unordered_map<std::string, std::pair<Kind, Schema>>;

//! Packs component state into a delimiter-free, length-bounded identifier
/*!
 * identifier = str(cookie) + conv(field_1) + ... + conv(field_n)
 *
 * Every converter knows the length of its own fragment, so decoding walks
 * the schema left to right, each converter returning the unconsumed rest.
 */
class Codec {
    const ConverterRegistry& rregistry_;
    const Configuration      config_;

public:
    explicit Codec(const ConverterRegistry& _rregistry = default_registry(), const Configuration& _rconfig = Configuration());

    const Configuration& configuration() const
    {
        return config_;
    }

    const ConverterRegistry& registry() const
    {
        return rregistry_;
    }

    //! Throws RuntimeError with error_oversize when the result exceeds max_size
    std::string serialize(const std::string& _cookie, const Schema& _rschema, const ValueMapT& _rvalues) const;

    //! Throws RuntimeError with error_unknown_cookie when the cookie is not in _rcookie_map
    template <class Kind>
    std::pair<Kind, ValueMapT> deserialize(const std::string& _raw, const CookieMapT<Kind>& _rcookie_map) const
    {
        std::string       remainder;
        const std::string cookie = loadCookie(_raw, remainder);

        const auto it = _rcookie_map.find(cookie);
        if (it == _rcookie_map.end()) {
            idpack_log(codec_logger(), Warning, "unknown cookie " << Value(cookie));
            idpack_throw_error(error_unknown_cookie, "Component with cookie " << cookie << " does not exist.");
        }
        return std::make_pair(it->second.first, deserializeFields(remainder, it->second.second).first);
    }

    //! Decodes the schema's fields from _txt, returns (values, unconsumed remainder)
    std::pair<ValueMapT, std::string> deserializeFields(const std::string& _txt, const Schema& _rschema) const;

private:
    std::string loadCookie(const std::string& _raw, std::string& _rremainder) const;
};

} //namespace codec
} //namespace idpack
