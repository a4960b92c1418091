// idpack/codec/value.hpp
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
#include <future>
#include <ostream>
#include <string>
#include <unordered_map>
#include <variant>

namespace idpack {
namespace codec {

struct EnumValue {
    TypeDescriptor type;
    std::string    name;
    int64_t        value = 0;

    bool operator==(const EnumValue& _rother) const
    {
        return type == _rother.type && value == _rother.value && name == _rother.name;
    }
    bool operator!=(const EnumValue& _rother) const
    {
        return !(*this == _rother);
    }
};

//! Member of _type named _name, throws error_enum_value if missing
EnumValue enum_value(const TypeDescriptor& _type, const std::string& _name);
//! Member of _type with integer value _value, throws error_enum_value if missing
EnumValue enum_value(const TypeDescriptor& _type, const int64_t _value);

class Value {
public:
    using VariantT = std::variant<std::monostate, int64_t, double, std::string, bool, EnumValue>;

    Value() = default;

    Value(const bool _v)
        : var_(_v)
    {
    }
    Value(const int _v)
        : var_(static_cast<int64_t>(_v))
    {
    }
    Value(const long _v)
        : var_(static_cast<int64_t>(_v))
    {
    }
    Value(const long long _v)
        : var_(static_cast<int64_t>(_v))
    {
    }
    Value(const double _v)
        : var_(_v)
    {
    }
    Value(const char* _v)
        : var_(std::string(_v))
    {
    }
    Value(std::string _v)
        : var_(std::move(_v))
    {
    }
    Value(EnumValue _v)
        : var_(std::move(_v))
    {
    }

    bool isNone() const
    {
        return std::holds_alternative<std::monostate>(var_);
    }

    template <class T>
    const T* get() const
    {
        return std::get_if<T>(&var_);
    }

    const VariantT& variant() const
    {
        return var_;
    }

    bool operator==(const Value& _rother) const
    {
        return var_ == _rother.var_;
    }
    bool operator!=(const Value& _rother) const
    {
        return !(*this == _rother);
    }

private:
    VariantT var_;
};

std::ostream& operator<<(std::ostream& _ros, const EnumValue& _value);
std::ostream& operator<<(std::ostream& _ros, const Value& _value);

using ValueMapT = std::unordered_map<std::string, Value>;

//! Result that is either available now or produced by a std::future
template <class T>
class Deferred {
    T              value_;
    std::future<T> future_;

public:
    Deferred(T _value)
        : value_(std::move(_value))
    {
    }

    Deferred(std::future<T>&& _future)
        : future_(std::move(_future))
    {
    }

    bool isDeferred() const
    {
        return future_.valid();
    }

    //! Waits for the future if there is one; call only once
    T get()
    {
        if (future_.valid()) {
            return future_.get();
        }
        return std::move(value_);
    }
};

using FragmentT    = Deferred<std::string>;
using ValueResultT = Deferred<Value>;

} //namespace codec
} //namespace idpack
