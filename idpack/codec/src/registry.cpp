// idpack/codec/src/registry.cpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#include "idpack/codec/registry.hpp"
#include "idpack/codec/converters.hpp"
#include "idpack/codec/error.hpp"
#include "idpack/system/cassert.hpp"
#include "idpack/system/exception.hpp"

namespace idpack {
namespace codec {

namespace {
const LoggerT logger{"idpack::codec"};
} // namespace

const LoggerT& codec_logger()
{
    return logger;
}

ConverterRegistry::ConverterRegistry(const size_t _cache_capacity)
    : cache_(_cache_capacity)
{
}

void ConverterRegistry::registerConverter(const TypeDescriptor& _type, ConverterFactoryT&& _factory, const bool _supports_subclass)
{
    idpack_check(!_type.empty(), "cannot register a converter for an empty type");
    idpack_check(static_cast<bool>(_factory), "empty converter factory for " << _type);

    std::lock_guard<std::mutex> lock(mtx_);

    const auto it = index_map_.find(_type);
    if (it != index_map_.end()) {
        idpack_assert_log(it->second < stub_vec_.size(), logger);
        // keep the original position in the subclass scan order
        Stub& rstub              = stub_vec_[it->second];
        rstub.factory_           = std::move(_factory);
        rstub.supports_subclass_ = _supports_subclass;
        idpack_log(logger, Info, "replaced converter for " << _type << " supports_subclass = " << _supports_subclass);
    } else {
        index_map_[_type] = stub_vec_.size();
        stub_vec_.emplace_back(_type, std::move(_factory), _supports_subclass);
        idpack_log(logger, Info, "registered converter for " << _type << " supports_subclass = " << _supports_subclass);
    }
    cache_.clear();
}

ConverterPointerT ConverterRegistry::resolve(const TypeDescriptor& _type_hint) const
{
    Resolution resolution;
    {
        std::lock_guard<std::mutex> lock(mtx_);

        const Resolution* pcached = cache_.find(_type_hint);
        if (pcached != nullptr) {
            idpack_dbg(logger, Verbose, "cache hit for " << _type_hint);
            resolution = *pcached;
        } else {
            resolution = doResolve(_type_hint);
            cache_.insert(_type_hint, resolution);
        }
    }
    return resolution.factory_(*this, resolution.type_);
}

ConverterRegistry::Resolution ConverterRegistry::doResolve(const TypeDescriptor& _type_hint) const
{
    TypeDescriptor type = _type_hint;

    if (type.isUnion()) {
        type = type.arguments().front();
    }

    if (type.isGeneric()) {
        type = type.origin();
    }

    const auto it = index_map_.find(type);
    if (it != index_map_.end()) {
        idpack_log(logger, Verbose, "resolved " << _type_hint << " to exact converter for " << type);
        return Resolution{stub_vec_[it->second].factory_, type};
    }

    for (const auto& stub : stub_vec_) {
        if (stub.supports_subclass_ && type.isSubclassOf(stub.type_)) {
            idpack_log(logger, Verbose, "resolved " << _type_hint << " to converter for base " << stub.type_);
            return Resolution{stub.factory_, type};
        }
    }

    idpack_log(logger, Error, "no converter for type " << _type_hint);
    idpack_throw_error(error_converter_not_found, "Could not find converter for type `" << _type_hint << "`.");
}

bool ConverterRegistry::contains(const TypeDescriptor& _type) const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return index_map_.find(_type) != index_map_.end();
}

size_t ConverterRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return stub_vec_.size();
}

size_t ConverterRegistry::cacheSize() const
{
    std::lock_guard<std::mutex> lock(mtx_);
    return cache_.size();
}

size_t ConverterRegistry::cacheCapacity() const
{
    return cache_.capacity();
}

//-----------------------------------------------------------------------------

void register_builtin_converters(ConverterRegistry& _rregistry)
{
    _rregistry.registerConverter<FloatConverter>(type_float(), true);
    _rregistry.registerConverter<IntegerConverter>(type_int(), true);
    _rregistry.registerConverter<StringConverter>(type_str(), true);
    _rregistry.registerConverter<StringConverter>(type_literal());
    _rregistry.registerConverter<EnumConverter>(type_enum(), true);
    _rregistry.registerConverter<BoolConverter>(type_bool());
}

ConverterRegistry& default_registry()
{
    static ConverterRegistry registry;
    static std::once_flag    once;
    std::call_once(once, [] { register_builtin_converters(registry); });
    return registry;
}

} // namespace codec
} // namespace idpack
