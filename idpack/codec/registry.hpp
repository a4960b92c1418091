// idpack/codec/registry.hpp
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
#include "idpack/codec/type.hpp"
#include "idpack/system/common.hpp"
#include "idpack/system/log.hpp"
#include "idpack/utility/lrucache.hpp"
#include <mutex>
#include <unordered_map>
#include <vector>

namespace idpack {
namespace codec {

const LoggerT& codec_logger();

//! Maps type descriptors to converter factories
/*!
 * resolve() reduces a union to its leftmost alternative, a generic to its
 * origin, then tries an exact match and, failing that, the first
 * registration (in registration order) that supports subclasses and is a
 * base of the reduced type.
 *
 * Results are memoized per raw type hint in a bounded LRU cache which is
 * dropped on every registration. The cache holds factories, each resolve()
 * still returns a new converter.
 *
 * All methods are serialized on an internal mutex.
 */
class ConverterRegistry : NonCopyable {
    struct Stub {
        Stub(const TypeDescriptor& _type, ConverterFactoryT&& _factory, const bool _supports_subclass)
            : type_(_type)
            , factory_(std::move(_factory))
            , supports_subclass_(_supports_subclass)
        {
        }

        TypeDescriptor    type_;
        ConverterFactoryT factory_;
        bool              supports_subclass_;
    };

    struct Resolution {
        ConverterFactoryT factory_;
        TypeDescriptor    type_;
    };

    using StubVectorT = std::vector<Stub>;
    using IndexMapT   = std::unordered_map<TypeDescriptor, size_t>;
    using CacheT      = LruCache<TypeDescriptor, Resolution>;

    mutable std::mutex mtx_;
    StubVectorT        stub_vec_;
    IndexMapT          index_map_;
    mutable CacheT     cache_;

public:
    static constexpr size_t default_cache_capacity = 128;

    explicit ConverterRegistry(const size_t _cache_capacity = default_cache_capacity);

    void registerConverter(const TypeDescriptor& _type, ConverterFactoryT&& _factory, const bool _supports_subclass = false);

    template <class C>
    void registerConverter(const TypeDescriptor& _type, const bool _supports_subclass = false)
    {
        registerConverter(_type, make_converter_factory<C>(), _supports_subclass);
    }

    //! Throws RuntimeError with error_converter_not_found
    ConverterPointerT resolve(const TypeDescriptor& _type_hint) const;

    bool   contains(const TypeDescriptor& _type) const;
    size_t size() const;
    size_t cacheSize() const;
    size_t cacheCapacity() const;

private:
    Resolution doResolve(const TypeDescriptor& _type_hint) const;
};

//! Registers the string, integer, float, literal, enum and boolean converters
void register_builtin_converters(ConverterRegistry& _rregistry);

//! Process-wide registry, created with the builtin converters on first use
ConverterRegistry& default_registry();

} //namespace codec
} //namespace idpack
