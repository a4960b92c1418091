// idpack/codec/binarybasic.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/system/common.hpp"
#include <cstring>

namespace idpack {
namespace codec {
namespace binary {

namespace impl {

union Convert64 {
    uint64_t value_;
    uint8_t  bytes_[sizeof(uint64_t)];
};

} // namespace impl

//! Little-endian store of the first _size bytes of _val
inline char* store(char* _pd, const uint64_t _val, const size_t _size = sizeof(uint64_t))
{
    uint8_t*        pd = reinterpret_cast<uint8_t*>(_pd);
    impl::Convert64 c;
    c.value_ = _val;
    for (size_t i = 0; i < _size; ++i) {
#ifdef IDPACK_ON_BIG_ENDIAN
        *(pd + i) = c.bytes_[sizeof(uint64_t) - 1 - i];
#else
        *(pd + i) = c.bytes_[i];
#endif
    }
    return _pd + _size;
}

//! Little-endian load of _size bytes, the upper bytes of _val are cleared
inline const char* load(const char* _ps, uint64_t& _val, const size_t _size = sizeof(uint64_t))
{
    const uint8_t*  ps = reinterpret_cast<const uint8_t*>(_ps);
    impl::Convert64 c;
    c.value_ = 0;
    for (size_t i = 0; i < _size; ++i) {
#ifdef IDPACK_ON_BIG_ENDIAN
        c.bytes_[sizeof(uint64_t) - 1 - i] = *(ps + i);
#else
        c.bytes_[i] = *(ps + i);
#endif
    }
    _val = c.value_;
    return _ps + _size;
}

inline char* store(char* _pd, const double _val)
{
    static_assert(sizeof(double) == sizeof(uint64_t), "double must be 64 bit");
    uint64_t v;
    memcpy(&v, &_val, sizeof(v));
    return store(_pd, v);
}

inline const char* load(const char* _ps, double& _val)
{
    uint64_t v;
    const char* p = load(_ps, v);
    memcpy(&_val, &v, sizeof(v));
    return p;
}

//! Number of significant bits of _v, 0 for 0
inline size_t bit_length(uint64_t _v)
{
    size_t len = 0;
    while (_v != 0) {
        _v >>= 1;
        ++len;
    }
    return len;
}

} // namespace binary
} // namespace codec
} // namespace idpack
