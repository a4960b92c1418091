// idpack/system/common.hpp
//
// Copyright (c) 2022 idpack authors
//
// This file is part of idpack library.
//
// Distributed under the Boost Software License, Version 1.0.
// See accompanying file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt.
//

#pragma once

#include "idpack/idpack_config.hpp"
#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace idpack {

using uchar = unsigned char;
using uint  = unsigned int;

class NonCopyable {
protected:
    NonCopyable(const NonCopyable&)            = delete;
    NonCopyable(NonCopyable&&)                 = delete;
    NonCopyable& operator=(const NonCopyable&) = delete;
    NonCopyable& operator=(NonCopyable&&)      = delete;

    NonCopyable() = default;
};

} // namespace idpack

// Some macro helpers:

// adapted from: https://stackoverflow.com/questions/9183993/msvc-variadic-macro-expansion/9338429#9338429
#define IDPACK_GLUE(x, y) x y

#define IDPACK_RETURN_ARG_COUNT(_1_, _2_, _3_, _4_, _5_, count, ...) count
#define IDPACK_EXPAND_ARGS(args) IDPACK_RETURN_ARG_COUNT args
#define IDPACK_COUNT_ARGS_MAX5(...) IDPACK_EXPAND_ARGS((__VA_ARGS__, 5, 4, 3, 2, 1, 0))

#define IDPACK_OVERLOAD_MACRO2(name, count) name##count
#define IDPACK_OVERLOAD_MACRO1(name, count) IDPACK_OVERLOAD_MACRO2(name, count)
#define IDPACK_OVERLOAD_MACRO(name, count) IDPACK_OVERLOAD_MACRO1(name, count)

#define IDPACK_CALL_OVERLOAD(name, ...) IDPACK_GLUE(IDPACK_OVERLOAD_MACRO(name, IDPACK_COUNT_ARGS_MAX5(__VA_ARGS__)), (__VA_ARGS__))

#ifndef IDPACK_FUNCTION_NAME
#ifdef IDPACK_ON_WINDOWS
#define IDPACK_FUNCTION_NAME __func__
#else
#define IDPACK_FUNCTION_NAME __FUNCTION__
#endif
#endif
