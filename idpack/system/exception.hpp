// idpack/system/exception.hpp
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
#include "idpack/system/error.hpp"
#include "idpack/system/log.hpp"
#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace idpack {

class RuntimeError : public std::runtime_error {
    const ErrorConditionT err_;

public:
    template <typename F>
    RuntimeError(const F& _rf, const char* const _file, const int _line, const char* const _fnc)
        : std::runtime_error(_rf(_file, _line, _fnc))
        , err_(error_check)
    {
    }

    template <typename F>
    RuntimeError(const ErrorConditionT& _err, const F& _rf, const char* const _file, const int _line, const char* const _fnc)
        : std::runtime_error(_rf(_file, _line, _fnc, _err))
        , err_(_err)
    {
    }

    const ErrorConditionT& error() const noexcept
    {
        return err_;
    }
};

#define idpack_throw(x)                                                         \
    throw idpack::RuntimeError(                                                 \
        [&](const char* const _file, const int _line, const char* const _fnc) { \
            std::ostringstream os;                                              \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " << x;   \
            return os.str();                                                    \
        },                                                                      \
        __FILE__, __LINE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)))

#define idpack_throw_log(l, x)                                                  \
    idpack_log(l, Exception, x);                                                \
    throw idpack::RuntimeError(                                                 \
        [&](const char* const _file, const int _line, const char* const _fnc) { \
            std::ostringstream os;                                              \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " << x;   \
            return os.str();                                                    \
        },                                                                      \
        __FILE__, __LINE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)))

#define idpack_throw_error1(c)                                                                                        \
    throw idpack::RuntimeError((c),                                                                                   \
        [&](const char* const _file, const int _line, const char* const _fnc, const idpack::ErrorConditionT& _err) { \
            std::ostringstream os;                                                                                    \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " #c ":" << _err.message();                     \
            return os.str();                                                                                          \
        },                                                                                                            \
        __FILE__, __LINE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)))

#define idpack_throw_error2(c, x)                                                                                     \
    throw idpack::RuntimeError((c),                                                                                   \
        [&](const char* const _file, const int _line, const char* const _fnc, const idpack::ErrorConditionT& _err) { \
            std::ostringstream os;                                                                                    \
            os << '[' << _file << '(' << _line << ")][" << _fnc << "] " << _err.message() << ": " << x;              \
            return os.str();                                                                                          \
        },                                                                                                            \
        __FILE__, __LINE__, static_cast<const char*>((IDPACK_FUNCTION_NAME)))

//adapted from https://github.com/Microsoft/GSL/blob/master/include/gsl/gsl_assert
#if defined(__clang__) || defined(__GNUC__)
#define idpack_likely(x) __builtin_expect(!!(x), 1)
#else
#define idpack_likely(x) (!!(x))
#endif

#define idpack_check_error(a, c) \
    (idpack_likely(a) ? static_cast<void>(0) : idpack_throw_error1(c))

#define idpack_check1(a) \
    (idpack_likely(a) ? static_cast<void>(0) : idpack_throw("(" #a ") check failed"))

#define idpack_check2(a, msg) \
    (idpack_likely(a) ? static_cast<void>(0) : idpack_throw("(" #a ") check failed: " << msg))

#define idpack_check_log2(a, l)                       \
    if (idpack_likely(a)) {                           \
    } else {                                          \
        idpack_throw_log(l, "(" #a ") check failed"); \
    }

#define idpack_check_log3(a, l, msg)                           \
    if (idpack_likely(a)) {                                    \
    } else {                                                   \
        idpack_throw_log(l, "(" #a ") check failed: " << msg); \
    }

#define idpack_throw_error(...) IDPACK_CALL_OVERLOAD(idpack_throw_error, __VA_ARGS__)
#define idpack_check(...) IDPACK_CALL_OVERLOAD(idpack_check, __VA_ARGS__)
#define idpack_check_log(...) IDPACK_CALL_OVERLOAD(idpack_check_log, __VA_ARGS__)

} //namespace idpack
