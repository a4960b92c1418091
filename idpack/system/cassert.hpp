// idpack/system/cassert.hpp
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
#include "idpack/system/log.hpp"

#ifdef IDPACK_HAS_ASSERT

#include <cassert>

#define idpack_assert(a) assert((a))
#define idpack_assert_log(a, l)                             \
    if (static_cast<bool>(a)) {                             \
    } else {                                                \
        idpack_log(l, Exception, "(" #a ") assert failed"); \
        assert((a));                                        \
    }

#else
#define idpack_assert(a)
#define idpack_assert_log(a, l)
#endif
