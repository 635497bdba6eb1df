#pragma once

#include "assert/assert.hpp"

#define OGEAR_CHECK(expr, ...) \
    ASSERT_INVOKE(expr, false, true, "OGEAR_CHECK", verification, , __VA_ARGS__)

namespace ogear {
using check_failure = libassert::verification_failure;
}
