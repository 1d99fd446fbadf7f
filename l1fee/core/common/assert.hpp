// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

namespace l1fee {
[[noreturn]] void abort_due_to_assertion_failure(const char* expr, const char* file, int line);
}

//! Checks a precondition that callers are required to uphold. Active in release builds too.
#define L1FEE_ASSERT(expr)    \
    if ((expr)) [[likely]]    \
        static_cast<void>(0); \
    else                      \
        ::l1fee::abort_due_to_assertion_failure(#expr, __FILE__, __LINE__)
