// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "assert.hpp"

#include <cstdlib>
#include <iostream>

namespace l1fee {

void abort_due_to_assertion_failure(const char* expr, const char* file, int line) {
    std::cerr << "Assertion " << expr << " failed at " << file << ":" << line << "\n";
    std::abort();
}

}  // namespace l1fee
