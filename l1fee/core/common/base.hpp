// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

// The most common and basic macros, concepts, types, and constants.

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string_view>

#include <intx/intx.hpp>

namespace l1fee {

using namespace std::string_view_literals;

using BlockTime = uint64_t;

inline constexpr uint64_t kMega{1'000'000};      // = 10^6
inline constexpr uint64_t kGiga{1'000'000'000};  // = 10^9

}  // namespace l1fee
