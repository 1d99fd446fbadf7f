// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

namespace l1fee {

// Interprets a storage word as a big-endian 256-bit unsigned integer.
intx::uint256 to_uint256(const evmc::bytes32& value) noexcept;

evmc::bytes32 to_bytes32(const intx::uint256& value) noexcept;

}  // namespace l1fee
