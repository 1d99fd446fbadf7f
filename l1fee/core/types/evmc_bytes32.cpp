// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "evmc_bytes32.hpp"

namespace l1fee {

intx::uint256 to_uint256(const evmc::bytes32& value) noexcept {
    return intx::be::load<intx::uint256>(value.bytes);
}

evmc::bytes32 to_bytes32(const intx::uint256& value) noexcept {
    return intx::be::store<evmc::bytes32>(value);
}

}  // namespace l1fee
