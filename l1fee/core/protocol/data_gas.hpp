// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <string_view>
#include <variant>

#include <l1fee/core/common/bytes.hpp>

namespace l1fee::protocol {

struct DataByteCount {
    uint64_t zero{0};
    uint64_t non_zero{0};

    friend bool operator==(const DataByteCount&, const DataByteCount&) = default;
};

// Counts zero and non-zero bytes of the payload in a single pass
DataByteCount count_data_bytes(ByteView data) noexcept;

//! \brief Rollup upgrades affecting the L1 data gas, as active at some block time
struct UpgradeActivation {
    bool is_regolith{false};
    bool is_eclipse{false};

    friend bool operator==(const UpgradeActivation&, const UpgradeActivation&) = default;
};

//! \brief Pre-Regolith rule: zero/non-zero byte pricing plus a fixed signature allowance
struct LegacyDataGas {
    friend bool operator==(const LegacyDataGas&, const LegacyDataGas&) = default;
};

//! \brief Regolith rule: zero/non-zero byte pricing
struct RegolithDataGas {
    friend bool operator==(const RegolithDataGas&, const RegolithDataGas&) = default;
};

//! \brief Eclipse rule: estimated compressed length priced as non-zero bytes
struct EclipseDataGas {
    friend bool operator==(const EclipseDataGas&, const EclipseDataGas&) = default;
};

using DataGasPolicy = std::variant<LegacyDataGas, RegolithDataGas, EclipseDataGas>;

//! \brief Picks the L1 data gas rule for the given upgrade set
//! \remarks Eclipse replaces the Regolith rule, it does not stack on top of it
DataGasPolicy select_data_gas_policy(const UpgradeActivation& upgrades) noexcept;

std::string_view policy_name(const DataGasPolicy& policy) noexcept;

//! \brief Returns the L1 gas used by the payload bytes, before the oracle overhead is added
uint64_t data_gas(ByteView data, const DataGasPolicy& policy) noexcept;

}  // namespace l1fee::protocol
