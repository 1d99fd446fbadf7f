// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "data_gas.hpp"

#include <algorithm>

#include <l1fee/core/common/base.hpp>
#include <l1fee/core/common/overloaded.hpp>

#include "fastlz.hpp"
#include "param.hpp"

namespace l1fee::protocol {

DataByteCount count_data_bytes(ByteView data) noexcept {
    const auto zero_bytes{static_cast<uint64_t>(std::ranges::count(data, 0))};
    return {.zero = zero_bytes, .non_zero = data.size() - zero_bytes};
}

DataGasPolicy select_data_gas_policy(const UpgradeActivation& upgrades) noexcept {
    if (upgrades.is_eclipse) {
        return EclipseDataGas{};
    }
    if (upgrades.is_regolith) {
        return RegolithDataGas{};
    }
    return LegacyDataGas{};
}

std::string_view policy_name(const DataGasPolicy& policy) noexcept {
    return std::visit(
        Overloaded{
            [](const LegacyDataGas&) { return "legacy"sv; },
            [](const RegolithDataGas&) { return "regolith"sv; },
            [](const EclipseDataGas&) { return "eclipse"sv; },
        },
        policy);
}

uint64_t data_gas(ByteView data, const DataGasPolicy& policy) noexcept {
    return std::visit(
        Overloaded{
            [&](const LegacyDataGas&) {
                const DataByteCount count{count_data_bytes(data)};
                return count.zero * fee::kGTxDataZero +
                       (count.non_zero + fee::kL1LegacySignatureBytes) * fee::kGTxDataNonZeroIstanbul;
            },
            [&](const RegolithDataGas&) {
                const DataByteCount count{count_data_bytes(data)};
                return count.zero * fee::kGTxDataZero + count.non_zero * fee::kGTxDataNonZeroIstanbul;
            },
            [&](const EclipseDataGas&) {
                return uint64_t{flz_compress_len(data)} * fee::kGTxDataNonZeroIstanbul;
            },
        },
        policy);
}

}  // namespace l1fee::protocol
