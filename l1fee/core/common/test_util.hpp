// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <l1fee/core/chain/config.hpp>

namespace l1fee::test {

inline constexpr OptimismConfig kOptimismTestRollup{
    .eip1559_elasticity = 6,
    .eip1559_denominator = 50,
};

//! No rollup section: no L1 data fee.
inline constexpr ChainConfig kNoRollupConfig{
    .chain_id = 1,
};

//! Rollup without any upgrade.
inline constexpr ChainConfig kBedrockConfig{
    .chain_id = 901,
    .optimism = kOptimismTestRollup,
};

//! Enables Regolith at time 1, so blocks at time 0 still use the legacy rule.
inline constexpr ChainConfig kRegolithConfig{
    .chain_id = 901,
    .optimism = kOptimismTestRollup,
    .regolith_time = 1,
};

//! Enables Regolith from genesis and Eclipse at time 1000.
inline constexpr ChainConfig kEclipseConfig{
    .chain_id = 901,
    .optimism = kOptimismTestRollup,
    .regolith_time = 0,
    .eclipse_time = 1000,
};

}  // namespace l1fee::test
