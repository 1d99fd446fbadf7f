// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <functional>
#include <optional>

#include <l1fee/core/chain/config.hpp>
#include <l1fee/core/common/bytes.hpp>
#include <l1fee/core/protocol/l1_cost.hpp>
#include <l1fee/core/state/storage_reader.hpp>

namespace l1fee {

//! \brief Computes the L1 data fee and L1 gas used of a serialized transaction
//! \return std::nullopt if the chain charges no L1 data fee
using L1CostFunc = std::function<std::optional<protocol::L1Cost>(ByteView data)>;

//! \brief Reads the L1 fee oracle values from the storage of the L1Block predeploy
protocol::L1OracleParams read_l1_oracle_params(const StorageReader& state) noexcept;

//! \brief Returns the L1 cost function applying to all transactions of a block
//! \details Oracle values, upgrade activation and fee gate are resolved once here; the state is not
//! referenced by the returned function
L1CostFunc make_l1_cost_func(const ChainConfig& config, const StorageReader& state, BlockTime block_time);

}  // namespace l1fee
