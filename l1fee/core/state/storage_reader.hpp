// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <evmc/evmc.hpp>

namespace l1fee {

//! \brief Read access to contract storage of the current state
class StorageReader {
  public:
    StorageReader() = default;
    virtual ~StorageReader() = default;

    StorageReader(const StorageReader&) = delete;
    StorageReader& operator=(const StorageReader&) = delete;

    //! \brief Returns the storage word at location, zero if never written
    virtual evmc::bytes32 read_storage(const evmc::address& address,
                                       const evmc::bytes32& location) const noexcept = 0;
};

}  // namespace l1fee
