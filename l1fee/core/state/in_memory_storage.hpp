// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <l1fee/core/common/hash_maps.hpp>
#include <l1fee/core/state/storage_reader.hpp>

namespace l1fee {

//! InMemoryStorage holds contract storage entirely in memory.
class InMemoryStorage : public StorageReader {
  public:
    // address -> location -> value
    using Storage = FlatHashMap<evmc::address, FlatHashMap<evmc::bytes32, evmc::bytes32>>;

    evmc::bytes32 read_storage(const evmc::address& address,
                               const evmc::bytes32& location) const noexcept override;

    //! \remarks Writing a zero value erases the location
    void update_storage(const evmc::address& address, const evmc::bytes32& location, const evmc::bytes32& value);

    size_t number_of_slots() const noexcept;

  private:
    Storage storage_;
};

}  // namespace l1fee
