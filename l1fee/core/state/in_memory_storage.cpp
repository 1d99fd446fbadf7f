// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_storage.hpp"

namespace l1fee {

evmc::bytes32 InMemoryStorage::read_storage(const evmc::address& address,
                                            const evmc::bytes32& location) const noexcept {
    const auto it1{storage_.find(address)};
    if (it1 != storage_.end()) {
        const auto it2{it1->second.find(location)};
        if (it2 != it1->second.end()) {
            return it2->second;
        }
    }
    return {};
}

void InMemoryStorage::update_storage(const evmc::address& address, const evmc::bytes32& location,
                                     const evmc::bytes32& value) {
    if (value == evmc::bytes32{}) {
        const auto it{storage_.find(address)};
        if (it != storage_.end()) {
            it->second.erase(location);
            if (it->second.empty()) {
                storage_.erase(it);
            }
        }
        return;
    }
    storage_[address][location] = value;
}

size_t InMemoryStorage::number_of_slots() const noexcept {
    size_t count{0};
    for (const auto& [_, slots] : storage_) {
        count += slots.size();
    }
    return count;
}

}  // namespace l1fee
