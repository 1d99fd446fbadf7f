// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#if defined(L1FEE_CORE_USE_ABSEIL)

#include <absl/container/flat_hash_map.h>

#else

#include <unordered_map>

#endif

namespace l1fee {

/*
Alias template to fast hash maps, such as Abseil "Swiss tables"

FlatHashMap – a hash map that might not have pointer stability.

See https://abseil.io/docs/cpp/guides/container#hash-tables
and https://abseil.io/docs/cpp/guides/container#fn:pointer-stability
*/

#if defined(L1FEE_CORE_USE_ABSEIL)

template <class K, class V>
using FlatHashMap = absl::flat_hash_map<K, V>;

#else

// Abseil is not compatible with Wasm due to its multi-threading features
template <class K, class V>
using FlatHashMap = std::unordered_map<K, V>;

#endif

}  // namespace l1fee
