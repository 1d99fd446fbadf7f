// Copyright 2025 The Silkworm Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

/*
Facilities to deal with byte order/endianness
See https://en.wikipedia.org/wiki/Endianness
*/

#include <cstdint>

#include <intx/intx.hpp>

namespace l1fee::endian {

// NOLINTBEGIN(readability-identifier-naming)

// Similar to boost::endian::load_little_u32
const auto load_little_u32 = intx::le::unsafe::load<uint32_t>;

// NOLINTEND(readability-identifier-naming)

}  // namespace l1fee::endian
