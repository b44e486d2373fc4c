// SPDX-License-Identifier: MIT
// Blockforge - Wire Format
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstdint>
#include <vector>

#include "blockforge/primitives.hpp"

namespace blockforge
{

/// Append a CompactSize length prefix (1, 3, 5 or 9 bytes)
void write_compact_size (Bytes &out, uint64_t value);

/// Serialize a transaction in the canonical wire format:
///   u32 version | CompactSize n_in | inputs | CompactSize n_out | outputs |
///   u32 lock_time
/// Each input is 32-byte prev hash | u32 index | var script | u32 sequence,
/// each output is u64 value | var script. Integers are little-endian.
Bytes encode_transaction (const Transaction &tx);

/// Parse a transaction; the whole buffer must be consumed
/// @throws std::runtime_error on truncated or trailing data
Transaction decode_transaction (const Bytes &data);

/// 80-byte header: version | prev hash | merkle root | time | bits | nonce
Bytes encode_header (const BlockHeader &header);

/// Header followed by CompactSize tx count and the encoded transactions
Bytes encode_block (const Block &block);

/// @throws std::runtime_error on truncated or trailing data
Block decode_block (const Bytes &data);

/// SHA256d of the encoded transaction (internal byte order)
Hash256 transaction_hash (const Transaction &tx);

/// SHA256d of the 80-byte header (internal byte order)
Hash256 block_hash (const BlockHeader &header);

} // namespace blockforge
