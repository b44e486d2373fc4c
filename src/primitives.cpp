// SPDX-License-Identifier: MIT
// Blockforge - Block and Transaction Records Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/primitives.hpp"
#include <algorithm>

namespace blockforge
{

bool
TxIn::is_coinbase () const
{
  return previous_output_index == constants::COINBASE_OUTPUT_INDEX
         && std::all_of (previous_output_hash.begin (),
                         previous_output_hash.end (),
                         [] (uint8_t b) { return b == 0; });
}

bool
Transaction::is_coinbase () const
{
  return inputs.size () == 1 && inputs.front ().is_coinbase ();
}

bool
operator== (const TxIn &a, const TxIn &b)
{
  return a.previous_output_hash == b.previous_output_hash
         && a.previous_output_index == b.previous_output_index
         && a.sequence == b.sequence
         && a.unlocking_script == b.unlocking_script;
}

bool
operator== (const TxOut &a, const TxOut &b)
{
  return a.value == b.value && a.guard_script == b.guard_script;
}

bool
operator== (const Transaction &a, const Transaction &b)
{
  return a.version == b.version && a.lock_time == b.lock_time
         && a.inputs == b.inputs && a.outputs == b.outputs;
}

bool
operator== (const BlockHeader &a, const BlockHeader &b)
{
  return a.version == b.version
         && a.previous_block_hash == b.previous_block_hash
         && a.merkle_root == b.merkle_root && a.timestamp == b.timestamp
         && a.difficulty_bits == b.difficulty_bits && a.nonce == b.nonce;
}

bool
operator== (const Block &a, const Block &b)
{
  return a.header == b.header && a.transactions == b.transactions;
}

} // namespace blockforge
