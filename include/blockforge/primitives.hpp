// SPDX-License-Identifier: MIT
// Blockforge - Block and Transaction Records
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "blockforge/config.hpp"

namespace blockforge
{

using Bytes = std::vector<uint8_t>;
using Hash256 = std::array<uint8_t, 32>; // internal (wire) byte order
using Hash160 = std::array<uint8_t, 20>;

/// Transaction input
struct TxIn
{
  Hash256 previous_output_hash{};                    // all zero for coinbase
  uint32_t previous_output_index = 0;                // 0xFFFFFFFF for coinbase
  uint32_t sequence = constants::SEQUENCE_FINAL;
  Bytes unlocking_script;

  bool is_coinbase () const;
};

/// Transaction output
struct TxOut
{
  uint64_t value = 0; // smallest unit
  Bytes guard_script;
};

struct Transaction
{
  uint32_t version = constants::DEFAULT_TX_VERSION;
  uint32_t lock_time = 0;
  std::vector<TxIn> inputs;
  std::vector<TxOut> outputs;

  bool is_coinbase () const;
};

/// Fixed-size header fields; these alone are hashed for proof-of-work
struct BlockHeader
{
  uint32_t version = constants::DEFAULT_BLOCK_VERSION;
  Hash256 previous_block_hash{};
  Hash256 merkle_root{};
  uint32_t timestamp = 0; // unix seconds
  uint32_t difficulty_bits = 0;
  uint32_t nonce = 0;
};

struct Block
{
  BlockHeader header;
  std::vector<Transaction> transactions;
};

bool operator== (const TxIn &a, const TxIn &b);
bool operator== (const TxOut &a, const TxOut &b);
bool operator== (const Transaction &a, const Transaction &b);
bool operator== (const BlockHeader &a, const BlockHeader &b);
bool operator== (const Block &a, const Block &b);

inline bool
operator!= (const Transaction &a, const Transaction &b)
{
  return !(a == b);
}

inline bool
operator!= (const Block &a, const Block &b)
{
  return !(a == b);
}

} // namespace blockforge
