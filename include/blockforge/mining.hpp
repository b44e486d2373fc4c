// SPDX-License-Identifier: MIT
// Blockforge - Difficulty, Merkle Tree and Proof-of-Work
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

#include "blockforge/config.hpp"
#include "blockforge/primitives.hpp"

namespace blockforge
{

/// Convert compact difficulty bits to a 256-bit target
///
/// Bitcoin's compact "bits" format encodes a 256-bit target as:
///   bits = 0xEEMMMMMM (E=exponent, M=mantissa)
///   target = mantissa * 256^(exponent-3)
///
/// The target uses big-endian byte order: target[0] is the most
/// significant byte.
///
/// @param bits Compact difficulty bits from block header
/// @param target Output 32-byte target
/// @return false if the sign bit is set or the value overflows 256 bits
bool bits_to_target (uint32_t bits, Hash256 &target);

/// Encode a big-endian 256-bit target as compact bits (0 for a zero target)
uint32_t target_to_bits (const Hash256 &target);

/// True when the hash, read as a little-endian 256-bit integer the way
/// Bitcoin compares block hashes, is strictly below the big-endian target
bool hash_meets_target (const Hash256 &hash, const Hash256 &target);

/// Compute merkle root from transaction hashes
///
/// Implements Bitcoin's merkle tree:
///   1. Pair and hash (SHA256d) until single root remains
///   2. Odd-length levels duplicate last element
///
/// @param hashes Transaction hashes in internal byte order, block order
/// @return Merkle root in internal byte order (NOT display order)
/// @throws BuildError (EmptyBlock) when hashes is empty
Hash256 compute_merkle_root (const std::vector<Hash256> &hashes);

Hash256 compute_merkle_root (const std::vector<Transaction> &transactions);

/// A 256-bit threshold a block hash must fall below (always > 0)
class DifficultyTarget
{
public:
  /// @throws BuildError (InvalidTarget) for a zero target
  static DifficultyTarget from_bytes (const Hash256 &target);

  /// 64 hex digits, most significant first
  static DifficultyTarget from_hex (std::string_view hex);

  /// @throws BuildError (InvalidTarget) for negative, overflowing or zero
  static DifficultyTarget from_bits (uint32_t bits);

  const Hash256 &
  bytes () const
  {
    return target_;
  }

  /// Compact encoding recorded in the block header
  uint32_t bits () const;

  std::string to_hex () const;

  bool is_met_by (const Hash256 &hash) const;

private:
  explicit DifficultyTarget (const Hash256 &target);

  Hash256 target_;
};

/// Progress signal emitted by the nonce search
struct HashRate
{
  uint64_t attempts;  // hashes since the previous observation
  double seconds;     // wall time spent on them
  double hashes_per_second;
};

using RateObserver = std::function<void (const HashRate &)>;

/// Source of header timestamps (unix seconds)
using Clock = std::function<uint32_t ()>;

/// Current system time in unix seconds
uint32_t system_clock_seconds ();

/// Default observer: logs "<rate> khash/s" at info level
void log_hash_rate (const HashRate &rate);

/// Next header to try: nonce + 1, or timestamp + 1 and nonce 0 on wrap
void advance_nonce (BlockHeader &header);

/// Nonce search over a block header
///
/// Starting from the header's timestamp and nonce 0, hashes the header and
/// increments the nonce until the hash is below the target. Every
/// refresh_interval failed attempts a HashRate is emitted and, when the
/// clock is ahead of the header, the timestamp moves to it and the nonce
/// restarts at 0. Otherwise the nonce keeps counting so no header is hashed
/// twice.
///
/// There is no attempt limit; an impossible target never returns.
class ProofOfWork
{
public:
  enum class State
  {
    Searching,
    Found
  };

  ProofOfWork (const BlockHeader &header, const DifficultyTarget &target);

  void set_clock (Clock clock);
  void set_observer (RateObserver observer);
  void set_refresh_interval (uint64_t attempts);

  /// Hash the current header once and advance
  State step ();

  /// Step until Found; returns the winning header
  const BlockHeader &run ();

  State
  state () const
  {
    return state_;
  }

  const BlockHeader &
  header () const
  {
    return header_;
  }

  /// Hash of the winning header (valid once Found)
  const Hash256 &
  hash () const
  {
    return hash_;
  }

  uint64_t
  attempts () const
  {
    return attempts_;
  }

private:
  void refresh ();

  BlockHeader header_;
  DifficultyTarget target_;
  Clock clock_;
  RateObserver observer_;
  uint64_t refresh_interval_ = constants::NONCE_REFRESH_INTERVAL;
  State state_ = State::Searching;
  Hash256 hash_{};
  uint64_t attempts_ = 0;
  uint64_t since_refresh_ = 0;
  std::chrono::steady_clock::time_point window_start_;
};

} // namespace blockforge
