// SPDX-License-Identifier: MIT
// Blockforge - Difficulty, Merkle Tree and Proof-of-Work Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/mining.hpp"
#include "blockforge/errors.hpp"
#include "blockforge/log.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include <algorithm>
#include <cstdio>
#include <ctime>
#include <stdexcept>
#include <utility>

namespace blockforge
{

bool
bits_to_target (uint32_t bits, Hash256 &target)
{
  target.fill (0);

  int exp = static_cast<int> ((bits >> 24) & 0xFF);
  uint32_t mant = bits & 0x007FFFFF;

  // Sign bit in compact format: negative targets are invalid
  if ((bits & 0x00800000) && mant != 0)
    return false;

  // Small exponents shift the mantissa right instead of left
  if (exp < 3)
    {
      mant >>= 8 * (3 - exp);
      exp = 3;
    }

  // Mantissa bytes, most significant first, land at 32 - exp onwards
  const uint8_t m[3] = { static_cast<uint8_t> ((mant >> 16) & 0xFF),
                         static_cast<uint8_t> ((mant >> 8) & 0xFF),
                         static_cast<uint8_t> (mant & 0xFF) };
  for (int k = 0; k < 3; ++k)
    {
      int idx = 32 - exp + k;
      if (idx < 0)
        {
          if (m[k] != 0)
            return false;
          continue;
        }
      if (idx < 32)
        target[idx] = m[k];
    }
  return true;
}

uint32_t
target_to_bits (const Hash256 &target)
{
  size_t first = 0;
  while (first < target.size () && target[first] == 0)
    ++first;
  if (first == target.size ())
    return 0;

  uint32_t size = static_cast<uint32_t> (target.size () - first);
  // Short targets stay left-aligned in the mantissa
  uint32_t mant = 0;
  for (size_t i = 0; i < 3; ++i)
    {
      mant <<= 8;
      if (first + i < target.size ())
        mant |= target[first + i];
    }

  // Keep the sign bit clear by moving one byte into the exponent
  if (mant & 0x00800000)
    {
      mant >>= 8;
      ++size;
    }
  return (size << 24) | (mant & 0x007FFFFF);
}

bool
hash_meets_target (const Hash256 &hash, const Hash256 &target)
{
  for (size_t i = 0; i < 32; ++i)
    {
      uint8_t h = hash[31 - i];
      if (h < target[i])
        return true;
      if (h > target[i])
        return false;
    }
  return false;
}

Hash256
compute_merkle_root (const std::vector<Hash256> &hashes)
{
  if (hashes.empty ())
    throw BuildError (Errc::EmptyBlock, "merkle root of zero transactions");

  std::vector<Hash256> level = hashes;

  // Build tree by pairwise hashing
  while (level.size () > 1)
    {
      // Duplicate last element if odd count
      if (level.size () % 2 != 0)
        {
          level.push_back (level.back ());
        }

      std::vector<Hash256> next_level;
      next_level.reserve (level.size () / 2);

      for (size_t i = 0; i < level.size (); i += 2)
        {
          uint8_t combined[64];
          std::copy (level[i].begin (), level[i].end (), combined);
          std::copy (level[i + 1].begin (), level[i + 1].end (),
                     combined + 32);

          Hash256 hash;
          sha256d (combined, sizeof (combined), hash.data ());
          next_level.push_back (hash);
        }

      level = std::move (next_level);
    }

  return level[0];
}

Hash256
compute_merkle_root (const std::vector<Transaction> &transactions)
{
  std::vector<Hash256> hashes;
  hashes.reserve (transactions.size ());
  for (const auto &tx : transactions)
    hashes.push_back (transaction_hash (tx));
  return compute_merkle_root (hashes);
}

DifficultyTarget::DifficultyTarget (const Hash256 &target) : target_ (target)
{
}

DifficultyTarget
DifficultyTarget::from_bytes (const Hash256 &target)
{
  if (std::all_of (target.begin (), target.end (),
                   [] (uint8_t b) { return b == 0; }))
    throw BuildError (Errc::InvalidTarget, "target must be greater than zero");
  return DifficultyTarget (target);
}

DifficultyTarget
DifficultyTarget::from_hex (std::string_view hex)
{
  Bytes raw;
  try
    {
      raw = hex_to_bytes (hex);
    }
  catch (const std::invalid_argument &e)
    {
      throw BuildError (Errc::InvalidTarget, e.what ());
    }
  if (raw.size () != 32)
    throw BuildError (Errc::InvalidTarget,
                      "target must be 32 bytes, got "
                          + std::to_string (raw.size ()));
  Hash256 target;
  std::copy (raw.begin (), raw.end (), target.begin ());
  return from_bytes (target);
}

DifficultyTarget
DifficultyTarget::from_bits (uint32_t bits)
{
  Hash256 target;
  if (!bits_to_target (bits, target))
    {
      char buf[16];
      std::snprintf (buf, sizeof (buf), "0x%08x", bits);
      throw BuildError (Errc::InvalidTarget,
                        std::string ("bad compact bits ") + buf);
    }
  return from_bytes (target);
}

uint32_t
DifficultyTarget::bits () const
{
  return target_to_bits (target_);
}

std::string
DifficultyTarget::to_hex () const
{
  return blockforge::to_hex (target_);
}

bool
DifficultyTarget::is_met_by (const Hash256 &hash) const
{
  return hash_meets_target (hash, target_);
}

uint32_t
system_clock_seconds ()
{
  return static_cast<uint32_t> (std::time (nullptr));
}

void
log_hash_rate (const HashRate &rate)
{
  char buf[64];
  std::snprintf (buf, sizeof (buf), "%.2f khash/s",
                 rate.hashes_per_second / 1000.0);
  log_info (buf);
}

ProofOfWork::ProofOfWork (const BlockHeader &header,
                          const DifficultyTarget &target)
    : header_ (header), target_ (target), clock_ (system_clock_seconds),
      observer_ (log_hash_rate),
      window_start_ (std::chrono::steady_clock::now ())
{
  header_.difficulty_bits = target_.bits ();
  header_.nonce = 0;
}

void
ProofOfWork::set_clock (Clock clock)
{
  clock_ = std::move (clock);
}

void
ProofOfWork::set_observer (RateObserver observer)
{
  observer_ = std::move (observer);
}

void
ProofOfWork::set_refresh_interval (uint64_t attempts)
{
  if (attempts == 0)
    throw std::invalid_argument ("refresh interval must be positive");
  refresh_interval_ = attempts;
}

void
advance_nonce (BlockHeader &header)
{
  if (header.nonce == 0xFFFFFFFF)
    {
      ++header.timestamp;
      header.nonce = 0;
    }
  else
    {
      ++header.nonce;
    }
}

ProofOfWork::State
ProofOfWork::step ()
{
  if (state_ == State::Found)
    return state_;

  Hash256 hash = block_hash (header_);
  ++attempts_;
  if (target_.is_met_by (hash))
    {
      hash_ = hash;
      state_ = State::Found;
      return state_;
    }

  advance_nonce (header_);

  if (++since_refresh_ >= refresh_interval_)
    refresh ();
  return state_;
}

const BlockHeader &
ProofOfWork::run ()
{
  while (step () == State::Searching)
    {
    }
  return header_;
}

void
ProofOfWork::refresh ()
{
  auto now = std::chrono::steady_clock::now ();
  double seconds = std::chrono::duration<double> (now - window_start_).count ();

  if (observer_)
    {
      HashRate rate{ since_refresh_, seconds,
                     seconds > 0 ? since_refresh_ / seconds : 0.0 };
      observer_ (rate);
    }

  uint32_t timestamp = clock_ ();
  if (timestamp > header_.timestamp)
    {
      header_.timestamp = timestamp;
      header_.nonce = 0;
    }

  since_refresh_ = 0;
  window_start_ = now;
}

} // namespace blockforge
