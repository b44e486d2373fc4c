// SPDX-License-Identifier: MIT
// Blockforge - Randomness Sources
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace blockforge
{

/// Supplies random bytes to the assemblers (coinbase payloads)
class RandomSource
{
public:
  virtual ~RandomSource () = default;

  /// Fill out[0..len) with random bytes
  /// @throws std::runtime_error if the source fails
  virtual void fill (uint8_t *out, size_t len) = 0;

  std::vector<uint8_t> bytes (size_t len);
};

/// Cryptographically secure bytes from OpenSSL's RAND_bytes
class SystemRandom : public RandomSource
{
public:
  void fill (uint8_t *out, size_t len) override;
};

/// Process-wide SystemRandom used when no source is injected
RandomSource &default_random ();

} // namespace blockforge
