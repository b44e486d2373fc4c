// SPDX-License-Identifier: MIT
// Blockforge - Randomness Sources Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/random.hpp"
#include <climits>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <stdexcept>
#include <string>

namespace blockforge
{

std::vector<uint8_t>
RandomSource::bytes (size_t len)
{
  std::vector<uint8_t> out (len);
  if (len > 0)
    fill (out.data (), out.size ());
  return out;
}

void
SystemRandom::fill (uint8_t *out, size_t len)
{
  while (len > 0)
    {
      int chunk = len > INT_MAX ? INT_MAX : static_cast<int> (len);
      if (RAND_bytes (out, chunk) != 1)
        {
          char err[256];
          ERR_error_string_n (ERR_get_error (), err, sizeof (err));
          throw std::runtime_error (std::string ("RAND_bytes failed: ") + err);
        }
      out += chunk;
      len -= static_cast<size_t> (chunk);
    }
}

RandomSource &
default_random ()
{
  static SystemRandom source;
  return source;
}

} // namespace blockforge
