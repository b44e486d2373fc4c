// SPDX-License-Identifier: MIT
// Blockforge - Utility Functions Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/utils.hpp"
#include <algorithm>
#include <cstring>
#include <iomanip>
#include <openssl/ripemd.h>
#include <openssl/sha.h>
#include <sstream>
#include <stdexcept>

namespace blockforge
{

namespace
{
const char *const BASE58_ALPHABET
    = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int
hex_digit (char c)
{
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}
}

std::vector<uint8_t>
hex_to_bytes (std::string_view hex)
{
  if (hex.length () % 2 != 0)
    throw std::invalid_argument ("odd-length hex string");

  std::vector<uint8_t> bytes;
  bytes.reserve (hex.length () / 2);

  for (size_t i = 0; i + 1 < hex.length (); i += 2)
    {
      int hi = hex_digit (hex[i]);
      int lo = hex_digit (hex[i + 1]);
      if (hi < 0 || lo < 0)
        throw std::invalid_argument ("invalid hex character in \""
                                     + std::string (hex) + "\"");
      bytes.push_back (static_cast<uint8_t> ((hi << 4) | lo));
    }
  return bytes;
}

std::string
bytes_to_hex (const uint8_t *data, size_t len)
{
  std::ostringstream ss;
  ss << std::hex << std::setfill ('0');
  for (size_t i = 0; i < len; ++i)
    {
      ss << std::setw (2) << static_cast<int> (data[i]);
    }
  return ss.str ();
}

std::string
reverse_hex (std::string_view hex)
{
  std::string result;
  result.reserve (hex.length ());
  for (size_t i = hex.length (); i >= 2; i -= 2)
    {
      result.append (hex.substr (i - 2, 2));
    }
  return result;
}

Hash256
hash_from_hex (std::string_view display_hex)
{
  auto bytes = hex_to_bytes (display_hex);
  if (bytes.size () != 32)
    throw std::invalid_argument ("hash must be 32 bytes, got "
                                 + std::to_string (bytes.size ()));
  Hash256 hash;
  std::reverse_copy (bytes.begin (), bytes.end (), hash.begin ());
  return hash;
}

std::string
hash_to_hex (const Hash256 &hash)
{
  return reverse_hex (to_hex (hash));
}

void
sha256d (const uint8_t *data, size_t len, uint8_t *hash)
{
  uint8_t tmp[32];
  SHA256 (data, len, tmp);
  SHA256 (tmp, 32, hash);
}

Hash256
sha256d (const Bytes &data)
{
  Hash256 out;
  sha256d (data.data (), data.size (), out.data ());
  return out;
}

Hash160
hash160 (const Bytes &data)
{
  uint8_t sha[32];
  SHA256 (data.data (), data.size (), sha);
  Hash160 out;
  RIPEMD160 (sha, sizeof (sha), out.data ());
  return out;
}

std::string
base58_encode (const Bytes &data)
{
  size_t zeros = 0;
  while (zeros < data.size () && data[zeros] == 0)
    ++zeros;

  // log(256) / log(58) ~ 1.37
  std::vector<uint8_t> digits ((data.size () - zeros) * 138 / 100 + 1, 0);
  size_t used = 0;
  for (size_t i = zeros; i < data.size (); ++i)
    {
      int carry = data[i];
      size_t j = 0;
      for (auto it = digits.rbegin ();
           (carry != 0 || j < used) && it != digits.rend (); ++it, ++j)
        {
          carry += 256 * (*it);
          *it = static_cast<uint8_t> (carry % 58);
          carry /= 58;
        }
      used = j;
    }

  auto it = digits.begin ();
  while (it != digits.end () && *it == 0)
    ++it;

  std::string result (zeros, '1');
  for (; it != digits.end (); ++it)
    result.push_back (BASE58_ALPHABET[*it]);
  return result;
}

bool
base58_decode (std::string_view text, Bytes &out)
{
  size_t zeros = 0;
  while (zeros < text.size () && text[zeros] == '1')
    ++zeros;

  // log(58) / log(256) ~ 0.733
  std::vector<uint8_t> b256 ((text.size () - zeros) * 733 / 1000 + 1, 0);
  size_t used = 0;
  for (size_t i = zeros; i < text.size (); ++i)
    {
      const char *p = std::strchr (BASE58_ALPHABET, text[i]);
      if (!p || *p == '\0')
        return false;

      int carry = static_cast<int> (p - BASE58_ALPHABET);
      size_t j = 0;
      for (auto it = b256.rbegin ();
           (carry != 0 || j < used) && it != b256.rend (); ++it, ++j)
        {
          carry += 58 * (*it);
          *it = static_cast<uint8_t> (carry % 256);
          carry /= 256;
        }
      used = j;
    }

  auto it = b256.begin ();
  while (it != b256.end () && *it == 0)
    ++it;

  out.assign (zeros, 0x00);
  out.insert (out.end (), it, b256.end ());
  return true;
}

std::string
base58check_encode (uint8_t version, const Bytes &payload)
{
  Bytes data;
  data.reserve (payload.size () + 5);
  data.push_back (version);
  data.insert (data.end (), payload.begin (), payload.end ());
  auto check = sha256d (data);
  data.insert (data.end (), check.begin (), check.begin () + 4);
  return base58_encode (data);
}

bool
base58check_decode (std::string_view text, uint8_t &version, Bytes &payload)
{
  Bytes data;
  if (!base58_decode (text, data) || data.size () < 5)
    return false;

  Bytes body (data.begin (), data.end () - 4);
  auto check = sha256d (body);
  if (!std::equal (check.begin (), check.begin () + 4, data.end () - 4))
    return false;

  version = body[0];
  payload.assign (body.begin () + 1, body.end ());
  return true;
}

} // namespace blockforge
