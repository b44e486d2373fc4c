// SPDX-License-Identifier: MIT
// Blockforge - Utility Functions
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "blockforge/primitives.hpp"

namespace blockforge
{

/// Convert hexadecimal string to byte vector
/// @param hex Hexadecimal string (e.g., "deadbeef")
/// @return Vector of bytes
/// @throws std::invalid_argument on odd length or non-hex characters
std::vector<uint8_t> hex_to_bytes (std::string_view hex);

/// Convert byte array to hexadecimal string
/// @param data Pointer to byte data
/// @param len Number of bytes
/// @return Lowercase hexadecimal string
std::string bytes_to_hex (const uint8_t *data, size_t len);

template <typename Container>
std::string
to_hex (const Container &bytes)
{
  return bytes_to_hex (bytes.data (), bytes.size ());
}

/// Reverse byte order in hexadecimal string (swap endianness)
/// @param hex Hexadecimal string
/// @return Reversed hex string (e.g., "aabbccdd" -> "ddccbbaa")
std::string reverse_hex (std::string_view hex);

/// Parse a 64-digit hash in display order (as block explorers print it)
/// into internal byte order
Hash256 hash_from_hex (std::string_view display_hex);

/// Inverse of hash_from_hex
std::string hash_to_hex (const Hash256 &hash);

/// Double SHA256 hash (SHA256d)
/// @param data Input data
/// @param len Input length in bytes
/// @param hash Output 32-byte hash
void sha256d (const uint8_t *data, size_t len, uint8_t *hash);

Hash256 sha256d (const Bytes &data);

/// RIPEMD160(SHA256(data)), used for addresses and pay-to-hash scripts
Hash160 hash160 (const Bytes &data);

/// Encode bytes with the Bitcoin Base58 alphabet (leading zeros -> '1')
std::string base58_encode (const Bytes &data);

/// Decode a Base58 string
/// @return false on characters outside the alphabet
bool base58_decode (std::string_view text, Bytes &out);

/// Base58Check: version byte + payload + 4-byte SHA256d checksum
std::string base58check_encode (uint8_t version, const Bytes &payload);

/// @return false on bad alphabet, short input or checksum mismatch
bool base58check_decode (std::string_view text, uint8_t &version,
                         Bytes &payload);

} // namespace blockforge
