// SPDX-License-Identifier: MIT
// Blockforge - secp256k1 Signing Keys
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <memory>
#include <string>

#include "blockforge/primitives.hpp"

typedef struct ec_key_st EC_KEY;

namespace blockforge
{

struct KeyDeleter
{
  void operator() (EC_KEY *key) const;
};

using KeyPtr = std::unique_ptr<EC_KEY, KeyDeleter>;

/// secp256k1 key pair backed by an OpenSSL EC_KEY
///
/// Move-only. Assemblers borrow keys by reference and never modify them.
class SigningKey
{
public:
  /// Fresh random key
  static SigningKey generate (bool compressed = true);

  /// Key from a 32-byte big-endian secret
  /// @throws std::invalid_argument if the secret is not in [1, n-1]
  static SigningKey from_secret (const Bytes &secret, bool compressed = true);

  SigningKey (SigningKey &&) noexcept = default;
  SigningKey &operator= (SigningKey &&) noexcept = default;

  /// 32-byte private scalar
  Bytes secret () const;

  /// 33-byte compressed or 65-byte uncompressed SEC encoding
  const Bytes &
  public_key () const
  {
    return pubkey_;
  }

  bool
  compressed () const
  {
    return pubkey_.size () == 33;
  }

  /// HASH160 of public_key()
  Hash160 pubkey_hash () const;

  /// Base58Check pay-to-pubkey-hash address of public_key()
  std::string address () const;

  /// ECDSA signature over a 32-byte digest, DER encoded, low-S
  /// @throws std::runtime_error if OpenSSL fails to sign
  Bytes sign (const Hash256 &hash) const;

private:
  SigningKey (KeyPtr key, bool compressed);

  KeyPtr key_;
  Bytes pubkey_;
};

/// Check a DER signature over a 32-byte digest against a SEC public key.
/// Malformed keys or signatures verify as false.
bool verify_signature (const Bytes &pubkey, const Bytes &der,
                       const Hash256 &hash);

} // namespace blockforge
