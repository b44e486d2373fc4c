// SPDX-License-Identifier: MIT
// Blockforge - Standard Script Templates
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "blockforge/primitives.hpp"

namespace blockforge
{

namespace opcodes
{
constexpr uint8_t OP_0 = 0x00;
constexpr uint8_t OP_PUSHDATA1 = 0x4c;
constexpr uint8_t OP_PUSHDATA2 = 0x4d;
constexpr uint8_t OP_PUSHDATA4 = 0x4e;
constexpr uint8_t OP_1 = 0x51;
constexpr uint8_t OP_16 = 0x60;
constexpr uint8_t OP_DUP = 0x76;
constexpr uint8_t OP_EQUAL = 0x87;
constexpr uint8_t OP_EQUALVERIFY = 0x88;
constexpr uint8_t OP_HASH160 = 0xa9;
constexpr uint8_t OP_CHECKSIG = 0xac;
constexpr uint8_t OP_CHECKMULTISIG = 0xae;
}

/// Guard script templates the builder can generate
enum class ScriptKind
{
  PubKey,     // <pubkey> OP_CHECKSIG
  Address,    // pay-to-pubkey-hash from a Base58Check address
  Hash160,    // pay-to-pubkey-hash from a raw 20-byte hash
  Multisig,   // OP_m <pubkeys> OP_n OP_CHECKMULTISIG
  ScriptHash, // OP_HASH160 <hash> OP_EQUAL
};

/// Lower-case name ("pubkey", "address", "hash160", "multisig", "p2sh")
const char *script_kind_name (ScriptKind kind);

/// @throws BuildError (UnsupportedScriptKind) for unknown names
ScriptKind parse_script_kind (std::string_view name);

/// Kind-specific recipient data; only the fields the kind uses are read
struct Recipient
{
  std::vector<Bytes> keys; // PubKey: one key; Multisig: all keys
  Bytes hash;              // Hash160, ScriptHash: 20 bytes
  std::string address;     // Address
  unsigned required = 0;   // Multisig threshold

  static Recipient pubkey (const Bytes &key);
  static Recipient address_of (const std::string &address);
  static Recipient hash160 (const Bytes &hash);
  static Recipient multisig (unsigned required, const std::vector<Bytes> &keys);
  static Recipient script_hash (const Bytes &hash);
};

/// Turns a script kind and recipient data into guard-script bytes
///
///   auto script = ScriptTemplateBuilder ()
///                     .type (ScriptKind::Address)
///                     .recipient (Recipient::address_of (key.address ()))
///                     .build ();
class ScriptTemplateBuilder
{
public:
  /// Script kind (defaults to Address)
  ScriptTemplateBuilder &type (ScriptKind kind);

  ScriptTemplateBuilder &recipient (const Recipient &data);

  /// @throws BuildError (UnsupportedScriptKind, InvalidRecipient)
  Bytes build () const;

  /// Pure dispatch on kind; same errors as build()
  static Bytes build (ScriptKind kind, const Recipient &data);

private:
  ScriptKind kind_ = ScriptKind::Address;
  Recipient recipient_;
};

Bytes to_pubkey_script (const Bytes &pubkey);
Bytes to_address_script (const std::string &address);
Bytes to_hash160_script (const Bytes &hash);
Bytes to_multisig_script (unsigned required, const std::vector<Bytes> &keys);
Bytes to_p2sh_script (const Bytes &hash);

/// Append a minimal data push (direct, PUSHDATA1/2/4)
void push_data (Bytes &script, const Bytes &data);

/// Unlocking scripts for the standard guards
Bytes to_signature_pubkey_script (const Bytes &sig, const Bytes &pubkey);
Bytes to_signature_script (const Bytes &sig);
Bytes to_multisig_signature_script (const std::vector<Bytes> &sigs);

/// Split a push-only script into its pushed items
/// @return false on non-push opcodes or truncated pushes
bool parse_pushes (const Bytes &script, std::vector<Bytes> &items);

/// A guard script recognised as one of the standard templates
struct GuardScript
{
  ScriptKind kind = ScriptKind::Address; // Address covers any P2PKH
  std::vector<Bytes> keys;
  Bytes hash;
  unsigned required = 0;
};

/// Recognise P2PK, P2PKH, bare multisig and P2SH guards
/// @return false for anything else
bool parse_guard_script (const Bytes &script, GuardScript &out);

} // namespace blockforge
