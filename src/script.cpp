// SPDX-License-Identifier: MIT
// Blockforge - Standard Script Templates Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/script.hpp"
#include "blockforge/config.hpp"
#include "blockforge/errors.hpp"
#include "blockforge/utils.hpp"

namespace blockforge
{

using namespace opcodes;

namespace
{
struct KindEntry
{
  const char *name;
  Bytes (*generate) (const Recipient &);
};

void
check_pubkey (const Bytes &key)
{
  bool ok = (key.size () == 33 && (key[0] == 0x02 || key[0] == 0x03))
            || (key.size () == 65 && key[0] == 0x04);
  if (!ok)
    throw BuildError (Errc::InvalidRecipient,
                      "malformed public key of " + std::to_string (key.size ())
                          + " bytes");
}

void
check_hash160 (const Bytes &hash)
{
  if (hash.size () != 20)
    throw BuildError (Errc::InvalidRecipient,
                      "hash160 must be 20 bytes, got "
                          + std::to_string (hash.size ()));
}

Bytes
gen_pubkey (const Recipient &r)
{
  if (r.keys.size () != 1)
    throw BuildError (Errc::InvalidRecipient,
                      "pay-to-pubkey takes exactly one key");
  return to_pubkey_script (r.keys[0]);
}

Bytes
gen_address (const Recipient &r)
{
  return to_address_script (r.address);
}

Bytes
gen_hash160 (const Recipient &r)
{
  return to_hash160_script (r.hash);
}

Bytes
gen_multisig (const Recipient &r)
{
  return to_multisig_script (r.required, r.keys);
}

Bytes
gen_script_hash (const Recipient &r)
{
  return to_p2sh_script (r.hash);
}

// Indexed by ScriptKind
const KindEntry KINDS[] = {
  { "pubkey", gen_pubkey },     { "address", gen_address },
  { "hash160", gen_hash160 },   { "multisig", gen_multisig },
  { "p2sh", gen_script_hash },
};

constexpr size_t KIND_COUNT = sizeof (KINDS) / sizeof (KINDS[0]);

const KindEntry &
lookup (ScriptKind kind)
{
  auto idx = static_cast<size_t> (kind);
  if (idx >= KIND_COUNT)
    throw BuildError (Errc::UnsupportedScriptKind,
                      "no generator for script kind "
                          + std::to_string (idx));
  return KINDS[idx];
}

Bytes
p2pkh (const uint8_t *hash)
{
  // OP_DUP OP_HASH160 <20 bytes> OP_EQUALVERIFY OP_CHECKSIG
  Bytes script;
  script.reserve (25);
  script.push_back (OP_DUP);
  script.push_back (OP_HASH160);
  script.push_back (0x14); // Push 20 bytes
  script.insert (script.end (), hash, hash + 20);
  script.push_back (OP_EQUALVERIFY);
  script.push_back (OP_CHECKSIG);
  return script;
}

bool
is_small_int (uint8_t op)
{
  return op >= OP_1 && op <= OP_16;
}
}

const char *
script_kind_name (ScriptKind kind)
{
  return lookup (kind).name;
}

ScriptKind
parse_script_kind (std::string_view name)
{
  for (size_t i = 0; i < KIND_COUNT; ++i)
    {
      if (name == KINDS[i].name)
        return static_cast<ScriptKind> (i);
    }
  throw BuildError (Errc::UnsupportedScriptKind,
                    "unknown script kind \"" + std::string (name) + "\"");
}

Recipient
Recipient::pubkey (const Bytes &key)
{
  Recipient r;
  r.keys.push_back (key);
  return r;
}

Recipient
Recipient::address_of (const std::string &address)
{
  Recipient r;
  r.address = address;
  return r;
}

Recipient
Recipient::hash160 (const Bytes &hash)
{
  Recipient r;
  r.hash = hash;
  return r;
}

Recipient
Recipient::multisig (unsigned required, const std::vector<Bytes> &keys)
{
  Recipient r;
  r.required = required;
  r.keys = keys;
  return r;
}

Recipient
Recipient::script_hash (const Bytes &hash)
{
  return Recipient::hash160 (hash);
}

ScriptTemplateBuilder &
ScriptTemplateBuilder::type (ScriptKind kind)
{
  kind_ = kind;
  return *this;
}

ScriptTemplateBuilder &
ScriptTemplateBuilder::recipient (const Recipient &data)
{
  recipient_ = data;
  return *this;
}

Bytes
ScriptTemplateBuilder::build () const
{
  return build (kind_, recipient_);
}

Bytes
ScriptTemplateBuilder::build (ScriptKind kind, const Recipient &data)
{
  return lookup (kind).generate (data);
}

Bytes
to_pubkey_script (const Bytes &pubkey)
{
  check_pubkey (pubkey);
  Bytes script;
  push_data (script, pubkey);
  script.push_back (OP_CHECKSIG);
  return script;
}

Bytes
to_address_script (const std::string &address)
{
  uint8_t version = 0;
  Bytes payload;
  if (!base58check_decode (address, version, payload))
    throw BuildError (Errc::InvalidRecipient,
                      "invalid address \"" + address + "\"");
  if (payload.size () != 20)
    throw BuildError (Errc::InvalidRecipient,
                      "address payload must be 20 bytes");

  if (version == constants::SCRIPT_ADDRESS_VERSION)
    return to_p2sh_script (payload);
  return p2pkh (payload.data ());
}

Bytes
to_hash160_script (const Bytes &hash)
{
  check_hash160 (hash);
  return p2pkh (hash.data ());
}

Bytes
to_multisig_script (unsigned required, const std::vector<Bytes> &keys)
{
  if (keys.empty () || keys.size () > 16)
    throw BuildError (Errc::InvalidRecipient,
                      "multisig needs 1 to 16 keys, got "
                          + std::to_string (keys.size ()));
  if (required < 1 || required > keys.size ())
    throw BuildError (Errc::InvalidRecipient,
                      "multisig threshold " + std::to_string (required)
                          + " out of range");

  Bytes script;
  script.push_back (static_cast<uint8_t> (OP_1 + required - 1));
  for (const auto &key : keys)
    {
      check_pubkey (key);
      push_data (script, key);
    }
  script.push_back (static_cast<uint8_t> (OP_1 + keys.size () - 1));
  script.push_back (OP_CHECKMULTISIG);
  return script;
}

Bytes
to_p2sh_script (const Bytes &hash)
{
  check_hash160 (hash);
  Bytes script;
  script.reserve (23);
  script.push_back (OP_HASH160);
  push_data (script, hash);
  script.push_back (OP_EQUAL);
  return script;
}

void
push_data (Bytes &script, const Bytes &data)
{
  size_t n = data.size ();
  if (n < OP_PUSHDATA1)
    {
      script.push_back (static_cast<uint8_t> (n));
    }
  else if (n <= 0xff)
    {
      script.push_back (OP_PUSHDATA1);
      script.push_back (static_cast<uint8_t> (n));
    }
  else if (n <= 0xffff)
    {
      script.push_back (OP_PUSHDATA2);
      script.push_back (static_cast<uint8_t> (n & 0xff));
      script.push_back (static_cast<uint8_t> ((n >> 8) & 0xff));
    }
  else
    {
      script.push_back (OP_PUSHDATA4);
      for (int i = 0; i < 4; ++i)
        script.push_back (static_cast<uint8_t> ((n >> (i * 8)) & 0xff));
    }
  script.insert (script.end (), data.begin (), data.end ());
}

Bytes
to_signature_pubkey_script (const Bytes &sig, const Bytes &pubkey)
{
  Bytes script;
  push_data (script, sig);
  push_data (script, pubkey);
  return script;
}

Bytes
to_signature_script (const Bytes &sig)
{
  Bytes script;
  push_data (script, sig);
  return script;
}

Bytes
to_multisig_signature_script (const std::vector<Bytes> &sigs)
{
  // OP_0 absorbs the extra item OP_CHECKMULTISIG pops
  Bytes script{ OP_0 };
  for (const auto &sig : sigs)
    push_data (script, sig);
  return script;
}

bool
parse_pushes (const Bytes &script, std::vector<Bytes> &items)
{
  items.clear ();
  size_t i = 0;
  while (i < script.size ())
    {
      uint8_t op = script[i++];
      size_t len = 0;
      if (op < OP_PUSHDATA1)
        {
          len = op;
        }
      else if (op == OP_PUSHDATA1)
        {
          if (i + 1 > script.size ())
            return false;
          len = script[i];
          i += 1;
        }
      else if (op == OP_PUSHDATA2)
        {
          if (i + 2 > script.size ())
            return false;
          len = script[i] | (script[i + 1] << 8);
          i += 2;
        }
      else if (op == OP_PUSHDATA4)
        {
          if (i + 4 > script.size ())
            return false;
          len = static_cast<size_t> (script[i])
                | (static_cast<size_t> (script[i + 1]) << 8)
                | (static_cast<size_t> (script[i + 2]) << 16)
                | (static_cast<size_t> (script[i + 3]) << 24);
          i += 4;
        }
      else
        {
          return false;
        }

      if (len > script.size () - i)
        return false;
      items.emplace_back (script.begin () + i, script.begin () + i + len);
      i += len;
    }
  return true;
}

bool
parse_guard_script (const Bytes &script, GuardScript &out)
{
  out = GuardScript{};
  const size_t n = script.size ();

  if (n == 25 && script[0] == OP_DUP && script[1] == OP_HASH160
      && script[2] == 0x14 && script[23] == OP_EQUALVERIFY
      && script[24] == OP_CHECKSIG)
    {
      out.kind = ScriptKind::Address;
      out.hash.assign (script.begin () + 3, script.begin () + 23);
      return true;
    }

  if (n == 23 && script[0] == OP_HASH160 && script[1] == 0x14
      && script[22] == OP_EQUAL)
    {
      out.kind = ScriptKind::ScriptHash;
      out.hash.assign (script.begin () + 2, script.begin () + 22);
      return true;
    }

  if ((n == 35 && script[0] == 33) || (n == 67 && script[0] == 65))
    {
      if (script[n - 1] != OP_CHECKSIG)
        return false;
      out.kind = ScriptKind::PubKey;
      out.keys.emplace_back (script.begin () + 1, script.end () - 1);
      return true;
    }

  if (n >= 3 && script[n - 1] == OP_CHECKMULTISIG && is_small_int (script[0])
      && is_small_int (script[n - 2]))
    {
      std::vector<Bytes> keys;
      Bytes body (script.begin () + 1, script.end () - 2);
      if (!parse_pushes (body, keys))
        return false;
      unsigned required = script[0] - OP_1 + 1;
      unsigned total = script[n - 2] - OP_1 + 1;
      if (keys.size () != total || required > total)
        return false;
      out.kind = ScriptKind::Multisig;
      out.keys = std::move (keys);
      out.required = required;
      return true;
    }

  return false;
}

} // namespace blockforge
