// SPDX-License-Identifier: MIT
// Blockforge - JSON Fixture Descriptions Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/fixture.hpp"
#include "blockforge/builder.hpp"
#include "blockforge/log.hpp"
#include "blockforge/script.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include <deque>
#include <fstream>
#include <limits>
#include <utility>

namespace blockforge
{

using nlohmann::json;

namespace
{
struct Context
{
  const FixtureOptions &options;
  RandomSource &random;
  std::map<std::string, SigningKey> &keys;
  std::deque<Transaction> transactions; // document order, stable addresses
};

Bytes
parse_hex (const json &value, const std::string &what)
{
  if (!value.is_string ())
    throw FixtureError (what + ": expected a hex string");
  try
    {
      return hex_to_bytes (value.get<std::string> ());
    }
  catch (const std::invalid_argument &e)
    {
      throw FixtureError (what + ": " + e.what ());
    }
}

// Non-negative integer that fits T; json's own get<T>() wraps silently
template <typename T>
T
parse_number (const json &value, const std::string &what)
{
  if (!value.is_number_unsigned ())
    throw FixtureError (what + ": expected a non-negative integer, got "
                        + value.dump ());
  uint64_t n = value.get<uint64_t> ();
  if (n > std::numeric_limits<T>::max ())
    throw FixtureError (what + ": " + std::to_string (n) + " out of range");
  return static_cast<T> (n);
}

template <typename T>
T
number_field (const json &desc, const char *name, T fallback)
{
  if (!desc.contains (name))
    return fallback;
  return parse_number<T> (desc.at (name), name);
}

const SigningKey *
find_key (const Context &ctx, const json &name)
{
  if (!name.is_string ())
    return nullptr;
  auto it = ctx.keys.find (name.get<std::string> ());
  return it == ctx.keys.end () ? nullptr : &it->second;
}

const SigningKey &
key_named (const Context &ctx, const json &name)
{
  const SigningKey *key = find_key (ctx, name);
  if (key == nullptr)
    throw FixtureError ("unknown key " + name.dump ());
  return *key;
}

void
load_keys (const json &doc, std::map<std::string, SigningKey> &keys)
{
  if (!doc.contains ("keys"))
    return;
  const json &entries = doc.at ("keys");
  if (!entries.is_object ())
    throw FixtureError ("\"keys\" must be an object");

  for (auto it = entries.begin (); it != entries.end (); ++it)
    {
      json secret = it.value ();
      bool compressed = true;
      if (secret.is_object ())
        {
          compressed = secret.value ("compressed", true);
          secret = secret.contains ("secret") ? secret.at ("secret") : json ();
        }

      if (secret.is_null ())
        {
          keys.emplace (it.key (), SigningKey::generate (compressed));
          continue;
        }

      Bytes raw = parse_hex (secret, "key \"" + it.key () + "\"");
      try
        {
          keys.emplace (it.key (), SigningKey::from_secret (raw, compressed));
        }
      catch (const std::invalid_argument &e)
        {
          throw FixtureError ("key \"" + it.key () + "\": " + e.what ());
        }
    }
}

std::vector<json>
recipient_items (const json &script)
{
  if (!script.contains ("recipient"))
    throw FixtureError ("script has no recipient");
  const json &r = script.at ("recipient");
  std::vector<json> items;
  if (r.is_array ())
    items.assign (r.begin (), r.end ());
  else
    items.push_back (r);
  if (items.empty ())
    throw FixtureError ("script recipient is empty");
  return items;
}

Bytes
pubkey_of (const Context &ctx, const json &item)
{
  if (const SigningKey *key = find_key (ctx, item))
    return key->public_key ();
  return parse_hex (item, "public key");
}

// Key names resolve to the value the script kind needs; anything else is
// taken literally
Recipient
recipient_for (ScriptKind kind, const json &script, const Context &ctx)
{
  std::vector<json> items = recipient_items (script);
  const json &first = items[0];

  switch (kind)
    {
    case ScriptKind::PubKey:
      return Recipient::pubkey (pubkey_of (ctx, first));
    case ScriptKind::Address:
      if (const SigningKey *key = find_key (ctx, first))
        return Recipient::address_of (key->address ());
      if (!first.is_string ())
        throw FixtureError ("address recipient must be a string");
      return Recipient::address_of (first.get<std::string> ());
    case ScriptKind::Hash160:
      if (const SigningKey *key = find_key (ctx, first))
        {
          Hash160 h = key->pubkey_hash ();
          return Recipient::hash160 (Bytes (h.begin (), h.end ()));
        }
      return Recipient::hash160 (parse_hex (first, "hash160 recipient"));
    case ScriptKind::Multisig:
      {
        std::vector<Bytes> pubkeys;
        for (const auto &item : items)
          pubkeys.push_back (pubkey_of (ctx, item));
        unsigned required = number_field<unsigned> (
            script, "required", static_cast<unsigned> (items.size ()));
        return Recipient::multisig (required, pubkeys);
      }
    case ScriptKind::ScriptHash:
      return Recipient::script_hash (parse_hex (first, "p2sh recipient"));
    }
  throw FixtureError ("unhandled script kind");
}

void
declare_output (OutputAssembler &out, const json &desc, const Context &ctx)
{
  if (!desc.is_object ())
    throw FixtureError ("output must be an object");
  if (desc.contains ("value"))
    out.set_value (parse_number<uint64_t> (desc.at ("value"), "value"));
  if (!desc.contains ("script"))
    return;

  const json &script = desc.at ("script");
  if (script.is_string ())
    {
      out.set_script (parse_hex (script, "raw script"));
      return;
    }
  ScriptKind kind = parse_script_kind (script.value ("type", "address"));
  out.set_script (ScriptTemplateBuilder ()
                      .type (kind)
                      .recipient (recipient_for (kind, script, ctx)));
}

void
declare_input (InputAssembler &in, const json &desc, const Context &ctx)
{
  if (!desc.is_object ())
    throw FixtureError ("input must be an object");

  if (desc.contains ("coinbase"))
    {
      const json &data = desc.at ("coinbase");
      if (data.is_boolean () && data.get<bool> ())
        in.coinbase ();
      else
        in.coinbase (parse_hex (data, "coinbase data"));
    }
  else if (desc.contains ("prev_tx"))
    {
      size_t n = parse_number<size_t> (desc.at ("prev_tx"), "prev_tx");
      if (n >= ctx.transactions.size ())
        throw FixtureError ("prev_tx " + std::to_string (n)
                            + " does not name an earlier transaction");
      in.prev_out (ctx.transactions[n]);
      in.prev_out_index (number_field<uint32_t> (desc, "prev_out_index", 0));
    }

  if (desc.contains ("key"))
    {
      const json &k = desc.at ("key");
      if (k.is_array ())
        {
          for (const auto &name : k)
            in.signature_key (key_named (ctx, name));
        }
      else
        {
          in.signature_key (key_named (ctx, k));
        }
    }

  if (desc.contains ("sequence"))
    in.set_sequence (
        parse_number<uint32_t> (desc.at ("sequence"), "sequence"));
}

const Transaction &
assemble_transaction (const json &desc, Context &ctx)
{
  if (!desc.is_object ())
    throw FixtureError ("transaction must be an object");

  TransactionAssembler assembler (ctx.random);
  assembler.set_version (
      number_field (desc, "version", constants::DEFAULT_TX_VERSION));
  assembler.set_lock_time (number_field<uint32_t> (desc, "lock_time", 0));

  for (const auto &in : desc.value ("inputs", json::array ()))
    declare_input (assembler.add_input (), in, ctx);
  for (const auto &out : desc.value ("outputs", json::array ()))
    declare_output (assembler.add_output (), out, ctx);

  ctx.transactions.push_back (assembler.build ());
  return ctx.transactions.back ();
}

DifficultyTarget
target_for (const json &desc)
{
  if (desc.contains ("target"))
    {
      const json &t = desc.at ("target");
      if (!t.is_string ())
        throw FixtureError ("target must be a hex string");
      return DifficultyTarget::from_hex (t.get<std::string> ());
    }
  if (desc.contains ("bits"))
    return DifficultyTarget::from_bits (
        parse_number<uint32_t> (desc.at ("bits"), "bits"));
  return default_target ();
}

Block
assemble_block (const json &desc, const std::vector<Block> &chain,
                Context &ctx)
{
  if (!desc.is_object ())
    throw FixtureError ("block must be an object");

  BlockAssembler assembler (ctx.random);
  assembler.set_version (
      number_field (desc, "version", constants::DEFAULT_BLOCK_VERSION));

  if (desc.contains ("prev_block"))
    {
      const json &prev = desc.at ("prev_block");
      if (!prev.is_string ())
        throw FixtureError ("prev_block must be a hex string");
      try
        {
          assembler.set_previous_block_hex (prev.get<std::string> ());
        }
      catch (const std::invalid_argument &e)
        {
          throw FixtureError (std::string ("prev_block: ") + e.what ());
        }
    }
  else if (!chain.empty ())
    {
      assembler.set_previous_block (block_hash (chain.back ().header));
    }
  else
    {
      assembler.set_previous_block (Hash256{});
    }

  if (desc.contains ("time"))
    {
      uint32_t time = parse_number<uint32_t> (desc.at ("time"), "time");
      assembler.set_timestamp (time);
      assembler.set_clock ([time] () { return time; });
    }
  assembler.set_observer (ctx.options.observer);
  assembler.set_refresh_interval (ctx.options.refresh_interval);

  for (const auto &tx : desc.value ("transactions", json::array ()))
    assembler.add_transaction (assemble_transaction (tx, ctx));

  return assembler.build (target_for (desc));
}
}

json
load_fixture_file (const std::string &path)
{
  std::ifstream in (path);
  if (!in)
    throw FixtureError ("cannot open fixture " + path);
  try
    {
      return json::parse (in);
    }
  catch (const json::parse_error &e)
    {
      throw FixtureError (path + ": " + e.what ());
    }
}

Fixture
assemble_fixture (const json &doc, const FixtureOptions &options)
{
  if (!doc.is_object ())
    throw FixtureError ("fixture must be a JSON object");
  if (!doc.contains ("blocks") || !doc.at ("blocks").is_array ())
    throw FixtureError ("fixture needs a \"blocks\" array");

  Fixture fixture;
  RandomSource &random
      = options.random != nullptr ? *options.random : default_random ();

  try
    {
      load_keys (doc, fixture.keys);
      Context ctx{ options, random, fixture.keys, {} };
      for (const auto &desc : doc.at ("blocks"))
        {
          fixture.blocks.push_back (assemble_block (desc, fixture.blocks, ctx));
          log_info ("Assembled block "
                    + std::to_string (fixture.blocks.size ()) + " "
                    + hash_to_hex (block_hash (fixture.blocks.back ().header)));
        }
    }
  catch (const json::exception &e)
    {
      throw FixtureError (e.what ());
    }
  return fixture;
}

void
to_json (json &j, const TxIn &in)
{
  j = json{ { "prev_hash", hash_to_hex (in.previous_output_hash) },
            { "prev_index", in.previous_output_index },
            { "sequence", in.sequence },
            { "script", to_hex (in.unlocking_script) } };
  if (in.is_coinbase ())
    j["coinbase"] = true;
}

void
to_json (json &j, const TxOut &out)
{
  j = json{ { "value", out.value }, { "script", to_hex (out.guard_script) } };
  GuardScript guard;
  if (parse_guard_script (out.guard_script, guard))
    j["type"] = script_kind_name (guard.kind);
}

void
to_json (json &j, const Transaction &tx)
{
  j = json{ { "hash", hash_to_hex (transaction_hash (tx)) },
            { "version", tx.version },
            { "lock_time", tx.lock_time },
            { "inputs", tx.inputs },
            { "outputs", tx.outputs },
            { "hex", to_hex (encode_transaction (tx)) } };
}

void
to_json (json &j, const Block &block)
{
  const BlockHeader &h = block.header;
  j = json{ { "hash", hash_to_hex (block_hash (h)) },
            { "version", h.version },
            { "prev_block", hash_to_hex (h.previous_block_hash) },
            { "merkle_root", hash_to_hex (h.merkle_root) },
            { "time", h.timestamp },
            { "bits", h.difficulty_bits },
            { "nonce", h.nonce },
            { "transactions", block.transactions },
            { "hex", to_hex (encode_block (block)) } };
}

json
fixture_to_json (const Fixture &fixture)
{
  json keys = json::object ();
  for (const auto &entry : fixture.keys)
    {
      const SigningKey &key = entry.second;
      keys[entry.first] = { { "secret", to_hex (key.secret ()) },
                            { "public_key", to_hex (key.public_key ()) },
                            { "address", key.address () } };
    }
  return json{ { "keys", keys }, { "blocks", fixture.blocks } };
}

} // namespace blockforge
