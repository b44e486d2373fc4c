// SPDX-License-Identifier: MIT
// Blockforge - Transaction Assembly Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/builder.hpp"
#include "blockforge/errors.hpp"
#include "blockforge/log.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/sighash.hpp"
#include "blockforge/utils.hpp"
#include <algorithm>
#include <string>
#include <utility>

namespace blockforge
{

OutputAssembler &
OutputAssembler::set_value (uint64_t value)
{
  value_ = value;
  return *this;
}

OutputAssembler &
OutputAssembler::set_script (const Bytes &script)
{
  script_ = script;
  template_.reset ();
  return *this;
}

OutputAssembler &
OutputAssembler::set_script (const ScriptTemplateBuilder &builder)
{
  template_ = builder;
  script_.reset ();
  return *this;
}

OutputAssembler &
OutputAssembler::script (
    const std::function<void (ScriptTemplateBuilder &)> &fn)
{
  ScriptTemplateBuilder builder;
  fn (builder);
  return set_script (builder);
}

TxOut
OutputAssembler::build () const
{
  if (!value_)
    throw BuildError (Errc::MissingValue, "output has no value");

  TxOut out;
  out.value = *value_;
  if (script_)
    out.guard_script = *script_;
  else if (template_)
    out.guard_script = template_->build ();
  else
    throw BuildError (Errc::MissingScript, "output has no script");
  return out;
}

InputAssembler::InputAssembler (RandomSource &random) : random_ (&random) {}

InputAssembler &
InputAssembler::coinbase ()
{
  return coinbase (random_->bytes (constants::COINBASE_DATA_SIZE));
}

InputAssembler &
InputAssembler::coinbase (const Bytes &data)
{
  mode_ = Mode::Coinbase;
  coinbase_data_ = data;
  return *this;
}

InputAssembler &
InputAssembler::prev_out (const Transaction &previous)
{
  mode_ = Mode::Spending;
  previous_ = &previous;
  return *this;
}

InputAssembler &
InputAssembler::prev_out_index (uint32_t index)
{
  index_ = index;
  return *this;
}

InputAssembler &
InputAssembler::set_sequence (uint32_t sequence)
{
  sequence_ = sequence;
  return *this;
}

InputAssembler &
InputAssembler::signature_key (const SigningKey &key)
{
  keys_.push_back (&key);
  return *this;
}

const TxOut &
InputAssembler::spent_output () const
{
  if (mode_ != Mode::Spending || previous_ == nullptr)
    throw BuildError (Errc::MissingPreviousOutput,
                      "input has no previous transaction");
  if (!index_)
    throw BuildError (Errc::MissingPreviousOutput,
                      "input has no previous output index");
  if (*index_ >= previous_->outputs.size ())
    throw BuildError (Errc::MissingPreviousOutput,
                      "output index " + std::to_string (*index_)
                          + " out of range, previous transaction has "
                          + std::to_string (previous_->outputs.size ())
                          + " outputs");
  return previous_->outputs[*index_];
}

TxIn
InputAssembler::build () const
{
  TxIn in;
  in.sequence = sequence_;

  if (mode_ == Mode::Coinbase)
    {
      in.previous_output_hash.fill (0);
      in.previous_output_index = constants::COINBASE_OUTPUT_INDEX;
      in.unlocking_script = coinbase_data_;
      return in;
    }

  spent_output ();
  in.previous_output_hash = transaction_hash (*previous_);
  in.previous_output_index = *index_;
  return in;
}

namespace
{
Bytes
sign_with (const SigningKey &key, const Hash256 &hash)
{
  Bytes sig = key.sign (hash);
  sig.push_back (static_cast<uint8_t> (constants::SIGHASH_ALL));
  return sig;
}

const SigningKey *
find_key (const std::vector<const SigningKey *> &keys, const Bytes &pubkey)
{
  for (const SigningKey *key : keys)
    {
      if (key->public_key () == pubkey)
        return key;
    }
  return nullptr;
}

// Unlocking script for the guard the input spends
Bytes
unlock (const InputAssembler &input, const Bytes &guard_script,
        const Hash256 &hash, size_t index)
{
  GuardScript guard;
  if (!parse_guard_script (guard_script, guard))
    throw BuildError (Errc::UnsupportedScriptKind,
                      "input " + std::to_string (index)
                          + " spends a non-standard script");

  const auto &keys = input.keys ();
  switch (guard.kind)
    {
    case ScriptKind::Address:
    case ScriptKind::Hash160:
      for (const SigningKey *key : keys)
        {
          Hash160 h = key->pubkey_hash ();
          if (std::equal (h.begin (), h.end (), guard.hash.begin (),
                          guard.hash.end ()))
            return to_signature_pubkey_script (sign_with (*key, hash),
                                               key->public_key ());
        }
      throw BuildError (Errc::MissingKey,
                        "input " + std::to_string (index)
                            + " has no key for the spent pubkey hash");
    case ScriptKind::PubKey:
      if (const SigningKey *key = find_key (keys, guard.keys.at (0)))
        return to_signature_script (sign_with (*key, hash));
      throw BuildError (Errc::MissingKey,
                        "input " + std::to_string (index)
                            + " has no key for the spent public key");
    case ScriptKind::Multisig:
      {
        std::vector<Bytes> sigs;
        for (const auto &pubkey : guard.keys)
          {
            if (sigs.size () == guard.required)
              break;
            if (const SigningKey *key = find_key (keys, pubkey))
              sigs.push_back (sign_with (*key, hash));
          }
        if (sigs.size () < guard.required)
          throw BuildError (Errc::MissingKey,
                            "input " + std::to_string (index) + " needs "
                                + std::to_string (guard.required)
                                + " multisig keys, has "
                                + std::to_string (sigs.size ()));
        return to_multisig_signature_script (sigs);
      }
    case ScriptKind::ScriptHash:
      break;
    }
  throw BuildError (Errc::UnsupportedScriptKind,
                    std::string ("cannot sign for ")
                        + script_kind_name (guard.kind) + " script");
}
}

TransactionAssembler::TransactionAssembler (RandomSource &random)
    : random_ (&random)
{
}

TransactionAssembler &
TransactionAssembler::set_version (uint32_t version)
{
  version_ = version;
  return *this;
}

TransactionAssembler &
TransactionAssembler::set_lock_time (uint32_t lock_time)
{
  lock_time_ = lock_time;
  return *this;
}

InputAssembler &
TransactionAssembler::add_input ()
{
  inputs_.emplace_back (*random_);
  return inputs_.back ();
}

OutputAssembler &
TransactionAssembler::add_output ()
{
  outputs_.emplace_back ();
  return outputs_.back ();
}

TransactionAssembler &
TransactionAssembler::input (const std::function<void (InputAssembler &)> &fn)
{
  fn (add_input ());
  return *this;
}

TransactionAssembler &
TransactionAssembler::output (
    const std::function<void (OutputAssembler &)> &fn)
{
  fn (add_output ());
  return *this;
}

Transaction
TransactionAssembler::build () const
{
  Transaction tx;
  tx.version = version_;
  tx.lock_time = lock_time_;

  tx.outputs.reserve (outputs_.size ());
  for (const auto &out : outputs_)
    tx.outputs.push_back (out.build ());
  tx.inputs.reserve (inputs_.size ());
  for (const auto &in : inputs_)
    tx.inputs.push_back (in.build ());

  // Legacy sighash blanks every other unlocking script, so inputs can be
  // signed in any order
  for (size_t i = 0; i < inputs_.size (); ++i)
    {
      const InputAssembler &input = inputs_[i];
      if (input.is_coinbase ())
        continue;

      if (input.keys ().empty ())
        throw BuildError (Errc::MissingKey,
                          "input " + std::to_string (i)
                              + " has no signing key");

      const Bytes &guard = input.spent_output ().guard_script;
      Hash256 hash = signature_hash_for_input (tx, i, guard);
      tx.inputs[i].unlocking_script = unlock (input, guard, hash, i);

      if (!verify_input_signature (tx, i, guard))
        throw SignatureVerificationError (
            i, "unlocking script does not satisfy the spent output");

      if (log_get_level () <= LogLevel::Debug)
        log_debug ("Signed input " + std::to_string (i) + " sighash "
                   + hash_to_hex (hash));
    }

  Transaction decoded = decode_transaction (encode_transaction (tx));
  if (decoded != tx)
    throw BuildError (Errc::EncodingMismatch,
                      "transaction changed across encode/decode");

  if (log_get_level () <= LogLevel::Debug)
    log_debug ("Assembled transaction "
               + hash_to_hex (transaction_hash (decoded)));
  return decoded;
}

Transaction
tx (const std::function<void (TransactionAssembler &)> &fn)
{
  TransactionAssembler assembler;
  fn (assembler);
  return assembler.build ();
}

Bytes
script (const std::function<void (ScriptTemplateBuilder &)> &fn)
{
  ScriptTemplateBuilder builder;
  fn (builder);
  return builder.build ();
}

} // namespace blockforge
