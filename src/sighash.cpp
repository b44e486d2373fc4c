// SPDX-License-Identifier: MIT
// Blockforge - Signature Hashes and Input Verification Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/sighash.hpp"
#include "blockforge/key.hpp"
#include "blockforge/script.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace blockforge
{

namespace
{
// <DER signature><hash type byte>
bool
check_signature (const Bytes &sig, const Bytes &pubkey, const Hash256 &hash)
{
  if (sig.size () < 2 || sig.back () != constants::SIGHASH_ALL)
    return false;
  Bytes der (sig.begin (), sig.end () - 1);
  return verify_signature (pubkey, der, hash);
}

bool
check_multisig (const std::vector<Bytes> &items, const GuardScript &guard,
                const Hash256 &hash)
{
  if (items.empty () || !items[0].empty ())
    return false;
  if (items.size () - 1 != guard.required)
    return false;

  // Signatures must appear in the same order as their keys
  size_t key = 0;
  for (size_t s = 1; s < items.size (); ++s)
    {
      while (key < guard.keys.size ()
             && !check_signature (items[s], guard.keys[key], hash))
        ++key;
      if (key == guard.keys.size ())
        return false;
      ++key;
    }
  return true;
}
}

Hash256
signature_hash_for_input (const Transaction &tx, size_t input_index,
                          const Bytes &previous_output_script,
                          uint32_t hash_type)
{
  if (input_index >= tx.inputs.size ())
    throw std::out_of_range ("sighash input index "
                             + std::to_string (input_index)
                             + " out of range");

  Transaction view = tx;
  for (auto &in : view.inputs)
    in.unlocking_script.clear ();
  view.inputs[input_index].unlocking_script = previous_output_script;

  Bytes preimage = encode_transaction (view);
  for (int i = 0; i < 4; ++i)
    preimage.push_back (static_cast<uint8_t> ((hash_type >> (i * 8)) & 0xff));
  return sha256d (preimage);
}

bool
verify_input_signature (const Transaction &tx, size_t input_index,
                        const Bytes &previous_output_script)
{
  if (input_index >= tx.inputs.size ())
    return false;

  GuardScript guard;
  std::vector<Bytes> items;
  if (!parse_guard_script (previous_output_script, guard)
      || !parse_pushes (tx.inputs[input_index].unlocking_script, items))
    return false;

  const Hash256 hash
      = signature_hash_for_input (tx, input_index, previous_output_script);

  switch (guard.kind)
    {
    case ScriptKind::Address:
    case ScriptKind::Hash160:
      {
        if (items.size () != 2)
          return false;
        Hash160 h = hash160 (items[1]);
        if (!std::equal (h.begin (), h.end (), guard.hash.begin (),
                         guard.hash.end ()))
          return false;
        return check_signature (items[0], items[1], hash);
      }
    case ScriptKind::PubKey:
      return items.size () == 1
             && check_signature (items[0], guard.keys[0], hash);
    case ScriptKind::Multisig:
      return check_multisig (items, guard, hash);
    case ScriptKind::ScriptHash:
      return false;
    }
  return false;
}

bool
verify_input_signature (const Transaction &tx, size_t input_index,
                        const Transaction &previous_tx)
{
  if (input_index >= tx.inputs.size ())
    return false;
  uint32_t index = tx.inputs[input_index].previous_output_index;
  if (index >= previous_tx.outputs.size ())
    return false;
  return verify_input_signature (tx, input_index,
                                 previous_tx.outputs[index].guard_script);
}

} // namespace blockforge
