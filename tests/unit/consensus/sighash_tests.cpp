// SPDX-License-Identifier: MIT
// Blockforge - Signature Hash Tests
// Copyright (c) 2024-2026 Blockforge Contributors

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "blockforge/script.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/sighash.hpp"
#include "blockforge/utils.hpp"
#include "util/test_support.hpp"

using namespace blockforge;
using blockforge::test::check;
using blockforge::test::key_from_scalar;

namespace
{

Transaction
funding (const Bytes &guard)
{
  Transaction tx;
  TxIn in;
  in.previous_output_index = constants::COINBASE_OUTPUT_INDEX;
  in.unlocking_script = Bytes (32, 0x11);
  tx.inputs.push_back (in);
  TxOut out;
  out.value = 5000;
  out.guard_script = guard;
  tx.outputs.push_back (out);
  tx.outputs.push_back (out);
  return tx;
}

Transaction
spend_both (const Transaction &prev)
{
  Transaction tx;
  for (uint32_t i = 0; i < 2; ++i)
    {
      TxIn in;
      in.previous_output_hash = transaction_hash (prev);
      in.previous_output_index = i;
      tx.inputs.push_back (in);
    }
  TxOut out;
  out.value = 9000;
  out.guard_script = { 0x51 };
  tx.outputs.push_back (out);
  return tx;
}

Bytes
sig_with_type (const SigningKey &key, const Hash256 &hash)
{
  Bytes sig = key.sign (hash);
  sig.push_back (0x01);
  return sig;
}

bool
TestHashInputs ()
{
  SigningKey key = key_from_scalar (5);
  Bytes guard = to_address_script (key.address ());
  Transaction tx = spend_both (funding (guard));

  Hash256 h0 = signature_hash_for_input (tx, 0, guard);
  Hash256 h1 = signature_hash_for_input (tx, 1, guard);
  bool ok = check (h0 != h1, "each input has its own hash");
  ok &= check (signature_hash_for_input (tx, 0, guard, 2) != h0,
               "hash type is committed");

  Transaction with_scripts = tx;
  with_scripts.inputs[0].unlocking_script = { 0x01, 0x02 };
  with_scripts.inputs[1].unlocking_script = { 0x03 };
  ok &= check (signature_hash_for_input (with_scripts, 0, guard) == h0,
               "existing unlocking scripts are blanked");

  Transaction changed = tx;
  changed.outputs[0].value += 1;
  ok &= check (signature_hash_for_input (changed, 0, guard) != h0,
               "outputs are committed");

  // Preimage is the substituted serialization plus u32 hash type
  Transaction view = tx;
  view.inputs[0].unlocking_script = guard;
  Bytes preimage = encode_transaction (view);
  preimage.insert (preimage.end (), { 0x01, 0x00, 0x00, 0x00 });
  ok &= check (sha256d (preimage) == h0, "legacy preimage layout");

  try
    {
      signature_hash_for_input (tx, 2, guard);
      std::cerr << "sighash accepted input index 2\n";
      ok = false;
    }
  catch (const std::out_of_range &)
    {
    }
  return ok;
}

bool
TestVerifyPubKeyHash ()
{
  SigningKey key = key_from_scalar (5);
  SigningKey other = key_from_scalar (6);
  Transaction prev = funding (to_address_script (key.address ()));
  Transaction tx = spend_both (prev);

  const Bytes &guard = prev.outputs[0].guard_script;
  Hash256 hash = signature_hash_for_input (tx, 0, guard);
  Bytes sig = sig_with_type (key, hash);

  tx.inputs[0].unlocking_script
      = to_signature_pubkey_script (sig, key.public_key ());
  bool ok = check (verify_input_signature (tx, 0, prev), "P2PKH verifies");
  ok &= check (!verify_input_signature (tx, 1, prev),
               "unsigned input does not verify");

  Bytes no_type (sig.begin (), sig.end () - 1);
  tx.inputs[0].unlocking_script
      = to_signature_pubkey_script (no_type, key.public_key ());
  ok &= check (!verify_input_signature (tx, 0, guard),
               "missing hash type byte");

  tx.inputs[0].unlocking_script
      = to_signature_pubkey_script (sig, other.public_key ());
  ok &= check (!verify_input_signature (tx, 0, guard),
               "public key must match the hash");

  tx.inputs[0].unlocking_script = to_signature_script (sig);
  ok &= check (!verify_input_signature (tx, 0, guard),
               "P2PKH needs two items");
  return ok;
}

bool
TestVerifyOtherGuards ()
{
  SigningKey k1 = key_from_scalar (5);
  SigningKey k2 = key_from_scalar (6);
  bool ok = true;

  Transaction prev = funding (to_pubkey_script (k1.public_key ()));
  Transaction tx = spend_both (prev);
  Hash256 hash = signature_hash_for_input (tx, 0, prev.outputs[0].guard_script);
  tx.inputs[0].unlocking_script = to_signature_script (sig_with_type (k1, hash));
  ok &= check (verify_input_signature (tx, 0, prev), "P2PK verifies");

  Bytes multisig = to_multisig_script (2, { k1.public_key (), k2.public_key () });
  prev = funding (multisig);
  tx = spend_both (prev);
  hash = signature_hash_for_input (tx, 0, multisig);
  Bytes s1 = sig_with_type (k1, hash);
  Bytes s2 = sig_with_type (k2, hash);

  tx.inputs[0].unlocking_script = to_multisig_signature_script ({ s1, s2 });
  ok &= check (verify_input_signature (tx, 0, prev), "2-of-2 verifies");
  tx.inputs[0].unlocking_script = to_multisig_signature_script ({ s2, s1 });
  ok &= check (!verify_input_signature (tx, 0, prev),
               "multisig signatures must follow key order");
  tx.inputs[0].unlocking_script = to_multisig_signature_script ({ s1 });
  ok &= check (!verify_input_signature (tx, 0, prev),
               "too few multisig signatures");

  Bytes p2sh = to_p2sh_script (Bytes (20, 0x42));
  ok &= check (!verify_input_signature (tx, 0, p2sh),
               "P2SH is not verified");
  return ok;
}

}

int
main ()
{
  try
    {
      bool ok = TestHashInputs ();
      ok &= TestVerifyPubKeyHash ();
      ok &= TestVerifyOtherGuards ();
      if (!ok)
        return EXIT_FAILURE;
    }
  catch (const std::exception &ex)
    {
      std::cerr << "sighash_tests exception: " << ex.what () << "\n";
      return EXIT_FAILURE;
    }
  return EXIT_SUCCESS;
}
