// SPDX-License-Identifier: MIT
// Blockforge - Block Assembler Tests
// Copyright (c) 2024-2026 Blockforge Contributors

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "blockforge/builder.hpp"
#include "blockforge/log.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/sighash.hpp"
#include "blockforge/utils.hpp"
#include "util/test_support.hpp"

using namespace blockforge;
using blockforge::test::check;
using blockforge::test::expect_error;
using blockforge::test::key_from_scalar;
using blockforge::test::SeededRandom;

namespace
{

const uint32_t FIXED_TIME = 1700000000;

void
pay_coinbase (TransactionAssembler &t, const std::string &address)
{
  t.input ([] (InputAssembler &in) { in.coinbase (); });
  t.output ([&] (OutputAssembler &out) {
    out.set_value (5000000000ULL).script ([&] (ScriptTemplateBuilder &s) {
      s.type (ScriptKind::Address).recipient (Recipient::address_of (address));
    });
  });
}

bool
TestCoinbaseBlock ()
{
  SigningKey fresh = SigningKey::generate ();
  DifficultyTarget target = DifficultyTarget::from_hex (
      "00ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff");

  Block block = blk (target, [&] (BlockAssembler &b) {
    b.set_previous_block (Hash256{});
    b.set_timestamp (FIXED_TIME);
    b.set_clock ([] () { return FIXED_TIME; });
    b.tx ([&] (TransactionAssembler &t) {
      pay_coinbase (t, fresh.address ());
    });
  });

  Hash256 hash = block_hash (block.header);
  bool ok = check (target.is_met_by (hash), "block hash below target");
  ok &= check (block.transactions.size () == 1
                   && block.transactions[0].is_coinbase (),
               "one coinbase transaction");
  ok &= check (block.header.merkle_root
                   == transaction_hash (block.transactions[0]),
               "single-transaction merkle root is the transaction id");
  ok &= check (block.header.previous_block_hash == Hash256{},
               "zero previous block");
  ok &= check (block.header.version == 1, "default version");
  ok &= check (block.header.difficulty_bits == target.bits (),
               "compact bits recorded");
  ok &= check (block.header.timestamp == FIXED_TIME, "pinned timestamp");
  ok &= check (block.transactions[0].inputs[0].unlocking_script.size () == 32,
               "32-byte generated coinbase payload");
  ok &= check (decode_block (encode_block (block)) == block, "round trip");
  return ok;
}

bool
TestChainWithSpend ()
{
  SigningKey alice = key_from_scalar (1);
  SigningKey bob = key_from_scalar (2);
  SeededRandom random (0);

  BlockAssembler first (random);
  first.set_previous_block (Hash256{}).set_timestamp (FIXED_TIME);
  first.set_clock ([] () { return FIXED_TIME; });
  pay_coinbase (first.add_transaction (), alice.address ());
  Block genesis = first.build ();

  const Transaction &funding = genesis.transactions[0];
  TransactionAssembler spend_assembler (random);
  spend_assembler.input ([&] (InputAssembler &in) {
    in.prev_out (funding).prev_out_index (0).signature_key (alice);
  });
  spend_assembler.output ([&] (OutputAssembler &out) {
    out.set_value (100).set_script (to_address_script (bob.address ()));
  });
  Transaction spend = spend_assembler.build ();

  BlockAssembler second (random);
  second.set_version (2)
      .set_previous_block_hex (hash_to_hex (block_hash (genesis.header)))
      .set_timestamp (FIXED_TIME + 600);
  second.set_clock ([] () { return FIXED_TIME + 600; });
  pay_coinbase (second.add_transaction (), bob.address ());
  second.add_transaction (spend);
  Block next = second.build ();

  bool ok = check (next.header.previous_block_hash
                       == block_hash (genesis.header),
                   "display hex previous block is byte-reversed");
  ok &= check (next.header.version == 2, "block version");
  ok &= check (next.transactions.size () == 2
                   && next.transactions[1] == spend,
               "prebuilt transaction kept in order");
  ok &= check (next.header.merkle_root
                   == compute_merkle_root (next.transactions),
               "merkle root over both transactions");
  ok &= check (verify_input_signature (next.transactions[1], 0, funding),
               "spend inside the block verifies");
  ok &= check (default_target ().is_met_by (block_hash (next.header)),
               "default target met");
  return ok;
}

bool
TestBlockErrors ()
{
  bool ok = true;
  ok &= expect_error (
      Errc::MissingPreviousBlock,
      [] () {
        blk ([] (BlockAssembler &b) {
          b.tx ([] (TransactionAssembler &t) { pay_coinbase (t, ""); });
        });
      },
      "block without previous hash");
  ok &= expect_error (
      Errc::EmptyBlock,
      [] () {
        blk ([] (BlockAssembler &b) { b.set_previous_block (Hash256{}); });
      },
      "block without transactions");
  ok &= expect_error (
      Errc::MissingScript,
      [] () {
        blk ([] (BlockAssembler &b) {
          b.set_previous_block (Hash256{});
          b.tx ([] (TransactionAssembler &t) {
            t.input ([] (InputAssembler &in) { in.coinbase (); });
            t.output ([] (OutputAssembler &out) { out.set_value (1); });
          });
        });
      },
      "nested transaction error propagates");

  try
    {
      BlockAssembler ().set_previous_block_hex ("0011");
      std::cerr << "short previous block hex accepted\n";
      ok = false;
    }
  catch (const std::invalid_argument &)
    {
    }
  return ok;
}

bool
TestClockAndObserver ()
{
  SigningKey key = key_from_scalar (5);
  std::vector<HashRate> rates;

  BlockAssembler assembler;
  assembler.set_previous_block (Hash256{});
  assembler.set_clock ([] () { return 42u; });
  assembler.set_observer ([&rates] (const HashRate &r) { rates.push_back (r); });
  assembler.set_refresh_interval (1);
  pay_coinbase (assembler.add_transaction (), key.address ());
  Block block = assembler.build ();

  // A fixed clock never restarts the nonce, so each miss is one observation
  bool ok = check (block.header.timestamp == 42, "timestamp from the clock");
  ok &= check (rates.size () == block.header.nonce,
               "one observation per failed attempt");
  for (const auto &r : rates)
    ok &= check (r.attempts == 1, "observation covers one attempt");
  return ok;
}

}

int
main ()
{
  log_set_level (LogLevel::Warn);
  try
    {
      bool ok = TestCoinbaseBlock ();
      ok &= TestChainWithSpend ();
      ok &= TestBlockErrors ();
      ok &= TestClockAndObserver ();
      if (!ok)
        return EXIT_FAILURE;
    }
  catch (const std::exception &ex)
    {
      std::cerr << "block_assembler_tests exception: " << ex.what () << "\n";
      return EXIT_FAILURE;
    }
  return EXIT_SUCCESS;
}
