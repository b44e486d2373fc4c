// SPDX-License-Identifier: MIT
// Blockforge - Wire Format Tests
// Copyright (c) 2024-2026 Blockforge Contributors

#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

#include "blockforge/mining.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include "util/test_support.hpp"

using namespace blockforge;
using blockforge::test::check;

namespace
{

// Coinbase transaction of the Bitcoin genesis block
const char *const GENESIS_COINBASE
    = "01000000010000000000000000000000000000000000000000000000000000000000"
      "000000ffffffff4d04ffff001d0104455468652054696d65732030332f4a616e2f32"
      "303039204368616e63656c6c6f72206f6e206272696e6b206f66207365636f6e6420"
      "6261696c6f757420666f722062616e6b73ffffffff0100f2052a0100000043410467"
      "8afdb0fe5548271967f1a67130b7105cd6a828e03909a67962e0ea1f61deb649f6bc"
      "3f4cef38c4f35504e51ec112de5c384df7ba0b8d578a4c702b6bf11d5fac00000000";

bool
TestCompactSize ()
{
  struct Case
  {
    uint64_t value;
    const char *hex;
  };
  const Case cases[] = {
    { 0, "00" },
    { 0xfc, "fc" },
    { 0xfd, "fdfd00" },
    { 0xffff, "fdffff" },
    { 0x10000, "fe00000100" },
    { 0x100000000ULL, "ff0000000001000000" },
  };

  bool ok = true;
  for (const auto &c : cases)
    {
      Bytes out;
      write_compact_size (out, c.value);
      if (to_hex (out) != c.hex)
        {
          std::cerr << "compact size " << c.value << ": expected " << c.hex
                    << ", got " << to_hex (out) << "\n";
          ok = false;
        }
    }
  return ok;
}

bool
TestGenesisCoinbase ()
{
  Bytes raw = hex_to_bytes (GENESIS_COINBASE);
  Transaction tx = decode_transaction (raw);

  bool ok = check (tx.version == 1 && tx.lock_time == 0, "version and lock");
  ok &= check (tx.is_coinbase () && tx.inputs.size () == 1, "coinbase input");
  ok &= check (tx.inputs[0].previous_output_index == 0xFFFFFFFF
                   && tx.inputs[0].unlocking_script.size () == 0x4d,
               "coinbase reference and payload");
  ok &= check (tx.outputs.size () == 1
                   && tx.outputs[0].value == 5000000000ULL
                   && tx.outputs[0].guard_script.size () == 0x43,
               "single 50 coin output");
  ok &= check (encode_transaction (tx) == raw, "re-encoding is identical");
  ok &= check (
      hash_to_hex (transaction_hash (tx))
          == "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b",
      "genesis coinbase id");
  return ok;
}

bool
TestGenesisBlock ()
{
  Block block;
  block.transactions.push_back (
      decode_transaction (hex_to_bytes (GENESIS_COINBASE)));
  block.header.version = 1;
  block.header.merkle_root = compute_merkle_root (block.transactions);
  block.header.timestamp = 1231006505;
  block.header.difficulty_bits = 0x1d00ffff;
  block.header.nonce = 2083236893;

  Bytes raw = encode_block (block);
  bool ok = check (raw.size () == 80 + 1 + 204, "header, count, transaction");
  ok &= check (
      hash_to_hex (block_hash (block.header))
          == "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f",
      "genesis block hash");

  Block decoded = decode_block (raw);
  ok &= check (decoded == block, "block decode restores every field");
  return ok;
}

bool
TestRejectsMalformed ()
{
  Bytes raw = hex_to_bytes (GENESIS_COINBASE);
  bool ok = true;

  Bytes truncated (raw.begin (), raw.end () - 1);
  try
    {
      decode_transaction (truncated);
      std::cerr << "truncated transaction decoded\n";
      ok = false;
    }
  catch (const std::runtime_error &)
    {
    }

  Bytes trailing = raw;
  trailing.push_back (0x00);
  try
    {
      decode_transaction (trailing);
      std::cerr << "transaction with trailing bytes decoded\n";
      ok = false;
    }
  catch (const std::runtime_error &)
    {
    }

  try
    {
      decode_block (Bytes (79, 0));
      std::cerr << "79-byte block decoded\n";
      ok = false;
    }
  catch (const std::runtime_error &)
    {
    }
  return ok;
}

bool
TestFieldOrder ()
{
  Transaction tx;
  tx.version = 2;
  tx.lock_time = 0x01020304;
  TxIn in;
  in.previous_output_hash.fill (0xaa);
  in.previous_output_index = 1;
  in.sequence = 0xfffffffe;
  in.unlocking_script = { 0x51 };
  tx.inputs.push_back (in);
  TxOut out;
  out.value = 100;
  out.guard_script = { 0x51 };
  tx.outputs.push_back (out);

  const std::string expected = "02000000"
                               "01"
                               + std::string (64, 'a')
                               + "01000000"
                                 "0151"
                                 "feffffff"
                                 "01"
                                 "6400000000000000"
                                 "0151"
                                 "04030201";
  bool ok = check (to_hex (encode_transaction (tx)) == expected,
                   "little-endian fields in wire order");
  ok &= check (decode_transaction (encode_transaction (tx)) == tx,
               "decode restores a spending transaction");
  return ok;
}

}

int
main ()
{
  try
    {
      bool ok = TestCompactSize ();
      ok &= TestGenesisCoinbase ();
      ok &= TestGenesisBlock ();
      ok &= TestRejectsMalformed ();
      ok &= TestFieldOrder ();
      if (!ok)
        return EXIT_FAILURE;
    }
  catch (const std::exception &ex)
    {
      std::cerr << "serialize_tests exception: " << ex.what () << "\n";
      return EXIT_FAILURE;
    }
  return EXIT_SUCCESS;
}
