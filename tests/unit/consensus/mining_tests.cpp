// SPDX-License-Identifier: MIT
// Blockforge - Difficulty, Merkle and Proof-of-Work Tests
// Copyright (c) 2024-2026 Blockforge Contributors

#include <algorithm>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "blockforge/mining.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include "util/test_support.hpp"

using namespace blockforge;
using blockforge::test::check;
using blockforge::test::expect_error;

namespace
{

Hash256
target_from_hex (const std::string &hex)
{
  Bytes raw = hex_to_bytes (hex);
  if (raw.size () != 32)
    throw std::runtime_error ("invalid target hex: " + hex);
  Hash256 out;
  std::copy (raw.begin (), raw.end (), out.begin ());
  return out;
}

bool
TestVector (uint32_t bits, const std::string &expected_hex)
{
  Hash256 target;
  if (!bits_to_target (bits, target) || target != target_from_hex (expected_hex))
    {
      std::cerr << "bits_to_target mismatch for bits=0x" << std::hex << bits
                << std::dec << "\n  expected=" << expected_hex
                << "\n  got=" << to_hex (target) << "\n";
      return false;
    }
  if (target_to_bits (target) != bits)
    {
      std::cerr << "target_to_bits round-trip mismatch for bits=0x"
                << std::hex << bits << " got=0x" << target_to_bits (target)
                << std::dec << "\n";
      return false;
    }
  return true;
}

bool
TestCompactBits ()
{
  bool ok = TestVector (
      0x1d00ffff,
      "00000000ffff0000000000000000000000000000000000000000000000000000");
  ok &= TestVector (
      0x1b0404cb,
      "00000000000404cb000000000000000000000000000000000000000000000000");
  ok &= TestVector (
      0x01120000,
      "0000000000000000000000000000000000000000000000000000000000000012");

  Hash256 target;
  ok &= check (!bits_to_target (0x1d800001, target), "negative bits rejected");
  ok &= check (!bits_to_target (0x2301ffff, target),
               "overflowing bits rejected");
  ok &= check (target_to_bits (Hash256{}) == 0, "zero target encodes as 0");
  return ok;
}

bool
TestDifficultyTarget ()
{
  DifficultyTarget def = DifficultyTarget::from_hex (constants::DEFAULT_TARGET);
  bool ok = check (def.bits () == 0x2000ffff, "default target bits");
  ok &= check (def.to_hex () == constants::DEFAULT_TARGET,
               "to_hex keeps the raw target");

  // Equal is not below
  Hash256 equal;
  std::reverse_copy (def.bytes ().begin (), def.bytes ().end (),
                     equal.begin ());
  ok &= check (!def.is_met_by (equal), "hash equal to target fails");
  Hash256 below = equal;
  below[0] = 0xfe;
  ok &= check (def.is_met_by (below), "hash one step below target passes");
  Hash256 above = equal;
  above[31] = 0x01;
  ok &= check (!def.is_met_by (above), "top byte is the last hash byte");

  ok &= expect_error (
      Errc::InvalidTarget, [] () { DifficultyTarget::from_bytes (Hash256{}); },
      "zero target");
  ok &= expect_error (
      Errc::InvalidTarget, [] () { DifficultyTarget::from_bits (0); },
      "zero bits");
  ok &= expect_error (
      Errc::InvalidTarget, [] () { DifficultyTarget::from_bits (0x1d800001); },
      "negative bits");
  ok &= expect_error (
      Errc::InvalidTarget, [] () { DifficultyTarget::from_hex ("00ff"); },
      "short hex target");
  ok &= expect_error (
      Errc::InvalidTarget, [] () { DifficultyTarget::from_hex ("zz"); },
      "non-hex target");
  return ok;
}

bool
TestMerkle ()
{
  Hash256 a = sha256d (Bytes ({ 'a' }));
  Hash256 b = sha256d (Bytes ({ 'b' }));
  Hash256 c = sha256d (Bytes ({ 'c' }));

  auto pair = [] (const Hash256 &l, const Hash256 &r) {
    Bytes both (l.begin (), l.end ());
    both.insert (both.end (), r.begin (), r.end ());
    return sha256d (both);
  };

  bool ok = check (compute_merkle_root (std::vector<Hash256>{ a }) == a,
                   "single leaf is the root");
  ok &= check (compute_merkle_root (std::vector<Hash256>{ a, b }) == pair (a, b),
               "two leaves");
  ok &= check (compute_merkle_root (std::vector<Hash256>{ a, b, c })
                   == pair (pair (a, b), pair (c, c)),
               "odd level duplicates its last node");
  ok &= check (compute_merkle_root (std::vector<Hash256>{ b, a })
                   != compute_merkle_root (std::vector<Hash256>{ a, b }),
               "order matters");
  ok &= expect_error (
      Errc::EmptyBlock,
      [] () { compute_merkle_root (std::vector<Hash256> ()); },
      "empty merkle tree");
  return ok;
}

bool
TestGenesisHeader ()
{
  BlockHeader h;
  h.version = 1;
  h.merkle_root = hash_from_hex (
      "4a5e1e4baab89f3a32518a88c31bc87f618f76673e2cc77ab2127b7afdeda33b");
  h.timestamp = 1231006505;
  h.difficulty_bits = 0x1d00ffff;
  h.nonce = 2083236893;

  Hash256 hash = block_hash (h);
  bool ok = check (
      hash_to_hex (hash)
          == "000000000019d6689c085ae165831e934ff763ae46a2a6c172b3f1b60a8ce26f",
      "genesis header hash");
  ok &= check (DifficultyTarget::from_bits (h.difficulty_bits).is_met_by (hash),
               "genesis meets its own target");
  ok &= check (encode_header (h).size () == constants::BLOCK_HEADER_SIZE,
               "80-byte header");
  return ok;
}

bool
TestSearchFinds ()
{
  BlockHeader h;
  h.timestamp = 1700000000;
  h.nonce = 12345;
  DifficultyTarget target
      = DifficultyTarget::from_hex (constants::DEFAULT_TARGET);

  ProofOfWork pow (h, target);
  pow.set_clock ([] () { return 1700000000u; });
  pow.set_observer (nullptr);
  const BlockHeader &found = pow.run ();

  bool ok = check (pow.state () == ProofOfWork::State::Found, "search ended");
  ok &= check (found.difficulty_bits == 0x2000ffff, "bits recorded");
  ok &= check (pow.hash () == block_hash (found), "reported hash");
  ok &= check (target.is_met_by (pow.hash ()), "hash below target");
  ok &= check (pow.attempts () == uint64_t (found.nonce) + 1,
               "nonce search starts at 0");
  ok &= check (pow.step () == ProofOfWork::State::Found, "Found is final");
  return ok;
}

bool
TestRefresh ()
{
  BlockHeader h;
  h.timestamp = 500;
  uint32_t now = 1000;
  std::vector<HashRate> rates;

  // 2^-32 per attempt; a handful of steps never succeeds
  ProofOfWork pow (h, DifficultyTarget::from_bits (0x1d00ffff));
  pow.set_clock ([&now] () { return now; });
  pow.set_observer ([&rates] (const HashRate &r) { rates.push_back (r); });
  pow.set_refresh_interval (3);

  for (int i = 0; i < 3; ++i)
    pow.step ();
  bool ok = check (rates.size () == 1 && rates[0].attempts == 3,
                   "observer called after refresh interval");
  ok &= check (pow.header ().timestamp == 1000 && pow.header ().nonce == 0,
               "moved clock restarts the nonce");

  for (int i = 0; i < 3; ++i)
    pow.step ();
  ok &= check (rates.size () == 2, "second observation");
  ok &= check (pow.header ().timestamp == 1000 && pow.header ().nonce == 3,
               "unchanged clock keeps counting");

  try
    {
      pow.set_refresh_interval (0);
      std::cerr << "zero refresh interval accepted\n";
      ok = false;
    }
  catch (const std::invalid_argument &)
    {
    }
  return ok;
}


bool
TestNonceWrap ()
{
  BlockHeader h;
  h.timestamp = 700;
  h.nonce = 0xFFFFFFFE;
  advance_nonce (h);
  bool ok = check (h.timestamp == 700 && h.nonce == 0xFFFFFFFF,
                   "nonce increments");
  advance_nonce (h);
  ok &= check (h.timestamp == 701 && h.nonce == 0,
               "wrap bumps the timestamp");

  // A header ahead of the clock, as after a wrap, is never pulled back
  BlockHeader ahead;
  ahead.timestamp = 701;
  ProofOfWork pow (ahead, DifficultyTarget::from_bits (0x1d00ffff));
  pow.set_clock ([] () { return 700u; });
  pow.set_observer (nullptr);
  pow.set_refresh_interval (2);
  for (int i = 0; i < 4; ++i)
    pow.step ();
  ok &= check (pow.header ().timestamp == 701 && pow.header ().nonce == 4,
               "clock behind the header keeps the timestamp and nonce");
  return ok;
}


bool
TestTargetFinerThanBits ()
{
  DifficultyTarget target
      = DifficultyTarget::from_hex (constants::DEFAULT_TARGET);
  DifficultyTarget expanded = DifficultyTarget::from_bits (target.bits ());

  bool ok = check (target.bits () == 0x2000ffff, "default target bits");
  ok &= check (expanded.to_hex ()
                   == "00ffff0000000000000000000000000000000000000000000000000000000000",
               "compact bits round the target down");

  // Between the two: accepted by the search, above the recorded bits
  Hash256 gap = hash_from_hex (
      "00ffff8000000000000000000000000000000000000000000000000000000000");
  ok &= check (target.is_met_by (gap), "caller's target decides the search");
  ok &= check (!expanded.is_met_by (gap), "recorded bits are stricter");
  return ok;
}

}

int
main ()
{
  try
    {
      bool ok = TestCompactBits ();
      ok &= TestDifficultyTarget ();
      ok &= TestMerkle ();
      ok &= TestGenesisHeader ();
      ok &= TestSearchFinds ();
      ok &= TestRefresh ();
      ok &= TestNonceWrap ();
      ok &= TestTargetFinerThanBits ();
      if (!ok)
        return EXIT_FAILURE;
    }
  catch (const std::exception &ex)
    {
      std::cerr << "mining_tests exception: " << ex.what () << "\n";
      return EXIT_FAILURE;
    }
  return EXIT_SUCCESS;
}
