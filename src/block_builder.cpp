// SPDX-License-Identifier: MIT
// Blockforge - Block Assembly Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/builder.hpp"
#include "blockforge/errors.hpp"
#include "blockforge/log.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include <cstdio>
#include <stdexcept>
#include <string>
#include <utility>

namespace blockforge
{

BlockAssembler::BlockAssembler (RandomSource &random) : random_ (&random) {}

BlockAssembler &
BlockAssembler::set_version (uint32_t version)
{
  version_ = version;
  return *this;
}

BlockAssembler &
BlockAssembler::set_previous_block (const Hash256 &hash)
{
  previous_ = hash;
  return *this;
}

BlockAssembler &
BlockAssembler::set_previous_block_hex (std::string_view hex)
{
  previous_ = hash_from_hex (hex);
  return *this;
}

BlockAssembler &
BlockAssembler::set_timestamp (uint32_t timestamp)
{
  timestamp_ = timestamp;
  return *this;
}

BlockAssembler &
BlockAssembler::set_clock (Clock clock)
{
  clock_ = std::move (clock);
  return *this;
}

BlockAssembler &
BlockAssembler::set_observer (RateObserver observer)
{
  observer_ = std::move (observer);
  return *this;
}

BlockAssembler &
BlockAssembler::set_refresh_interval (uint64_t attempts)
{
  if (attempts == 0)
    throw std::invalid_argument ("refresh interval must be positive");
  refresh_interval_ = attempts;
  return *this;
}

TransactionAssembler &
BlockAssembler::add_transaction ()
{
  transactions_.emplace_back (std::in_place_type<TransactionAssembler>,
                              *random_);
  return std::get<TransactionAssembler> (transactions_.back ());
}

BlockAssembler &
BlockAssembler::add_transaction (const Transaction &tx)
{
  transactions_.emplace_back (std::in_place_type<Transaction>, tx);
  return *this;
}

BlockAssembler &
BlockAssembler::tx (const std::function<void (TransactionAssembler &)> &fn)
{
  fn (add_transaction ());
  return *this;
}

Block
BlockAssembler::build (const DifficultyTarget &target) const
{
  if (!previous_)
    throw BuildError (Errc::MissingPreviousBlock,
                      "block has no previous block hash");

  Block block;
  block.transactions.reserve (transactions_.size ());
  for (const auto &entry : transactions_)
    {
      if (const auto *assembler = std::get_if<TransactionAssembler> (&entry))
        block.transactions.push_back (assembler->build ());
      else
        block.transactions.push_back (std::get<Transaction> (entry));
    }

  if (!block.transactions.empty () && !block.transactions[0].is_coinbase ())
    log_warn ("First transaction of the block is not a coinbase");

  BlockHeader header;
  header.version = version_;
  header.previous_block_hash = *previous_;
  header.merkle_root = compute_merkle_root (block.transactions);
  header.timestamp = timestamp_ ? *timestamp_ : clock_ ();

  if (log_get_level () <= LogLevel::Debug)
    log_debug ("Merkle root " + hash_to_hex (header.merkle_root) + ", target "
               + target.to_hex ());

  ProofOfWork pow (header, target);
  pow.set_clock (clock_);
  pow.set_observer (observer_);
  pow.set_refresh_interval (refresh_interval_);
  block.header = pow.run ();

  if (log_get_level () <= LogLevel::Debug)
    {
      char buf[128];
      std::snprintf (buf, sizeof (buf),
                     "Found nonce %u (time %u, bits 0x%08x) after %llu "
                     "attempts",
                     block.header.nonce, block.header.timestamp,
                     block.header.difficulty_bits,
                     static_cast<unsigned long long> (pow.attempts ()));
      log_debug (buf);
    }

  Block decoded = decode_block (encode_block (block));
  if (decoded != block)
    throw BuildError (Errc::EncodingMismatch,
                      "block changed across encode/decode");

  if (log_get_level () <= LogLevel::Debug)
    log_debug ("Assembled block " + hash_to_hex (block_hash (decoded.header)));
  return decoded;
}

Block
BlockAssembler::build () const
{
  return build (default_target ());
}

DifficultyTarget
default_target ()
{
  return DifficultyTarget::from_hex (constants::DEFAULT_TARGET);
}

Block
blk (const DifficultyTarget &target,
     const std::function<void (BlockAssembler &)> &fn)
{
  BlockAssembler assembler;
  fn (assembler);
  return assembler.build (target);
}

Block
blk (const std::function<void (BlockAssembler &)> &fn)
{
  return blk (default_target (), fn);
}

} // namespace blockforge
