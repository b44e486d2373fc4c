// SPDX-License-Identifier: MIT
// Blockforge - Block and Transaction Assemblers
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

#include "blockforge/config.hpp"
#include "blockforge/key.hpp"
#include "blockforge/mining.hpp"
#include "blockforge/primitives.hpp"
#include "blockforge/random.hpp"
#include "blockforge/script.hpp"

namespace blockforge
{

/// Collects a value and a guard script for one output
class OutputAssembler
{
public:
  OutputAssembler &set_value (uint64_t value);
  OutputAssembler &set_script (const Bytes &script);
  OutputAssembler &set_script (const ScriptTemplateBuilder &builder);

  /// Declare the guard script through a template builder
  OutputAssembler &
  script (const std::function<void (ScriptTemplateBuilder &)> &fn);

  /// @throws BuildError (MissingValue, MissingScript, or whatever the
  ///         script template raises)
  TxOut build () const;

private:
  std::optional<uint64_t> value_;
  std::optional<Bytes> script_;
  std::optional<ScriptTemplateBuilder> template_;
};

/// Describes one input, either a coinbase or a spend of a previous output
///
/// The last of coinbase() / prev_out() called selects the mode. The spent
/// transaction and the signing keys are borrowed and must outlive the
/// enclosing TransactionAssembler::build().
class InputAssembler
{
public:
  explicit InputAssembler (RandomSource &random = default_random ());

  /// Coinbase with COINBASE_DATA_SIZE random bytes as payload
  InputAssembler &coinbase ();
  /// Coinbase with a caller-supplied payload
  InputAssembler &coinbase (const Bytes &data);

  InputAssembler &prev_out (const Transaction &previous);
  InputAssembler &prev_out_index (uint32_t index);
  InputAssembler &set_sequence (uint32_t sequence);

  /// Add a signing key; multisig spends take one key per signature
  InputAssembler &signature_key (const SigningKey &key);

  bool
  is_coinbase () const
  {
    return mode_ == Mode::Coinbase;
  }

  const Bytes &
  coinbase_data () const
  {
    return coinbase_data_;
  }

  const std::vector<const SigningKey *> &
  keys () const
  {
    return keys_;
  }

  /// Output being spent
  /// @throws BuildError (MissingPreviousOutput)
  const TxOut &spent_output () const;

  /// Partial input: the unlocking script of a spend is left empty
  /// @throws BuildError (MissingPreviousOutput)
  TxIn build () const;

private:
  enum class Mode
  {
    Unset,
    Coinbase,
    Spending
  };

  RandomSource *random_;
  Mode mode_ = Mode::Unset;
  Bytes coinbase_data_;
  const Transaction *previous_ = nullptr;
  std::optional<uint32_t> index_;
  uint32_t sequence_ = constants::SEQUENCE_FINAL;
  std::vector<const SigningKey *> keys_;
};

/// Assembles a signed transaction from its inputs and outputs
class TransactionAssembler
{
public:
  explicit TransactionAssembler (RandomSource &random = default_random ());

  TransactionAssembler &set_version (uint32_t version);
  TransactionAssembler &set_lock_time (uint32_t lock_time);

  /// New input/output, valid for the lifetime of this assembler
  InputAssembler &add_input ();
  OutputAssembler &add_output ();

  TransactionAssembler &input (const std::function<void (InputAssembler &)> &fn);
  TransactionAssembler &
  output (const std::function<void (OutputAssembler &)> &fn);

  /// Finalize outputs and inputs, sign every spending input, re-verify
  /// each signature and check the wire round trip.
  ///
  /// @throws BuildError for missing or unsupported declarations
  /// @throws SignatureVerificationError if a signature fails re-verification
  Transaction build () const;

private:
  RandomSource *random_;
  uint32_t version_ = constants::DEFAULT_TX_VERSION;
  uint32_t lock_time_ = 0;
  std::deque<InputAssembler> inputs_;
  std::deque<OutputAssembler> outputs_;
};

/// Assembles a block and searches a nonce for it
class BlockAssembler
{
public:
  explicit BlockAssembler (RandomSource &random = default_random ());

  BlockAssembler &set_version (uint32_t version);
  BlockAssembler &set_previous_block (const Hash256 &hash);
  /// 64 hex digits in display order
  /// @throws std::invalid_argument on malformed hex
  BlockAssembler &set_previous_block_hex (std::string_view hex);

  /// Starting timestamp; the clock is used when unset
  BlockAssembler &set_timestamp (uint32_t timestamp);
  BlockAssembler &set_clock (Clock clock);
  BlockAssembler &set_observer (RateObserver observer);
  BlockAssembler &set_refresh_interval (uint64_t attempts);

  /// New transaction declared in place
  TransactionAssembler &add_transaction ();
  /// Append an already assembled transaction
  BlockAssembler &add_transaction (const Transaction &tx);

  BlockAssembler &tx (const std::function<void (TransactionAssembler &)> &fn);

  /// @throws BuildError (MissingPreviousBlock, EmptyBlock, ...)
  Block build (const DifficultyTarget &target) const;
  /// Same against constants::DEFAULT_TARGET
  Block build () const;

private:
  using Entry = std::variant<TransactionAssembler, Transaction>;

  RandomSource *random_;
  uint32_t version_ = constants::DEFAULT_BLOCK_VERSION;
  std::optional<Hash256> previous_;
  std::optional<uint32_t> timestamp_;
  Clock clock_ = system_clock_seconds;
  RateObserver observer_ = log_hash_rate;
  uint64_t refresh_interval_ = constants::NONCE_REFRESH_INTERVAL;
  std::deque<Entry> transactions_;
};

/// Default target as a DifficultyTarget
DifficultyTarget default_target ();

/// Declare and build a block in one expression
Block blk (const DifficultyTarget &target,
           const std::function<void (BlockAssembler &)> &fn);
Block blk (const std::function<void (BlockAssembler &)> &fn);

Transaction tx (const std::function<void (TransactionAssembler &)> &fn);

Bytes script (const std::function<void (ScriptTemplateBuilder &)> &fn);

} // namespace blockforge
