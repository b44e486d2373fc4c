// SPDX-License-Identifier: MIT
// Blockforge - Signature Hashes and Input Verification
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstddef>
#include <cstdint>

#include "blockforge/config.hpp"
#include "blockforge/primitives.hpp"

namespace blockforge
{

/// Legacy signature hash for one input
///
/// Copies the transaction, blanks every unlocking script, puts the spent
/// output's guard script in place of the concerned input's script, appends
/// hash_type as u32 little-endian to the serialization and returns its
/// SHA256d.
///
/// @throws std::out_of_range if input_index is not an input of tx
Hash256 signature_hash_for_input (const Transaction &tx, size_t input_index,
                                  const Bytes &previous_output_script,
                                  uint32_t hash_type = constants::SIGHASH_ALL);

/// Check the input's unlocking script against the spent guard script.
///
/// Supports the templates this library signs for: pay-to-pubkey,
/// pay-to-pubkey-hash and bare multisig. Each signature must be DER with a
/// trailing SIGHASH_ALL byte and verify under signature_hash_for_input.
/// Anything malformed or unsupported verifies as false.
bool verify_input_signature (const Transaction &tx, size_t input_index,
                             const Bytes &previous_output_script);

/// Same, looking the guard script up in the spent transaction
bool verify_input_signature (const Transaction &tx, size_t input_index,
                             const Transaction &previous_tx);

} // namespace blockforge
