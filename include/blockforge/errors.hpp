// SPDX-License-Identifier: MIT
// Blockforge - Assembly Errors
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace blockforge
{

/// Reasons an assembler refuses to produce a record
enum class Errc
{
  // Precondition errors: a required field was never supplied
  MissingValue,
  MissingScript,
  MissingKey,
  MissingPreviousOutput,
  MissingPreviousBlock,
  UnsupportedScriptKind,
  InvalidRecipient,
  InvalidTarget,
  EmptyBlock,

  // Integrity errors: an internal self-check failed
  SignatureVerification,
  EncodingMismatch,
};

/// Short stable name of an error code (e.g. "MissingValue")
const char *errc_name (Errc code);

/// Raised by the finalizing build() calls
class BuildError : public std::runtime_error
{
public:
  BuildError (Errc code, const std::string &what);

  Errc
  code () const
  {
    return code_;
  }

  /// True for SignatureVerification and EncodingMismatch
  bool is_integrity_error () const;

private:
  Errc code_;
};

/// Signature produced for an input failed its own re-verification
class SignatureVerificationError : public BuildError
{
public:
  SignatureVerificationError (size_t input_index, const std::string &reason);

  size_t
  input_index () const
  {
    return input_index_;
  }

private:
  size_t input_index_;
};

} // namespace blockforge
