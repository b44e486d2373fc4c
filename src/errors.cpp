// SPDX-License-Identifier: MIT
// Blockforge - Assembly Errors Implementation
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/errors.hpp"

namespace blockforge
{

const char *
errc_name (Errc code)
{
  switch (code)
    {
    case Errc::MissingValue:
      return "MissingValue";
    case Errc::MissingScript:
      return "MissingScript";
    case Errc::MissingKey:
      return "MissingKey";
    case Errc::MissingPreviousOutput:
      return "MissingPreviousOutput";
    case Errc::MissingPreviousBlock:
      return "MissingPreviousBlock";
    case Errc::UnsupportedScriptKind:
      return "UnsupportedScriptKind";
    case Errc::InvalidRecipient:
      return "InvalidRecipient";
    case Errc::InvalidTarget:
      return "InvalidTarget";
    case Errc::EmptyBlock:
      return "EmptyBlock";
    case Errc::SignatureVerification:
      return "SignatureVerificationError";
    case Errc::EncodingMismatch:
      return "EncodingMismatch";
    }
  return "Unknown";
}

BuildError::BuildError (Errc code, const std::string &what)
    : std::runtime_error (std::string (errc_name (code)) + ": " + what),
      code_ (code)
{
}

bool
BuildError::is_integrity_error () const
{
  return code_ == Errc::SignatureVerification
         || code_ == Errc::EncodingMismatch;
}

SignatureVerificationError::SignatureVerificationError (
    size_t input_index, const std::string &reason)
    : BuildError (Errc::SignatureVerification,
                  "input " + std::to_string (input_index) + ": " + reason),
      input_index_ (input_index)
{
}

} // namespace blockforge
