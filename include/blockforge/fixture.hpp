// SPDX-License-Identifier: MIT
// Blockforge - JSON Fixture Descriptions
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <vector>

#include "blockforge/config.hpp"
#include "blockforge/key.hpp"
#include "blockforge/mining.hpp"
#include "blockforge/primitives.hpp"
#include "blockforge/random.hpp"

namespace blockforge
{

/// Malformed or inconsistent fixture description
class FixtureError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/// Knobs for assembling a description
struct FixtureOptions
{
  uint64_t refresh_interval = constants::NONCE_REFRESH_INTERVAL;
  RateObserver observer = log_hash_rate;
  RandomSource *random = nullptr; // default_random () when null
};

/// An assembled description: named keys and the chain of blocks
struct Fixture
{
  std::map<std::string, SigningKey> keys;
  std::vector<Block> blocks;
};

/// Read and parse a JSON description
/// @throws FixtureError if the file cannot be read or is not valid JSON
nlohmann::json load_fixture_file (const std::string &path);

/// Assemble every block of a description in document order
///
/// @throws FixtureError for structural problems (unknown key names,
///         missing fields, wrong JSON types, bad transaction references)
/// @throws BuildError from the assemblers
Fixture assemble_fixture (const nlohmann::json &doc,
                          const FixtureOptions &options = FixtureOptions ());

void to_json (nlohmann::json &j, const TxIn &in);
void to_json (nlohmann::json &j, const TxOut &out);
void to_json (nlohmann::json &j, const Transaction &tx);
void to_json (nlohmann::json &j, const Block &block);

/// Keys (secret, public key, address) and blocks
nlohmann::json fixture_to_json (const Fixture &fixture);

} // namespace blockforge
