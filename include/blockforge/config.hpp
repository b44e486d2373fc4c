// SPDX-License-Identifier: MIT
// Blockforge - Configuration
// Copyright (c) 2024-2026 Blockforge Contributors

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace blockforge
{

/// Fixture tool configuration
struct Config
{
  std::string input_path;          // JSON fixture description
  bool hex_only = false;           // Print encoded blocks instead of JSON
  bool verbose = false;            // Enable debug logging
  uint64_t refresh_interval = 0;   // 0 = use constants::NONCE_REFRESH_INTERVAL
};

// Named constants
namespace constants
{
constexpr size_t COINBASE_DATA_SIZE = 32;
constexpr uint64_t NONCE_REFRESH_INTERVAL = 100000;
constexpr uint32_t SIGHASH_ALL = 0x01;
constexpr uint32_t SEQUENCE_FINAL = 0xFFFFFFFF;
constexpr uint32_t COINBASE_OUTPUT_INDEX = 0xFFFFFFFF;
constexpr uint8_t ADDRESS_VERSION = 0x00;
constexpr uint8_t SCRIPT_ADDRESS_VERSION = 0x05;
constexpr size_t BLOCK_HEADER_SIZE = 80;
constexpr uint32_t DEFAULT_BLOCK_VERSION = 1;
constexpr uint32_t DEFAULT_TX_VERSION = 1;
constexpr const char *DEFAULT_TARGET
    = "00ffffffffffffffffffffffffffffffffffffffffffffffffffffffffffffff";
constexpr const char *VERSION = "1.0.0";
}

} // namespace blockforge
