// SPDX-License-Identifier: MIT
// Blockforge - Fixture Assembly Tool
// Copyright (c) 2024-2026 Blockforge Contributors

#include "blockforge/config.hpp"
#include "blockforge/fixture.hpp"
#include "blockforge/log.hpp"
#include "blockforge/serialize.hpp"
#include "blockforge/utils.hpp"
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>

namespace
{
void
print_usage (const char *prog)
{
  std::cerr << "Usage: " << prog << " [options] <fixture.json>\n"
            << "\n"
            << "Assemble the blocks described by a JSON fixture and print "
               "them.\n"
            << "\n"
            << "Options:\n"
            << "  --hex          print one encoded block per line\n"
            << "  --refresh N    refresh the timestamp every N attempts\n"
            << "  -v, --verbose  debug logging\n"
            << "  --version      print version and exit\n"
            << "  -h, --help     show this help\n";
}

uint64_t
parse_count (const std::string &text)
{
  size_t used = 0;
  unsigned long long n = std::stoull (text, &used);
  if (used != text.size () || n == 0)
    throw std::invalid_argument ("expected a positive integer, got \"" + text
                                 + "\"");
  return n;
}

// Returns false when the program should exit without assembling
bool
parse_args (int argc, char **argv, blockforge::Config &config)
{
  for (int i = 1; i < argc; ++i)
    {
      std::string arg = argv[i];
      if (arg == "-h" || arg == "--help")
        {
          print_usage (argv[0]);
          return false;
        }
      else if (arg == "--version")
        {
          std::cout << "blockforge " << blockforge::constants::VERSION
                    << "\n";
          return false;
        }
      else if (arg == "--hex")
        {
          config.hex_only = true;
        }
      else if (arg == "-v" || arg == "--verbose")
        {
          config.verbose = true;
        }
      else if (arg == "--refresh")
        {
          if (i + 1 >= argc)
            throw std::invalid_argument ("--refresh needs a value");
          config.refresh_interval = parse_count (argv[++i]);
        }
      else if (!arg.empty () && arg[0] == '-')
        {
          throw std::invalid_argument ("unknown option " + arg);
        }
      else if (config.input_path.empty ())
        {
          config.input_path = arg;
        }
      else
        {
          throw std::invalid_argument ("unexpected argument " + arg);
        }
    }

  if (config.input_path.empty ())
    throw std::invalid_argument ("no fixture file given");
  return true;
}
}

int
main (int argc, char **argv)
{
  blockforge::Config config;
  try
    {
      if (!parse_args (argc, argv, config))
        return EXIT_SUCCESS;
    }
  catch (const std::exception &e)
    {
      std::cerr << "blockforge: " << e.what () << "\n";
      print_usage (argv[0]);
      return EXIT_FAILURE;
    }

  blockforge::log_set_level (config.verbose ? blockforge::LogLevel::Debug
                                            : blockforge::LogLevel::Info);

  try
    {
      blockforge::FixtureOptions options;
      if (config.refresh_interval != 0)
        options.refresh_interval = config.refresh_interval;

      blockforge::Fixture fixture = blockforge::assemble_fixture (
          blockforge::load_fixture_file (config.input_path), options);

      if (config.hex_only)
        {
          for (const auto &block : fixture.blocks)
            std::cout << blockforge::to_hex (blockforge::encode_block (block))
                      << "\n";
        }
      else
        {
          std::cout << blockforge::fixture_to_json (fixture).dump (2) << "\n";
        }
    }
  catch (const std::exception &e)
    {
      blockforge::log_error (e.what ());
      return EXIT_FAILURE;
    }

  return EXIT_SUCCESS;
}
