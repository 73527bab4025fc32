#pragma once

#include <functional>
#include <iostream>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace docvec::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure (the parser
// continues processing remaining flags regardless of the return value).
// Repeating a flag calls its handler once per occurrence.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome carries the populated config plus whether every token was accepted.
template <typename Config>
struct ParseOutcome {
  Config config;    // NOLINT(readability-identifier-naming)
  bool ok{true};    // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
// Unknown flags, missing values and handler failures are reported to stderr and
// clear ParseOutcome::ok. Non-flag tokens are rejected too: no subcommand takes
// positional arguments.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 2,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      std::cerr << (!arg.empty() && arg[0] == '-' ? "Unknown option: " : "Unexpected argument: ")
                << arg << "\n";
      outcome.ok = false;
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      outcome.ok = opt->handler(outcome.config, "") && outcome.ok;
      continue;
    }
    if (i + 1 >= argc) {
      std::cerr << "Option " << arg << " requires a value\n";
      outcome.ok = false;
      continue;
    }
    outcome.ok = opt->handler(outcome.config,
                              argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
                 outcome.ok;
  }

  return outcome;
}

// print_options writes one "  --flag <value>  description" line per option.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    std::string flag = opt.name + (opt.requires_value ? " <value>" : "");
    out << "  " << flag;
    for (std::size_t pad = flag.size(); pad < 22; ++pad) {
      out << ' ';
    }
    out << "  " << opt.description << "\n";
  }
}

}  // namespace docvec::apps
