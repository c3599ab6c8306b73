#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace migen::apps {

// Option describes a single command-line flag accepted by an app or subcommand.
// Config is the caller-defined configuration struct that handlers populate.
// A flag may be repeated; the handler runs once per occurrence.
//
// handler returns true on success, false on validation failure.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                         // NOLINT(readability-identifier-naming)
  std::vector<std::string> positionals;  // NOLINT(readability-identifier-naming)
  int error_count{0};                    // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return error_count == 0; }
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and collects non-flag tokens as positionals.
// Unknown flags, missing values and rejected values are reported to stderr and
// counted in error_count; parsing continues so every problem is reported at once.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, 0};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (opt->requires_value) {
        if (i + 1 < argc) {
          if (!opt->handler(parsed.config,
                            argv[++i])) {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            ++parsed.error_count;
          }
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          ++parsed.error_count;
        }
      } else if (!opt->handler(parsed.config, "")) {
        ++parsed.error_count;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      ++parsed.error_count;
    } else {
      parsed.positionals.push_back(std::move(arg));
    }
  }

  return parsed;
}

// print_usage writes one line per option.
template <typename Config>
void print_usage(std::ostream& out, const std::string& synopsis,
                 const std::vector<Option<Config>>& options) {
  out << "Usage: " << synopsis << "\n";
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "  " << opt.description
        << "\n";
  }
}

}  // namespace migen::apps
