#pragma once

#include <functional>
#include <iostream>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sqlrag::apps {

// Option describes one flag of a subcommand. Config is the subcommand's own
// configuration struct; handlers write into it.
//
// handler returns false when the value is rejected. Handlers report the problem
// themselves and record it in Config (the parser keeps going either way).
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ArgToken is one argv entry split into flag name and inline value ("--k=5").
struct ArgToken {
  std::string name;                  // NOLINT(readability-identifier-naming)
  std::optional<std::string> value;  // NOLINT(readability-identifier-naming)
};

inline ArgToken split_arg(const std::string& arg) {
  if (arg.rfind("--", 0) == 0) {
    const auto eq = arg.find('=');
    if (eq != std::string::npos) {
      return ArgToken{.name = arg.substr(0, eq), .value = arg.substr(eq + 1)};
    }
  }
  return ArgToken{.name = arg, .value = std::nullopt};
}

// parse_options walks argv[start..argc-1] and returns the populated config.
// Value flags accept "--flag value" and "--flag=value"; switches reject an inline
// value. Unknown flags and missing values are reported on stderr. Other tokens
// are collected into positionals when it is given (a lone "--" ends flag
// parsing) and ignored otherwise.
template <typename Config>
Config parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                     const std::vector<Option<Config>>& options, int start = 1,
                     Config default_config = {},
                     std::vector<std::string>* positionals = nullptr) {
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> by_name;
  for (const auto& opt : options) {
    by_name[opt.name] = &opt;
  }

  bool flags_done = false;
  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (flags_done || arg.empty() || arg[0] != '-') {
      if (positionals != nullptr) {
        positionals->push_back(arg);
      }
      continue;
    }
    if (arg == "--") {
      flags_done = true;
      continue;
    }

    const ArgToken token = split_arg(arg);
    const auto it = by_name.find(token.name);
    if (it == by_name.end()) {
      std::cerr << "Unknown option: " << token.name << "\n";
      continue;
    }

    const Option<Config>& opt = *it->second;
    if (!opt.requires_value) {
      if (token.value.has_value()) {
        std::cerr << "Option " << token.name << " does not take a value\n";
        continue;
      }
      opt.handler(config, "");
    } else if (token.value.has_value()) {
      opt.handler(config, *token.value);
    } else if (i + 1 < argc) {
      opt.handler(config, argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    } else {
      std::cerr << "Option " << token.name << " requires a value\n";
    }
  }

  return config;
}

// Usage lines: "  --name <value>" followed by the indented description.
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace sqlrag::apps
