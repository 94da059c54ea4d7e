#pragma once

#include <algorithm>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace irmcp::apps {

// Built-in flag that every app accepts; it is never looked up in the option registry.
constexpr std::string_view kHelpFlag = "--help";

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when value is unacceptable; parse_options records an error for it
// and keeps processing the remaining flags.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParseOutcome is what a command line amounts to once every token has been visited.
//   errors:   fatal problems (missing value, rejected value); the app should exit non-zero
//   warnings: ignorable problems (unknown flags)
template <typename Config>
struct ParseOutcome {
  Config config;                      // NOLINT(readability-identifier-naming)
  bool help_requested{false};         // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;    // NOLINT(readability-identifier-naming)
  std::vector<std::string> warnings;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Non-flag tokens that no option consumes are skipped silently.
// Nothing is printed; callers decide how to surface errors and warnings.
template <typename Config>
ParseOutcome<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                   const std::vector<Option<Config>>& options, int start = 1,
                                   Config default_config = {}) {
  ParseOutcome<Config> outcome{std::move(default_config), false, {}, {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    if (arg == kHelpFlag) {
      outcome.help_requested = true;
      continue;
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (!arg.empty() && arg[0] == '-') {
        outcome.warnings.push_back("Unknown option: " + arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    if (!opt->requires_value) {
      if (!opt->handler(outcome.config, "")) {
        outcome.errors.push_back("Option " + arg + " could not be applied");
      }
      continue;
    }

    if (i + 1 >= argc) {
      outcome.errors.push_back("Option " + arg + " requires a value");
      continue;
    }

    std::string value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    if (!opt->handler(outcome.config, value)) {
      outcome.errors.push_back("Invalid value for " + arg + ": '" + value + "'");
    }
  }

  return outcome;
}

// print_usage writes one line per option, descriptions aligned in a single column.
template <typename Config>
void print_usage(std::ostream& out, std::string_view program,
                 const std::vector<Option<Config>>& options) {
  std::vector<std::pair<std::string, std::string>> rows;
  rows.reserve(options.size() + 1);
  for (const auto& opt : options) {
    rows.emplace_back(opt.requires_value ? opt.name + " <value>" : opt.name, opt.description);
  }
  rows.emplace_back(std::string(kHelpFlag), "Show this help and exit");

  std::size_t width = 0;
  for (const auto& row : rows) {
    width = std::max(width, row.first.size());
  }

  out << "Usage: " << program << " [options]\n\nOptions:\n";
  for (const auto& [flag, description] : rows) {
    out << "  " << flag << std::string(width - flag.size() + 2, ' ') << description << "\n";
  }
}

}  // namespace irmcp::apps
