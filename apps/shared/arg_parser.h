#pragma once

#include <functional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace cuid::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns an empty string on success or an error message on validation
// failure. The parser keeps going after a failure so every problem is reported at once.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// ParsedOptions is the populated config plus every error met along the way.
template <typename Config>
struct ParsedOptions {
  Config config;                    // NOLINT(readability-identifier-naming)
  std::vector<std::string> errors;  // NOLINT(readability-identifier-naming)

  [[nodiscard]] bool ok() const { return errors.empty(); }
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag to its
// handler. Unknown flags, missing values and stray positional tokens become errors.
template <typename Config>
ParsedOptions<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                    const std::vector<Option<Config>>& options, int start = 1,
                                    Config default_config = {}) {
  ParsedOptions<Config> parsed{std::move(default_config), {}};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    const std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    const auto it = option_map.find(arg);
    if (it == option_map.end()) {
      parsed.errors.push_back((!arg.empty() && arg[0] == '-') ? "Unknown option: " + arg
                                                              : "Unexpected argument: " + arg);
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      if (i + 1 >= argc) {
        parsed.errors.push_back("Option " + arg + " requires a value");
        continue;
      }
      value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
    }

    std::string error = opt->handler(parsed.config, value);
    if (!error.empty()) {
      parsed.errors.push_back(std::move(error));
    }
  }

  return parsed;
}

// format_usage renders one line per option: "  <name> [value]  <description>".
template <typename Config>
std::string format_usage(const std::vector<Option<Config>>& options) {
  std::string text;
  for (const auto& opt : options) {
    std::string left = "  " + opt.name + (opt.requires_value ? " <value>" : "");
    if (left.size() < 28) {
      left.append(28 - left.size(), ' ');
    } else {
      left.push_back(' ');
    }
    text += left + opt.description + "\n";
  }
  return text;
}

}  // namespace cuid::apps
