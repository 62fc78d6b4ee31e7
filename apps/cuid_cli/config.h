#pragma once

#include "shared/arg_parser.h"

#include "cuid/v2/cuid2.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cuid::cli {

// Scheme selects which generator the CLI runs.
enum class Scheme {
  kCuid,   // NOLINT(readability-identifier-naming)
  kSlug,   // NOLINT(readability-identifier-naming)
  kCuid2,  // NOLINT(readability-identifier-naming)
};

inline constexpr std::size_t kMaxCount = 1000000;

// CliConfig holds all parsed flags for the cuid CLI.
// Every field has an explicit default; optional fields mean "not configured".
struct CliConfig {
  bool v2{false};                                // NOLINT(readability-identifier-naming)
  bool slug{false};                              // NOLINT(readability-identifier-naming)
  std::optional<std::size_t> length;             // NOLINT(readability-identifier-naming)
  std::size_t count{1};                          // NOLINT(readability-identifier-naming)
  std::string digest{"sha3-512"};                // NOLINT(readability-identifier-naming)
  bool strict_fingerprint{false};                // NOLINT(readability-identifier-naming)
  bool json{false};                              // NOLINT(readability-identifier-naming)
  std::optional<std::string> validate_id;        // NOLINT(readability-identifier-naming)
  bool show_help{false};                         // NOLINT(readability-identifier-naming)
  bool show_version{false};                      // NOLINT(readability-identifier-naming)
};

// build_option_registry lists every flag the CLI accepts, with its handler.
[[nodiscard]] std::vector<apps::Option<CliConfig>> build_option_registry();

// parse_args parses argv[1..] into a CliConfig, collecting per-flag errors.
[[nodiscard]] apps::ParsedOptions<CliConfig> parse_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// validate_cli_config checks cross-flag constraints.
//
// Returns: "" on success, non-empty error message on failure.
// Caller is responsible for printing the error and exiting with code 1.
//
// Preconditions checked (first failure is returned):
// - --slug and --v2 are mutually exclusive
// - --length requires --v2 and must lie in [2, 32]
// - --count must lie in [1, 1000000]
// - --digest must name a known strategy
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

// scheme_of resolves the generator selected by a validated config.
[[nodiscard]] Scheme scheme_of(const CliConfig& config);

// usage returns the help text.
[[nodiscard]] std::string usage();

}  // namespace cuid::cli
