#include "config.h"

#include "cuid/core/digest.h"

#include <charconv>
#include <string>
#include <system_error>

namespace cuid::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::optional<std::size_t> parse_size(const std::string& value) {
  std::size_t parsed = 0;
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (value.empty() || ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::string handle_v2(CliConfig& config, const std::string& /*value*/) {
  config.v2 = true;
  return "";
}

std::string handle_slug(CliConfig& config, const std::string& /*value*/) {
  config.slug = true;
  return "";
}

std::string handle_length(CliConfig& config, const std::string& value) {
  const auto parsed = parse_size(value);
  if (!parsed.has_value()) {
    return "Invalid --length: " + value + " (expected a whole number)";
  }
  config.length = parsed.value();
  return "";
}

std::string handle_count(CliConfig& config, const std::string& value) {
  const auto parsed = parse_size(value);
  if (!parsed.has_value()) {
    return "Invalid --count: " + value + " (expected a whole number)";
  }
  config.count = parsed.value();
  return "";
}

std::string handle_digest(CliConfig& config, const std::string& value) {
  config.digest = value;
  return "";
}

std::string handle_strict_fingerprint(CliConfig& config, const std::string& /*value*/) {
  config.strict_fingerprint = true;
  return "";
}

std::string handle_json(CliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return "";
}

std::string handle_validate(CliConfig& config, const std::string& value) {
  config.validate_id = value;
  return "";
}

std::string handle_help(CliConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return "";
}

std::string handle_version(CliConfig& config, const std::string& /*value*/) {
  config.show_version = true;
  return "";
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--v2", false, "Generate CUID2 identifiers instead of v1 CUIDs", handle_v2},
      {"--slug", false, "Generate short v1 slugs (7-10 characters)", handle_slug},
      {"--length", true, "CUID2 length, 2..32 (default 24)", handle_length},
      {"--count", true, "Number of identifiers to print (default 1)", handle_count},
      {"--digest", true, "CUID2 hash strategy (sha3-512|sha256)", handle_digest},
      {"--strict-fingerprint", false,
       "Fail when the host name is unavailable instead of degrading", handle_strict_fingerprint},
      {"--json", false, "Print a JSON document instead of plain lines", handle_json},
      {"--validate", true, "Report whether the given string is a cuid, slug or cuid2",
       handle_validate},
      {"--help", false, "Show this help", handle_help},
      {"--version", false, "Show the version", handle_version},
  };
}

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

apps::ParsedOptions<CliConfig> parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry());
}

std::string validate_cli_config(const CliConfig& config) {
  if (config.slug && config.v2) {
    return "Error: --slug and --v2 cannot be combined.";
  }

  if (config.length.has_value()) {
    if (!config.v2) {
      return "Error: --length only applies to --v2.";
    }
    const std::size_t length = config.length.value();
    if (length < v2::kMinLength || length > v2::kMaxLength) {
      return "Error: --length " + std::to_string(length) + " is out of range (" +
             std::to_string(v2::kMinLength) + ".." + std::to_string(v2::kMaxLength) + ").";
    }
  }

  if (config.count < 1 || config.count > kMaxCount) {
    return "Error: --count " + std::to_string(config.count) + " is out of range (1.." +
           std::to_string(kMaxCount) + ").";
  }

  if (!core::make_digest(config.digest).has_value()) {
    return "Error: --digest '" + config.digest + "' is not supported (valid: sha3-512, sha256).";
  }

  return "";
}

Scheme scheme_of(const CliConfig& config) {
  if (config.v2) {
    return Scheme::kCuid2;
  }
  return config.slug ? Scheme::kSlug : Scheme::kCuid;
}

std::string usage() {
  return "Usage: cuid [options]\n"
         "\n"
         "Prints collision-resistant identifiers, one per line.\n"
         "\n"
         "Options:\n" +
         apps::format_usage(build_option_registry());
}

}  // namespace cuid::cli
