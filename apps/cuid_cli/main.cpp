#include "config.h"
#include "generate_logic.h"

#include "cuid/context.h"
#include "cuid/core/clock.h"
#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/fingerprint.h"
#include "cuid/core/identity.h"
#include "cuid/core/services.h"
#include "cuid/core/version.h"

#include <iostream>

int main(int argc, char* argv[]) {
  const auto parsed = cuid::cli::parse_args(argc, argv);
  if (!parsed.ok()) {
    for (const auto& error : parsed.errors) {
      std::cerr << error << "\n";
    }
    std::cerr << "Run 'cuid --help' for usage.\n";
    return 1;
  }

  const auto& config = parsed.config;
  if (config.show_help) {
    std::cout << cuid::cli::usage();
    return 0;
  }
  if (config.show_version) {
    std::cout << "cuid " << cuid::core::kBuildVersion << "\n";
    return 0;
  }
  if (config.validate_id.has_value()) {
    return cuid::cli::execute_validate(config.validate_id.value(), config.json, std::cout);
  }

  const std::string error = cuid::cli::validate_cli_config(config);
  if (!error.empty()) {
    std::cerr << error << "\n";
    return 1;
  }

  // validate_cli_config already accepted the digest name.
  const auto digest = cuid::core::make_digest(config.digest);
  if (!digest.has_value()) {
    std::cerr << "Error: cannot create digest '" << config.digest << "'\n";
    return 1;
  }

  cuid::core::SystemClock clock;
  cuid::core::SystemEntropySource entropy;
  cuid::core::SystemIdentityProvider identity;
  cuid::core::Services services{clock, entropy, identity, *digest.value()};

  const auto policy = config.strict_fingerprint ? cuid::core::FingerprintPolicy::kStrict
                                                : cuid::core::FingerprintPolicy::kFallback;
  cuid::Context context(services, policy);

  return cuid::cli::execute_generate(config, context, std::cout, std::cerr);
}
