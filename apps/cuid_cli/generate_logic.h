#pragma once

#include "config.h"

#include "cuid/context.h"

#include <iosfwd>
#include <string>

namespace cuid::cli {

// execute_generate prints config.count identifiers of the configured scheme.
// Takes an already-built Context so tests can inject fixed collaborators.
// Identifiers go to `out`; errors and the degraded-fingerprint warning go to `err`.
// Returns the process exit code.
int execute_generate(const CliConfig& config, Context& context, std::ostream& out,
                     std::ostream& err);

// execute_validate reports which formats `id` satisfies. Always returns 0.
int execute_validate(const std::string& id, bool json, std::ostream& out);

}  // namespace cuid::cli
