#include "generate_logic.h"

#include "cuid/core/clock.h"
#include "cuid/core/digest.h"
#include "cuid/core/entropy.h"
#include "cuid/core/identity.h"
#include "cuid/core/services.h"

#include <catch2/catch_test_macros.hpp>
#include <nlohmann/json.hpp>

#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace cuid;
using namespace cuid::cli;

namespace {

std::vector<std::string> lines_of(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

struct CliRuntime {
  explicit CliRuntime(std::optional<std::string> hostname = std::string("cli-host"),
                      core::FingerprintPolicy policy = core::FingerprintPolicy::kFallback)
      : identity(core::ProcessIdentity{std::move(hostname), 31337}),
        context(services, policy) {}

  core::FixedClock clock{1700000000000};
  core::FixedIdentityProvider identity;
  core::FixedEntropySource entropy{{9, 141, 57, 230, 12}};
  core::Sha3_512Digest digest;
  core::Services services{clock, entropy, identity, digest};
  Context context;
};

}  // namespace

// ── generate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_generate prints one v1 CUID per line", "[cli][generate]") {
  CliRuntime runtime;
  CliConfig config;
  config.count = 3;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(config, runtime.context, out, err) == 0);
  const auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 3);
  for (const auto& line : lines) {
    CHECK(v1::is_cuid(line));
  }
  CHECK(lines[0] != lines[1]);
  CHECK(err.str().empty());
}

TEST_CASE("execute_generate prints slugs", "[cli][generate]") {
  CliRuntime runtime;
  CliConfig config;
  config.slug = true;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(config, runtime.context, out, err) == 0);
  const auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 1);
  CHECK(v1::is_slug(lines[0]));
}

TEST_CASE("execute_generate honours the CUID2 length", "[cli][generate][v2]") {
  CliRuntime runtime;
  CliConfig config;
  config.v2 = true;
  config.length = 12;
  config.count = 4;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(config, runtime.context, out, err) == 0);
  const auto lines = lines_of(out.str());
  REQUIRE(lines.size() == 4);
  for (const auto& line : lines) {
    CHECK(line.size() == 12);
    CHECK(v2::is_cuid2(line));
  }
}

TEST_CASE("execute_generate emits a JSON document", "[cli][generate][json]") {
  CliRuntime runtime;
  CliConfig config;
  config.v2 = true;
  config.count = 2;
  config.json = true;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(config, runtime.context, out, err) == 0);
  const auto doc = nlohmann::json::parse(out.str());
  CHECK(doc["scheme"] == "cuid2");
  CHECK(doc["length"] == 24);
  CHECK(doc["digest"] == "sha3-512");
  CHECK(doc["fingerprint_degraded"] == false);
  REQUIRE(doc["ids"].size() == 2);
  for (const auto& id : doc["ids"]) {
    CHECK(v2::is_cuid2(id.get<std::string>()));
  }
}

TEST_CASE("execute_generate warns about a degraded fingerprint", "[cli][generate][fingerprint]") {
  CliRuntime runtime(std::nullopt);
  CliConfig config;
  std::ostringstream out;
  std::ostringstream err;

  REQUIRE(execute_generate(config, runtime.context, out, err) == 0);
  CHECK(v1::is_cuid(lines_of(out.str()).at(0)));
  CHECK(err.str().find("Warning: host name unavailable") != std::string::npos);
}

TEST_CASE("execute_generate fails under the strict fingerprint policy",
          "[cli][generate][error]") {
  CliRuntime runtime(std::nullopt, core::FingerprintPolicy::kStrict);
  CliConfig config;
  std::ostringstream out;
  std::ostringstream err;

  CHECK(execute_generate(config, runtime.context, out, err) == 1);
  CHECK(out.str().empty());
  CHECK(err.str().rfind("Error:", 0) == 0);
  CHECK(err.str().find("fingerprint_unavailable") != std::string::npos);
}

// ── validate ────────────────────────────────────────────────────────────────

TEST_CASE("execute_validate reports matching formats", "[cli][validate]") {
  SECTION("plain text") {
    std::ostringstream out;
    CHECK(execute_validate("c1a2b3c4d0000ab1200000000", false, out) == 0);
    const auto lines = lines_of(out.str());
    REQUIRE(lines.size() == 3);
    CHECK(lines[0] == "cuid:  yes");
    CHECK(lines[1] == "slug:  no");
    CHECK(lines[2] == "cuid2: yes");
  }

  SECTION("json") {
    std::ostringstream out;
    CHECK(execute_validate("4d0a200", true, out) == 0);
    const auto doc = nlohmann::json::parse(out.str());
    CHECK(doc["id"] == "4d0a200");
    CHECK(doc["is_cuid"] == false);
    CHECK(doc["is_slug"] == true);
    CHECK(doc["is_cuid2"] == false);
  }
}
