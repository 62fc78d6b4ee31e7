#include "generate_logic.h"

#include "cuid/core/id_generator.h"
#include "cuid/v1/cuid.h"
#include "cuid/v2/cuid2.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace cuid::cli {

namespace {

std::string scheme_name(const Scheme scheme) {
  switch (scheme) {
    case Scheme::kCuid:
      return "cuid";
    case Scheme::kSlug:
      return "slug";
    case Scheme::kCuid2:
      return "cuid2";
  }
  return "cuid";
}

void report_error(std::ostream& err, const std::string& what, const core::CuidError error) {
  err << "Error: " << what << ": " << core::to_string(error) << "\n";
}

}  // namespace

int execute_generate(const CliConfig& config, Context& context, std::ostream& out,
                     std::ostream& err) {
  const Scheme scheme = scheme_of(config);

  std::unique_ptr<core::IIdGenerator> generator;
  switch (scheme) {
    case Scheme::kCuid:
      generator = std::make_unique<v1::CuidGenerator>(context.v1_generator());
      break;
    case Scheme::kSlug:
      generator = std::make_unique<v1::SlugGenerator>(context.slug_generator());
      break;
    case Scheme::kCuid2: {
      auto created =
          context.v2_generator(v2::Cuid2Options{config.length.value_or(v2::kDefaultLength)});
      if (!created.has_value()) {
        report_error(err, "cannot configure cuid2 generator", created.error());
        return 1;
      }
      generator = std::make_unique<v2::Cuid2Generator>(created.value());
      break;
    }
  }

  std::vector<std::string> ids;
  ids.reserve(config.count);
  for (std::size_t i = 0; i < config.count; ++i) {
    auto id = generator->next();
    if (!id.has_value()) {
      report_error(err, "id generation failed", id.error());
      return 1;
    }
    ids.push_back(id.value());
  }

  const auto fingerprint =
      scheme == Scheme::kCuid2 ? context.fingerprint_v2() : context.fingerprint_v1();
  const bool degraded = fingerprint.has_value() && fingerprint.value().degraded;
  if (degraded) {
    err << "Warning: host name unavailable; fingerprint uses a random substitute\n";
  }

  if (config.json) {
    nlohmann::json doc;
    doc["scheme"] = scheme_name(scheme);
    if (scheme == Scheme::kCuid2) {
      doc["length"] = config.length.value_or(v2::kDefaultLength);
      doc["digest"] = config.digest;
    }
    doc["fingerprint_degraded"] = degraded;
    doc["ids"] = ids;
    out << doc.dump(2) << "\n";
    return 0;
  }

  for (const auto& id : ids) {
    out << id << "\n";
  }
  return 0;
}

int execute_validate(const std::string& id, const bool json, std::ostream& out) {
  const bool cuid = v1::is_cuid(id);
  const bool slug = v1::is_slug(id);
  const bool cuid2 = v2::is_cuid2(id);

  if (json) {
    nlohmann::json doc;
    doc["id"] = id;
    doc["is_cuid"] = cuid;
    doc["is_slug"] = slug;
    doc["is_cuid2"] = cuid2;
    out << doc.dump(2) << "\n";
    return 0;
  }

  out << "cuid:  " << (cuid ? "yes" : "no") << "\n";
  out << "slug:  " << (slug ? "yes" : "no") << "\n";
  out << "cuid2: " << (cuid2 ? "yes" : "no") << "\n";
  return 0;
}

}  // namespace cuid::cli
