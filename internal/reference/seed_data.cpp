#include "seed_data.hpp"

#include <string>
#include <vector>

#include "internal/util/errors.hpp"

namespace ticketflow::reference {
namespace {

using db::model::ReferenceCategory;

struct SeedRow {
  ReferenceCategory category;
  const char*       name;
  bool              requires_manifest = false;
};

// clang-format off
const std::vector<SeedRow> kSeedRows = {
    {ReferenceCategory::Job, "24-105"},

    {ReferenceCategory::TicketType, "IMPORT"},
    {ReferenceCategory::TicketType, "EXPORT"},
    {ReferenceCategory::TicketType, "TRANSFER"},

    {ReferenceCategory::Material, "CLASS_2_CONTAMINATED", true},
    {ReferenceCategory::Material, "CLASS_3_CONTAMINATED", true},
    {ReferenceCategory::Material, "NON_CONTAMINATED"},
    {ReferenceCategory::Material, "CLEAN_FILL"},
    {ReferenceCategory::Material, "SPOILS"},
    {ReferenceCategory::Material, "GENERAL_WASTE"},
    {ReferenceCategory::Material, "ROCK"},
    {ReferenceCategory::Material, "3X5_ROCK"},
    {ReferenceCategory::Material, "FLEXBASE"},
    {ReferenceCategory::Material, "ASPHALT"},
    {ReferenceCategory::Material, "CONCRETE"},
    {ReferenceCategory::Material, "UTILITY_STONE"},

    {ReferenceCategory::Source, "SPG"},
    {ReferenceCategory::Source, "NPG"},
    {ReferenceCategory::Source, "PIER_EX"},
    {ReferenceCategory::Source, "MSE_WALL"},

    {ReferenceCategory::Destination, "WASTE_MANAGEMENT_LEWISVILLE"},
    {ReferenceCategory::Destination, "WASTE_MANAGEMENT_DFW_RDF"},
    {ReferenceCategory::Destination, "WASTE_MANAGEMENT_SKYLINE_RDF"},
    {ReferenceCategory::Destination, "REPUBLIC_SERVICES"},
    {ReferenceCategory::Destination, "LDI_YARD"},
    {ReferenceCategory::Destination, "POST_OAK_PIT"},

    {ReferenceCategory::Vendor, "WASTE_MANAGEMENT_LEWISVILLE"},
    {ReferenceCategory::Vendor, "WASTE_MANAGEMENT_DFW_RDF"},
    {ReferenceCategory::Vendor, "WASTE_MANAGEMENT_SKYLINE_RDF"},
    {ReferenceCategory::Vendor, "REPUBLIC_SERVICES"},
    {ReferenceCategory::Vendor, "LDI_YARD"},
    {ReferenceCategory::Vendor, "POST_OAK_PIT"},
    {ReferenceCategory::Vendor, "AUSTIN_ASPHALT"},
    {ReferenceCategory::Vendor, "ARCOSA_AGGREGATES"},
    {ReferenceCategory::Vendor, "VULCAN_MATERIALS"},
    {ReferenceCategory::Vendor, "BECK_TRUCKING"},
    {ReferenceCategory::Vendor, "NTX_TRUCKING"},
};
// clang-format on

} // namespace

std::size_t SeedDefaults(db::Repository& repository) {
  std::size_t inserted = 0;

  auto tx = repository.Begin();
  for (const auto& row : kSeedRows) {
    if (repository.FindReference(*tx, row.category, row.name)) continue;

    db::model::ReferenceEntity entity;
    entity.category       = row.category;
    entity.canonical_name = row.name;
    if (row.category == ReferenceCategory::Material) {
      entity.attributes["requires_manifest"] = row.requires_manifest ? "true" : "false";
    }
    util::ThrowIfDbError(repository.InsertReference(*tx, entity), "seed reference " + entity.canonical_name);
    ++inserted;
  }
  tx->Commit();

  return inserted;
}

} // namespace ticketflow::reference
