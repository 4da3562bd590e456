#pragma once

#include <cctype>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "internal/db/model/codes.hpp"
#include "internal/util/time.hpp"

namespace ticketflow::db::model {

/*
  One hauling transaction.

  Invariant (enforced again by the repositories):
    material requires a manifest  =>  valid manifest_number  OR  review_required

  Committed rows are immutable. duplicate_of and review_required are only
  written while the ticket is provisional.
*/
struct TruckTicket {
  int64_t id = 0;

  std::string           ticket_number;
  util::Date            ticket_date{};
  std::optional<double> quantity;
  QuantityUnit          quantity_unit = QuantityUnit::Tons;

  int64_t                job_id         = 0;
  int64_t                material_id    = 0;
  std::optional<int64_t> source_id;
  std::optional<int64_t> destination_id;
  std::optional<int64_t> vendor_id;
  int64_t                ticket_type_id = 0;

  std::optional<std::string> manifest_number;
  std::optional<std::string> truck_number;

  std::string file_id;    // source path
  int         file_page = 0;
  std::string file_hash;  // sha-256 hex
  std::string request_guid;

  std::optional<int64_t> duplicate_of;
  bool                   review_required = false;

  // aggregated over required fields; per-field values kept for review display
  double                        confidence = 0.0;
  std::map<std::string, double> field_confidence;

  util::TimePoint created_at{};
};

// 6 to 20 ASCII alphanumerics.
inline bool IsValidManifestNumber(std::string_view manifest) {
  if (manifest.size() < 6 || manifest.size() > 20) return false;
  for (char c : manifest) {
    if (!std::isalnum(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

} // namespace ticketflow::db::model
