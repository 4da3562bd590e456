#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "internal/db/model/codes.hpp"

namespace ticketflow::db::model {

/*
  Job, material, source, destination, vendor or ticket type.

  canonical_name is unique within a category. Attributes are free-form;
  the only one the pipeline reads is "requires_manifest" on materials.
*/
struct ReferenceEntity {
  int64_t                            id       = 0;
  ReferenceCategory                  category = ReferenceCategory::Job;
  std::string                        canonical_name;
  std::map<std::string, std::string> attributes;

  bool RequiresManifest() const {
    auto it = attributes.find("requires_manifest");
    return it != attributes.end() && (it->second == "true" || it->second == "1");
  }
};

} // namespace ticketflow::db::model
