#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/util/time.hpp"

namespace ticketflow::processing {

/*
  Metadata encoded in structured scan names:

    {JOB}__{YYYY-MM-DD}__{AREA}__{FLOW}__{MATERIAL}__{VENDOR}.pdf

  Trailing segments may be omitted. A name whose first segment is not a
  job code (NN-NNN) is unstructured and yields no hints. Segments that
  fail their own check are dropped individually.
*/
struct FilenameHints {
  std::optional<std::string> job_code;
  std::optional<util::Date>  date;
  std::optional<std::string> source_area;
  std::optional<std::string> ticket_type;
  std::optional<std::string> material;
  std::optional<std::string> vendor;

  bool Empty() const {
    return !job_code && !date && !source_area && !ticket_type && !material && !vendor;
  }
};

FilenameHints ParseFilename(std::string_view path);

} // namespace ticketflow::processing
