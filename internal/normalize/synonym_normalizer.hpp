#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "internal/db/model/codes.hpp"

namespace YAML {
class Node;
}

namespace ticketflow::normalize {

/*
  Raw OCR text -> canonical vocabulary.

  Matching, case-insensitive, in order:
    1. input already is a canonical value of the category
    2. input equals a synonym
    3. a synonym occurs inside the input on word boundaries (longest wins);
       an occurrence right after NON, NOT or NO does not count
  Otherwise the input is returned unmodified. Normalize is total and
  idempotent; deciding whether an unmapped value needs review is the
  caller's job.

  Immutable after construction, safe to share across workers.
*/
class SynonymNormalizer {
 public:
  SynonymNormalizer() = default;

  // YAML map of category -> { raw: canonical }. Throws util::TemplateError.
  static SynonymNormalizer LoadFromYaml(const std::string& path);
  static SynonymNormalizer FromYaml(const YAML::Node& root);

  void Add(db::model::ReferenceCategory category, const std::string& raw, const std::string& canonical);

  std::string Normalize(db::model::ReferenceCategory category, std::string_view raw) const;

  std::size_t Size() const;

 private:
  struct Synonym {
    std::string key; // lowercase
    std::string canonical;
  };

  struct CategoryTable {
    std::map<std::string, std::string> canonical_by_lower;
    std::vector<Synonym>               synonyms;
  };

  std::map<db::model::ReferenceCategory, CategoryTable> tables_;
};

} // namespace ticketflow::normalize
