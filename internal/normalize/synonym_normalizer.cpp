#include "synonym_normalizer.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>

#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace ticketflow::normalize {

using db::model::ReferenceCategory;

namespace {

bool IsWordChar(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

// "non", "not" or "no" directly before pos, separated by spaces or a hyphen
bool Negated(const std::string& text, std::size_t pos) {
  std::size_t end = pos;
  while (end > 0 && (text[end - 1] == ' ' || text[end - 1] == '-')) --end;
  if (end == pos) return false;

  std::size_t begin = end;
  while (begin > 0 && IsWordChar(text[begin - 1])) --begin;
  const auto word = text.substr(begin, end - begin);
  return word == "non" || word == "not" || word == "no";
}

// key occurs in text with non-alphanumeric (or no) neighbours and is not negated
bool ContainsWord(const std::string& text, const std::string& key) {
  std::size_t pos = text.find(key);
  while (pos != std::string::npos) {
    const bool left_ok  = pos == 0 || !IsWordChar(text[pos - 1]) || !IsWordChar(key.front());
    const bool right_ok = pos + key.size() == text.size() || !IsWordChar(text[pos + key.size()]) || !IsWordChar(key.back());
    if (left_ok && right_ok && !Negated(text, pos)) return true;
    pos = text.find(key, pos + 1);
  }
  return false;
}

ReferenceCategory CategoryFromSection(const std::string& section) {
  if (section == "vendors" || section == "vendor") return ReferenceCategory::Vendor;
  if (section == "materials" || section == "material") return ReferenceCategory::Material;
  if (section == "sources" || section == "source") return ReferenceCategory::Source;
  if (section == "destinations" || section == "destination") return ReferenceCategory::Destination;
  throw util::TemplateError("synonyms: unknown category '" + section + "'");
}

} // namespace

SynonymNormalizer SynonymNormalizer::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::TemplateError("Failed to load synonyms " + path + ": " + e.what());
  }
  return FromYaml(root);
}

SynonymNormalizer SynonymNormalizer::FromYaml(const YAML::Node& root) {
  if (!root.IsMap()) {
    throw util::TemplateError("synonyms: top level must be a map of categories");
  }

  SynonymNormalizer normalizer;
  for (const auto& section : root) {
    const auto category = CategoryFromSection(section.first.Scalar());
    if (!section.second.IsMap()) {
      throw util::TemplateError("synonyms: '" + section.first.Scalar() + "' must map raw terms to canonical names");
    }
    for (const auto& entry : section.second) {
      if (!entry.second.IsScalar()) {
        throw util::TemplateError("synonyms: value for '" + entry.first.Scalar() + "' must be a string");
      }
      normalizer.Add(category, entry.first.Scalar(), entry.second.Scalar());
    }
  }
  return normalizer;
}

void SynonymNormalizer::Add(ReferenceCategory category, const std::string& raw, const std::string& canonical) {
  const auto key            = util::ToLower(util::Trim(raw));
  const auto canonical_trim = util::Trim(canonical);
  if (key.empty() || canonical_trim.empty()) {
    throw util::TemplateError("synonyms: empty term in " + std::string(db::model::ToString(category)));
  }

  auto& table = tables_[category];

  const auto lower_canonical = util::ToLower(canonical_trim);
  auto [it, inserted]        = table.canonical_by_lower.try_emplace(lower_canonical, canonical_trim);
  if (!inserted && it->second != canonical_trim) {
    throw util::TemplateError("synonyms: canonical names '" + it->second + "' and '" + canonical_trim + "' differ only by case");
  }

  for (const auto& existing : table.synonyms) {
    if (existing.key == key && existing.canonical != canonical_trim) {
      throw util::TemplateError("synonyms: '" + raw + "' maps to both '" + existing.canonical + "' and '" + canonical_trim + "'");
    }
  }
  table.synonyms.push_back({key, canonical_trim});
}

std::string SynonymNormalizer::Normalize(ReferenceCategory category, std::string_view raw) const {
  auto table_it = tables_.find(category);
  if (table_it == tables_.end()) return std::string(raw);
  const auto& table = table_it->second;

  const auto lower = util::ToLower(util::Trim(raw));
  if (lower.empty()) return std::string(raw);

  if (auto it = table.canonical_by_lower.find(lower); it != table.canonical_by_lower.end()) {
    return it->second;
  }

  for (const auto& synonym : table.synonyms) {
    if (synonym.key == lower) return synonym.canonical;
  }

  const Synonym* best = nullptr;
  for (const auto& synonym : table.synonyms) {
    if (ContainsWord(lower, synonym.key) && (!best || synonym.key.size() > best->key.size())) {
      best = &synonym;
    }
  }
  if (best) return best->canonical;

  return std::string(raw);
}

std::size_t SynonymNormalizer::Size() const {
  std::size_t total = 0;
  for (const auto& [_, table] : tables_) total += table.synonyms.size();
  return total;
}

} // namespace ticketflow::normalize
