#pragma once

#include <string>

#include "internal/templates/vendor_template.hpp"

namespace YAML {
class Node;
}

namespace ticketflow::templates {

/*
  Loads the vendor template catalog from YAML.

  Every rule is checked against the template schema and every regex is
  compiled here, so a malformed template fails at startup with
  util::TemplateError naming the vendor and field.
*/
class TemplateLoader {
 public:
  static TemplateCatalog LoadFromYaml(const std::string& path);

  // logo_ref paths are resolved relative to base_dir
  static TemplateCatalog FromYaml(const YAML::Node& root, const std::string& base_dir = ".");

  // icase adds boost::regex::icase. Throws util::TemplateError.
  static Pattern Compile(const std::string& source, bool icase, const std::string& context);
};

} // namespace ticketflow::templates
