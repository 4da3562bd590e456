#include "template_loader.hpp"

#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <set>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/text.hpp"

namespace ticketflow::templates {
namespace {

const std::set<std::string> kVendorKeys = {"vendor_name", "aliases", "match_terms", "exclude_terms", "logo_ref", "logo", "fields"};
const std::set<std::string> kFieldKeys  = {"method", "roi", "label", "regex", "regex_flags", "validation_regex", "fallback_method", "fallback_regex"};
const std::set<std::string> kLogoKeys   = {"ref", "roi", "threshold"};

[[noreturn]] void Fail(const std::string& context, const std::string& what) {
  throw util::TemplateError("vendor template " + context + ": " + what);
}

void CheckKeys(const YAML::Node& node, const std::set<std::string>& allowed, const std::string& context) {
  if (!node.IsMap()) Fail(context, "expected a map");
  for (const auto& kv : node) {
    const auto key = kv.first.Scalar();
    if (!allowed.contains(key)) Fail(context, "unknown key '" + key + "'");
  }
}

std::string RequireString(const YAML::Node& node, const std::string& key, const std::string& context) {
  const auto value = node[key];
  if (!value || !value.IsScalar() || value.Scalar().empty()) Fail(context, "'" + key + "' must be a non-empty string");
  return value.Scalar();
}

// Accepts a scalar or a sequence of scalars.
std::vector<std::string> StringList(const YAML::Node& node, const std::string& key, const std::string& context) {
  std::vector<std::string> out;
  const auto               value = node[key];
  if (!value) return out;
  if (value.IsScalar()) {
    out.push_back(value.Scalar());
  } else if (value.IsSequence()) {
    for (const auto& item : value) {
      if (!item.IsScalar()) Fail(context, "'" + key + "' entries must be strings");
      out.push_back(item.Scalar());
    }
  } else {
    Fail(context, "'" + key + "' must be a string or list of strings");
  }
  return out;
}

ocr::BoundingBox ParseRoi(const YAML::Node& node, const std::string& context) {
  if (!node.IsSequence() || node.size() != 4) Fail(context, "roi must be [x_min, y_min, x_max, y_max]");
  double v[4];
  for (std::size_t i = 0; i < 4; ++i) {
    try {
      v[i] = node[i].as<double>();
    } catch (const YAML::Exception&) {
      Fail(context, "roi values must be numbers");
    }
    if (v[i] < 0.0 || v[i] > 1.0) Fail(context, "roi values must be normalized to [0,1]");
  }
  if (v[0] >= v[2] || v[1] >= v[3]) Fail(context, "roi must have x_min < x_max and y_min < y_max");
  return {v[0], v[1], v[2], v[3]};
}

bool ParseIgnoreCase(const YAML::Node& rule, const std::string& context) {
  const auto flags = rule["regex_flags"];
  if (!flags) return false;
  for (const auto& flag : StringList(rule, "regex_flags", context)) {
    const auto upper = util::ToUpper(flag);
    if (upper == "IGNORECASE" || upper == "I") return true;
    Fail(context, "unsupported regex flag '" + flag + "'");
  }
  return false;
}

FieldRule ParseRule(FieldName field, const YAML::Node& node, const std::string& context) {
  CheckKeys(node, kFieldKeys, context);

  const bool icase  = ParseIgnoreCase(node, context);
  const auto method = RequireString(node, "method", context);

  FieldRule rule;
  rule.field  = field;
  rule.labels = StringList(node, "label", context);

  auto pattern = TemplateLoader::Compile(RequireString(node, "regex", context), icase, context);

  if (method == "roi_regex") {
    if (!node["roi"]) Fail(context, "roi_regex requires 'roi'");
    rule.method = RoiRegex{ParseRoi(node["roi"], context), std::move(pattern)};
  } else if (method == "label_right") {
    if (rule.labels.empty()) Fail(context, "label_right requires 'label'");
    rule.method = LabelRight{std::move(pattern)};
  } else if (method == "text_regex") {
    rule.method = TextRegex{std::move(pattern)};
  } else {
    Fail(context, "unknown method '" + method + "'");
  }

  if (node["validation_regex"]) {
    rule.validation = TemplateLoader::Compile(RequireString(node, "validation_regex", context), icase, context + ".validation_regex");
  }

  std::optional<Pattern> fallback_pattern;
  if (node["fallback_regex"]) {
    fallback_pattern = TemplateLoader::Compile(RequireString(node, "fallback_regex", context), icase, context + ".fallback_regex");
  }

  if (node["fallback_method"]) {
    const auto fallback = RequireString(node, "fallback_method", context);
    if (fallback == "below_label") {
      if (rule.labels.empty() && !std::holds_alternative<RoiRegex>(rule.method)) {
        Fail(context, "below_label needs a 'label' or a roi_regex primary");
      }
      rule.fallback = BelowLabel{std::move(fallback_pattern)};
    } else if (fallback == "text_regex") {
      if (!fallback_pattern) Fail(context, "text_regex fallback requires 'fallback_regex'");
      rule.fallback = TextRegex{std::move(*fallback_pattern)};
    } else {
      Fail(context, "unknown fallback_method '" + fallback + "'");
    }
  } else if (fallback_pattern) {
    // fallback_regex alone searches the whole page
    rule.fallback = TextRegex{std::move(*fallback_pattern)};
  }

  return rule;
}

LogoTemplate ParseLogo(const YAML::Node& node, const std::string& base_dir, const std::string& context) {
  LogoTemplate logo;
  if (node.IsScalar()) {
    logo.ref = node.Scalar();
  } else {
    CheckKeys(node, kLogoKeys, context);
    logo.ref = RequireString(node, "ref", context);
    if (node["roi"]) logo.roi = ParseRoi(node["roi"], context);
    if (node["threshold"]) {
      logo.threshold = node["threshold"].as<double>();
      if (logo.threshold <= 0.0 || logo.threshold > 1.0) Fail(context, "threshold must be in (0, 1]");
    }
  }

  std::filesystem::path path(logo.ref);
  if (path.is_relative()) path = std::filesystem::path(base_dir) / path;
  logo.image = cv::imread(path.string(), cv::IMREAD_GRAYSCALE);
  if (logo.image.empty()) Fail(context, "cannot read logo image " + path.string());
  return logo;
}

VendorTemplate ParseVendor(const YAML::Node& node, const std::string& base_dir) {
  std::string context = "<unnamed>";
  CheckKeys(node, kVendorKeys, context);

  VendorTemplate vendor;
  vendor.vendor_name = RequireString(node, "vendor_name", context);
  context            = vendor.vendor_name;

  vendor.aliases       = StringList(node, "aliases", context);
  vendor.match_terms   = StringList(node, "match_terms", context);
  vendor.exclude_terms = StringList(node, "exclude_terms", context);

  if (node["logo"] && node["logo_ref"]) Fail(context, "use either 'logo' or 'logo_ref'");
  if (node["logo"]) vendor.logo = ParseLogo(node["logo"], base_dir, context + ".logo");
  if (node["logo_ref"]) vendor.logo = ParseLogo(node["logo_ref"], base_dir, context + ".logo_ref");

  const bool is_default = vendor.vendor_name == kDefaultTemplateName;
  if (!is_default && vendor.match_terms.empty() && vendor.aliases.empty() && !vendor.logo) {
    Fail(context, "needs match_terms, aliases or a logo to be detectable");
  }

  const auto fields = node["fields"];
  if (fields) {
    if (!fields.IsMap()) Fail(context, "'fields' must be a map");
    for (const auto& kv : fields) {
      const auto name  = kv.first.Scalar();
      const auto field = ParseFieldName(name);
      if (!field) Fail(context, "unknown field '" + name + "'");
      vendor.fields.emplace(*field, ParseRule(*field, kv.second, context + "." + name));
    }
  }
  return vendor;
}

} // namespace

Pattern TemplateLoader::Compile(const std::string& source, bool icase, const std::string& context) {
  boost::regex::flag_type flags = boost::regex::perl;
  if (icase) flags |= boost::regex::icase;
  try {
    return Pattern{source, boost::regex(source, flags)};
  } catch (const boost::regex_error& e) {
    Fail(context, "bad regex '" + source + "': " + e.what());
  }
}

TemplateCatalog TemplateLoader::LoadFromYaml(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw util::TemplateError("Failed to load vendor templates " + path + ": " + e.what());
  }
  auto base_dir = std::filesystem::path(path).parent_path().string();
  if (base_dir.empty()) base_dir = ".";

  auto catalog = FromYaml(root, base_dir);
  TICKETFLOW_LOG_INFO("vendor templates loaded",
                      {observability::StringField("path", path), observability::IntField("vendors", static_cast<int64_t>(catalog.Vendors().size()))});
  return catalog;
}

TemplateCatalog TemplateLoader::FromYaml(const YAML::Node& root, const std::string& base_dir) {
  const auto vendors_node = root.IsMap() ? root["vendors"] : YAML::Node();
  if (!vendors_node || !vendors_node.IsSequence()) {
    throw util::TemplateError("vendor templates: expected top-level 'vendors' list");
  }

  std::vector<VendorTemplate>   vendors;
  std::optional<VendorTemplate> default_template;
  std::set<std::string>         seen;

  for (const auto& node : vendors_node) {
    auto vendor = ParseVendor(node, base_dir);
    if (!seen.insert(vendor.vendor_name).second) {
      throw util::TemplateError("vendor template " + vendor.vendor_name + ": defined twice");
    }
    if (vendor.vendor_name == kDefaultTemplateName) {
      default_template = std::move(vendor);
    } else {
      vendors.push_back(std::move(vendor));
    }
  }

  if (!default_template) {
    throw util::TemplateError("vendor templates: a DEFAULT template is required");
  }
  return TemplateCatalog(std::move(vendors), std::move(*default_template));
}

} // namespace ticketflow::templates
