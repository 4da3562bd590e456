#include "internal/templates/template_loader.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <yaml-cpp/yaml.h>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using namespace ticketflow;
using templates::FieldName;

bool Rejects(const std::string& yaml, const std::string& needle) {
  try {
    templates::TemplateLoader::FromYaml(YAML::Load(yaml));
  } catch (const util::TemplateError& e) {
    return std::string(e.what()).find(needle) != std::string::npos;
  }
  return false;
}

const char* kDefaultOnly = R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      ticket_number:
        method: label_right
        label: "TICKET"
        regex: '(\d+)'
)";

void TestShippedTemplatesLoad() {
  auto catalog = templates::TemplateLoader::LoadFromYaml("config/vendor_templates.yaml");
  assert(catalog.Default().vendor_name == "DEFAULT");
  assert(catalog.Vendors().size() >= 9);

  const auto* wm = catalog.Find("WASTE_MANAGEMENT_LEWISVILLE");
  assert(wm != nullptr);
  const auto* rule = wm->Rule(FieldName::TicketNumber);
  assert(rule != nullptr);
  assert(std::holds_alternative<templates::RoiRegex>(rule->method));
  assert(rule->fallback.has_value());

  // fields a vendor omits come from DEFAULT
  const auto* truck = catalog.RuleFor(std::string("WASTE_MANAGEMENT_LEWISVILLE"), FieldName::TruckNumber);
  assert(truck == catalog.Default().Rule(FieldName::TruckNumber));
  assert(catalog.RuleFor(std::nullopt, FieldName::TicketNumber) == catalog.Default().Rule(FieldName::TicketNumber));
}

void TestRuleParsing() {
  auto catalog = templates::TemplateLoader::FromYaml(YAML::Load(R"(
vendors:
  - vendor_name: DEFAULT
  - vendor_name: ACME
    aliases: [ACME SAND]
    fields:
      ticket_date:
        method: text_regex
        regex: 'date\s*(\S+)'
        regex_flags: IGNORECASE
      manifest_number:
        method: roi_regex
        roi: [0.1, 0.2, 0.5, 0.4]
        regex: '([A-Z0-9]{6,20})'
        fallback_regex: 'MANIFEST\s*(\S+)'
)"));

  const auto* acme = catalog.Find("ACME");
  assert(acme != nullptr);
  assert(acme->aliases.size() == 1);

  const auto* date = acme->Rule(FieldName::TicketDate);
  assert(date != nullptr);
  const auto& text = std::get<templates::TextRegex>(date->method);
  assert(boost::regex_search(std::string("DATE 10/17/2024"), text.pattern.regex));

  const auto* manifest = acme->Rule(FieldName::ManifestNumber);
  const auto& roi      = std::get<templates::RoiRegex>(manifest->method).roi;
  assert(roi.x_min == 0.1 && roi.y_max == 0.4);
  assert(std::holds_alternative<templates::TextRegex>(*manifest->fallback));

  assert(catalog.Find("NOPE") == nullptr);
}

void TestMalformedTemplatesFailLoudly() {
  assert(Rejects("vendors: []", "DEFAULT"));
  assert(Rejects("other: 1", "'vendors'"));
  assert(Rejects(std::string(kDefaultOnly) + "  - vendor_name: DEFAULT\n", "defined twice"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    colour: red
)",
                 "unknown key 'colour'"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      ticket_number:
        method: label_right
        label: TICKET
        regex: '(\d+'
)",
                 "DEFAULT.ticket_number"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      ticket_number:
        method: guess
        regex: '\d+'
)",
                 "unknown method"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      ticket_number:
        method: roi_regex
        roi: [0.8, 0.1, 0.2, 0.3]
        regex: '\d+'
)",
                 "x_min < x_max"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      ticket_number:
        method: label_right
        regex: '\d+'
)",
                 "requires 'label'"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
  - vendor_name: SILENT
)",
                 "detectable"));

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
    fields:
      weight:
        method: text_regex
        regex: '\d+'
)",
                 "unknown field 'weight'"));
}

void TestLogoIsReadAsGrayscale() {
  const auto dir = std::filesystem::temp_directory_path() / "ticketflow_template_loader_tests";
  std::filesystem::create_directories(dir);

  cv::Mat logo(6, 10, CV_8UC1, cv::Scalar(0));
  logo(cv::Rect(0, 0, 5, 6)).setTo(cv::Scalar(255));
  assert(cv::imwrite((dir / "acme.pgm").string(), logo));

  auto catalog = templates::TemplateLoader::FromYaml(YAML::Load(R"(
vendors:
  - vendor_name: DEFAULT
  - vendor_name: ACME
    logo:
      ref: acme.pgm
      roi: [0.0, 0.0, 0.5, 0.3]
      threshold: 0.9
)"),
                                                     dir.string());
  const auto* acme = catalog.Find("ACME");
  assert(acme != nullptr && acme->logo.has_value());
  assert(acme->logo->image.type() == CV_8UC1);
  assert(acme->logo->image.cols == 10 && acme->logo->image.rows == 6);
  assert(acme->logo->image.at<uchar>(0, 0) == 255 && acme->logo->image.at<uchar>(5, 9) == 0);
  assert(acme->logo->threshold == 0.9);

  assert(Rejects(R"(
vendors:
  - vendor_name: DEFAULT
  - vendor_name: ACME
    logo_ref: no_such_logo.pgm
)",
                 "cannot read logo image"));
}

void TestMissingFileIsTemplateError() {
  bool threw = false;
  try {
    templates::TemplateLoader::LoadFromYaml("config/does_not_exist.yaml");
  } catch (const util::TemplateError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestShippedTemplatesLoad();
  TestRuleParsing();
  TestMalformedTemplatesFailLoudly();
  TestLogoIsReadAsGrayscale();
  TestMissingFileIsTemplateError();

  std::cout << "ticketflow_unit_template_loader: pass\n";
  return 0;
}
