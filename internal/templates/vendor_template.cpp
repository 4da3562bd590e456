#include "vendor_template.hpp"

#include <array>
#include <utility>

namespace ticketflow::templates {
namespace {

constexpr std::array<std::pair<FieldName, std::string_view>, 8> kFieldNames{{
    {FieldName::TicketNumber, "ticket_number"},
    {FieldName::TicketDate, "date"},
    {FieldName::Quantity, "quantity"},
    {FieldName::ManifestNumber, "manifest_number"},
    {FieldName::TruckNumber, "truck_number"},
    {FieldName::Material, "material"},
    {FieldName::Source, "source"},
    {FieldName::Destination, "destination"},
}};

} // namespace

std::string_view ToString(FieldName field) {
  for (const auto& [f, name] : kFieldNames) {
    if (f == field) return name;
  }
  return "unknown";
}

std::optional<FieldName> ParseFieldName(std::string_view text) {
  for (const auto& [f, name] : kFieldNames) {
    if (name == text) return f;
  }
  if (text == "ticket_date") return FieldName::TicketDate;
  return std::nullopt;
}

TemplateCatalog::TemplateCatalog(std::vector<VendorTemplate> vendors, VendorTemplate default_template)
    : vendors_(std::move(vendors)), default_(std::move(default_template)) {
}

const VendorTemplate* TemplateCatalog::Find(std::string_view vendor_name) const {
  for (const auto& vendor : vendors_) {
    if (vendor.vendor_name == vendor_name) return &vendor;
  }
  return nullptr;
}

const FieldRule* TemplateCatalog::RuleFor(const std::optional<std::string>& vendor_name, FieldName field) const {
  if (vendor_name) {
    if (const auto* vendor = Find(*vendor_name)) {
      if (const auto* rule = vendor->Rule(field)) return rule;
    }
  }
  return default_.Rule(field);
}

} // namespace ticketflow::templates
