#include "sqlite_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>

namespace ticketflow::db::sqlite {
namespace {

using google::protobuf::ListValue;
using google::protobuf::Struct;
using google::protobuf::Value;

template <typename Message>
std::string ToJson(const Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("json encode: " + std::string(status.message()));
  }
  return json;
}

template <typename Message>
Message FromJson(const std::string& json) {
  Message message;
  if (json.empty()) return message;
  auto status = google::protobuf::util::JsonStringToMessage(json, &message);
  if (!status.ok()) {
    throw std::runtime_error("json decode: " + std::string(status.message()));
  }
  return message;
}

std::string StringAt(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != Value::kStringValue) return {};
  return it->second.string_value();
}

double NumberAt(const Struct& s, const std::string& key, double fallback = 0.0) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != Value::kNumberValue) return fallback;
  return it->second.number_value();
}

bool BoolAt(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  return it != s.fields().end() && it->second.kind_case() == Value::kBoolValue && it->second.bool_value();
}

std::optional<double> OptionalNumberAt(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != Value::kNumberValue) return std::nullopt;
  return it->second.number_value();
}

std::optional<std::string> OptionalStringAt(const Struct& s, const std::string& key) {
  auto it = s.fields().find(key);
  if (it == s.fields().end() || it->second.kind_case() != Value::kStringValue) return std::nullopt;
  return it->second.string_value();
}

void PutString(Struct& s, const std::string& key, const std::string& value) {
  (*s.mutable_fields())[key].set_string_value(value);
}

void PutNumber(Struct& s, const std::string& key, double value) {
  (*s.mutable_fields())[key].set_number_value(value);
}

void PutOptionalNumber(Struct& s, const std::string& key, const std::optional<int64_t>& value) {
  if (value) PutNumber(s, key, static_cast<double>(*value));
  else (*s.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
}

void PutOptionalString(Struct& s, const std::string& key, const std::optional<std::string>& value) {
  if (value) PutString(s, key, *value);
  else (*s.mutable_fields())[key].set_null_value(google::protobuf::NULL_VALUE);
}

std::optional<int64_t> ToOptionalId(const std::optional<double>& v) {
  if (!v) return std::nullopt;
  return static_cast<int64_t>(*v);
}

} // namespace

std::string EncodeStringMap(const std::map<std::string, std::string>& values) {
  Struct s;
  for (const auto& [k, v] : values) PutString(s, k, v);
  return ToJson(s);
}

std::map<std::string, std::string> DecodeStringMap(const std::string& json) {
  std::map<std::string, std::string> out;
  for (const auto& [k, v] : FromJson<Struct>(json).fields()) {
    if (v.kind_case() == Value::kStringValue) out[k] = v.string_value();
  }
  return out;
}

std::string EncodeDoubleMap(const std::map<std::string, double>& values) {
  Struct s;
  for (const auto& [k, v] : values) PutNumber(s, k, v);
  return ToJson(s);
}

std::map<std::string, double> DecodeDoubleMap(const std::string& json) {
  std::map<std::string, double> out;
  for (const auto& [k, v] : FromJson<Struct>(json).fields()) {
    if (v.kind_case() == Value::kNumberValue) out[k] = v.number_value();
  }
  return out;
}

std::string EncodeIdList(const std::vector<int64_t>& ids) {
  ListValue list;
  for (auto id : ids) list.add_values()->set_number_value(static_cast<double>(id));
  return ToJson(list);
}

std::vector<int64_t> DecodeIdList(const std::string& json) {
  std::vector<int64_t> out;
  for (const auto& v : FromJson<ListValue>(json).values()) {
    out.push_back(static_cast<int64_t>(v.number_value()));
  }
  return out;
}

std::string EncodeProblems(const std::vector<model::Problem>& problems) {
  ListValue list;
  for (const auto& p : problems) {
    auto* s = list.add_values()->mutable_struct_value();
    PutString(*s, "reason", std::string(model::ToString(p.reason)));
    PutString(*s, "severity", std::string(model::ToString(p.severity)));
    PutString(*s, "field", p.field);
    PutString(*s, "message", p.message);
    (*s->mutable_fields())["blocking"].set_bool_value(p.blocking);
  }
  return ToJson(list);
}

std::vector<model::Problem> DecodeProblems(const std::string& json) {
  std::vector<model::Problem> out;
  for (const auto& v : FromJson<ListValue>(json).values()) {
    const auto&    s = v.struct_value();
    model::Problem p;
    auto           reason   = model::ParseReviewReason(StringAt(s, "reason"));
    auto           severity = model::ParseSeverity(StringAt(s, "severity"));
    if (!reason || !severity) {
      throw std::runtime_error("json decode: unknown problem reason/severity");
    }
    p.reason   = *reason;
    p.severity = *severity;
    p.field    = StringAt(s, "field");
    p.message  = StringAt(s, "message");
    p.blocking = BoolAt(s, "blocking");
    out.push_back(std::move(p));
  }
  return out;
}

std::string EncodeSuggestedFix(const model::SuggestedFix& fix) {
  Struct s;
  PutString(s, "action", fix.action);
  auto* details = (*s.mutable_fields())["details"].mutable_struct_value();
  for (const auto& [k, v] : fix.details) PutString(*details, k, v);
  return ToJson(s);
}

model::SuggestedFix DecodeSuggestedFix(const std::string& json) {
  const auto          s = FromJson<Struct>(json);
  model::SuggestedFix fix;
  fix.action = StringAt(s, "action");
  auto it    = s.fields().find("details");
  if (it != s.fields().end()) {
    for (const auto& [k, v] : it->second.struct_value().fields()) fix.details[k] = v.string_value();
  }
  return fix;
}

std::string EncodeTicket(const model::TruckTicket& t) {
  Struct s;
  PutNumber(s, "id", static_cast<double>(t.id));
  PutString(s, "ticket_number", t.ticket_number);
  PutString(s, "ticket_date", util::FormatDate(t.ticket_date));
  if (t.quantity) PutNumber(s, "quantity", *t.quantity);
  PutString(s, "quantity_unit", std::string(model::ToString(t.quantity_unit)));
  PutNumber(s, "job_id", static_cast<double>(t.job_id));
  PutNumber(s, "material_id", static_cast<double>(t.material_id));
  PutOptionalNumber(s, "source_id", t.source_id);
  PutOptionalNumber(s, "destination_id", t.destination_id);
  PutOptionalNumber(s, "vendor_id", t.vendor_id);
  PutNumber(s, "ticket_type_id", static_cast<double>(t.ticket_type_id));
  PutOptionalString(s, "manifest_number", t.manifest_number);
  PutOptionalString(s, "truck_number", t.truck_number);
  PutString(s, "file_id", t.file_id);
  PutNumber(s, "file_page", t.file_page);
  PutString(s, "file_hash", t.file_hash);
  PutString(s, "request_guid", t.request_guid);
  PutOptionalNumber(s, "duplicate_of", t.duplicate_of);
  (*s.mutable_fields())["review_required"].set_bool_value(t.review_required);
  PutNumber(s, "confidence", t.confidence);
  auto* conf = (*s.mutable_fields())["field_confidence"].mutable_struct_value();
  for (const auto& [k, v] : t.field_confidence) PutNumber(*conf, k, v);
  PutNumber(s, "created_at_ms", static_cast<double>(util::ToUnixMillis(t.created_at)));
  return ToJson(s);
}

model::TruckTicket DecodeTicket(const std::string& json) {
  const auto         s = FromJson<Struct>(json);
  model::TruckTicket t;
  t.id            = static_cast<int64_t>(NumberAt(s, "id"));
  t.ticket_number = StringAt(s, "ticket_number");
  auto date       = util::ParseIsoDate(StringAt(s, "ticket_date"));
  if (!date) throw std::runtime_error("json decode: bad ticket_date");
  t.ticket_date    = *date;
  t.quantity       = OptionalNumberAt(s, "quantity");
  t.quantity_unit  = model::ParseQuantityUnit(StringAt(s, "quantity_unit")).value_or(model::QuantityUnit::Tons);
  t.job_id         = static_cast<int64_t>(NumberAt(s, "job_id"));
  t.material_id    = static_cast<int64_t>(NumberAt(s, "material_id"));
  t.source_id      = ToOptionalId(OptionalNumberAt(s, "source_id"));
  t.destination_id = ToOptionalId(OptionalNumberAt(s, "destination_id"));
  t.vendor_id      = ToOptionalId(OptionalNumberAt(s, "vendor_id"));
  t.ticket_type_id = static_cast<int64_t>(NumberAt(s, "ticket_type_id"));
  t.manifest_number = OptionalStringAt(s, "manifest_number");
  t.truck_number    = OptionalStringAt(s, "truck_number");
  t.file_id         = StringAt(s, "file_id");
  t.file_page       = static_cast<int>(NumberAt(s, "file_page"));
  t.file_hash       = StringAt(s, "file_hash");
  t.request_guid    = StringAt(s, "request_guid");
  t.duplicate_of    = ToOptionalId(OptionalNumberAt(s, "duplicate_of"));
  t.review_required = BoolAt(s, "review_required");
  t.confidence      = NumberAt(s, "confidence");
  auto it           = s.fields().find("field_confidence");
  if (it != s.fields().end()) {
    for (const auto& [k, v] : it->second.struct_value().fields()) t.field_confidence[k] = v.number_value();
  }
  t.created_at = util::FromUnixMillis(static_cast<uint64_t>(NumberAt(s, "created_at_ms")));
  return t;
}

} // namespace ticketflow::db::sqlite
