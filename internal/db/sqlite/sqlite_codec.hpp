#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "internal/db/model/review_entry.hpp"
#include "internal/db/model/truck_ticket.hpp"

namespace ticketflow::db::sqlite {

/*
  JSON encoding for the columns that hold structured values.

  Encoding goes through google::protobuf::Struct and json_util so the
  stored text is plain JSON readable by the review export tooling.
  Decoders throw std::runtime_error on malformed text.
*/

std::string                        EncodeStringMap(const std::map<std::string, std::string>& values);
std::map<std::string, std::string> DecodeStringMap(const std::string& json);

std::string                   EncodeDoubleMap(const std::map<std::string, double>& values);
std::map<std::string, double> DecodeDoubleMap(const std::string& json);

std::string          EncodeIdList(const std::vector<int64_t>& ids);
std::vector<int64_t> DecodeIdList(const std::string& json);

std::string                  EncodeProblems(const std::vector<model::Problem>& problems);
std::vector<model::Problem> DecodeProblems(const std::string& json);

std::string         EncodeSuggestedFix(const model::SuggestedFix& fix);
model::SuggestedFix DecodeSuggestedFix(const std::string& json);

std::string        EncodeTicket(const model::TruckTicket& ticket);
model::TruckTicket DecodeTicket(const std::string& json);

} // namespace ticketflow::db::sqlite
