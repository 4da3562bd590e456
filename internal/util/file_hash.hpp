#pragma once

#include <string>
#include <string_view>

namespace ticketflow::util {

// Lowercase hex SHA-256 (64 chars). Throws TransientError when the file cannot be read.
std::string Sha256File(const std::string& path);

std::string Sha256Hex(std::string_view data);

} // namespace ticketflow::util
