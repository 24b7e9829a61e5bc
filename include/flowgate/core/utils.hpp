#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace flowgate::utils {

auto trim(std::string_view s) -> std::string;
auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string;

/// Lower-case hex SHA-256 of the given bytes. Throws std::runtime_error if
/// OpenSSL fails.
auto sha256(std::string_view data) -> std::string;

/// Formats "<prefix>-<zero padded n>", e.g. sequence_id("tok", 7) == "tok-000007".
/// Zero padding keeps lexical and numeric order aligned up to 999999.
auto sequence_id(std::string_view prefix, std::uint64_t n) -> std::string;

} // namespace flowgate::utils
