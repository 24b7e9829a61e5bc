#pragma once

#include <cstdint>
#include <string>

#include <nlohmann/json.hpp>

namespace flowgate {

using json = nlohmann::json;

/// Seconds in the host runtime clock domain.
using Timestamp = std::uint64_t;

/// Host-assigned identifier of a runtime value, unique within one execution.
using ValueId = std::uint64_t;

/// Store-assigned identifier of an authority token.
using TokenId = std::string;

} // namespace flowgate
