#pragma once

#include <nlohmann/json.hpp>

#include "date/date_conversion.hpp"

namespace timestamp {
namespace http {

// {"unix": <int>, "utc": "<RFC 2822>"}
nlohmann::json encode_conversion(const date::Conversion& conversion);

// {"error": "Invalid Date"}
nlohmann::json encode_date_error(date::DateError error);

} // namespace http
} // namespace timestamp
