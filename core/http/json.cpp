#include "json.hpp"

#include "errors.hpp"

namespace timestamp {
namespace http {

nlohmann::json encode_conversion(const date::Conversion &conversion) {
    return {{"unix", conversion.unix_seconds}, {"utc", conversion.utc}};
}

nlohmann::json encode_date_error(date::DateError error) {
    return make_error_response(date::date_error_to_string(error));
}

}  // namespace http
}  // namespace timestamp
