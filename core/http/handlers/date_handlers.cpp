#include <string>
#include <variant>

#include "../../date/date_conversion.hpp"
#include "../json.hpp"
#include "../server.hpp"
#include "utils.hpp"

namespace timestamp {
namespace http {

namespace {
constexpr const char *kGreeting = "<h1>Hello World!</h1>";
}  // namespace

//=============================================================================
// GET /
//=============================================================================
void HttpServer::handle_get_root(const httplib::Request &, httplib::Response &res) {
    res.status = status_code_to_http(StatusCode::OK);
    res.set_content(kGreeting, "text/html");
}

//=============================================================================
// GET /api - Current UTC time
//=============================================================================
void HttpServer::handle_get_now(const httplib::Request &, httplib::Response &res) {
    send_json(res, StatusCode::OK, encode_conversion(date::convert_now(clock_)));
}

//=============================================================================
// GET /api/{date} - Convert a YYYY-MM-DD date or Unix timestamp
//=============================================================================
void HttpServer::handle_get_date(const httplib::Request &req, httplib::Response &res) {
    std::string token;
    if (!parse_path_param(req, token)) {
        send_json(res, StatusCode::UNPROCESSABLE_ENTITY, encode_date_error(date::DateError::INVALID_DATE));
        return;
    }

    const date::ConversionResult result = date::convert_date(token);
    if (const auto *error = std::get_if<date::DateError>(&result)) {
        send_json(res, date_error_to_status(*error), encode_date_error(*error));
        return;
    }

    send_json(res, StatusCode::OK, encode_conversion(std::get<date::Conversion>(result)));
}

}  // namespace http
}  // namespace timestamp
