#pragma once

#include <string>
#include <nlohmann/json.hpp>

#include "date/date_conversion.hpp"

namespace timestamp
{
    namespace http
    {

        /**
         * @brief Response status codes used by the service
         *
         * - OK -> HTTP 200
         * - NOT_FOUND -> HTTP 404
         * - UNPROCESSABLE_ENTITY -> HTTP 422 (input understood but not a date)
         * - INTERNAL -> HTTP 500
         */
        enum class StatusCode
        {
            OK,
            NOT_FOUND,
            UNPROCESSABLE_ENTITY,
            INTERNAL
        };

        /**
         * @brief Convert StatusCode to HTTP status integer
         */
        inline int status_code_to_http(StatusCode code)
        {
            switch (code)
            {
            case StatusCode::OK:
                return 200;
            case StatusCode::NOT_FOUND:
                return 404;
            case StatusCode::UNPROCESSABLE_ENTITY:
                return 422;
            case StatusCode::INTERNAL:
                return 500;
            default:
                return 500;
            }
        }

        /**
         * @brief Status a conversion failure is reported with
         */
        inline StatusCode date_error_to_status(date::DateError error)
        {
            switch (error)
            {
            case date::DateError::INVALID_DATE:
                return StatusCode::UNPROCESSABLE_ENTITY;
            default:
                return StatusCode::INTERNAL;
            }
        }

        /**
         * @brief Build a JSON error body: {"error": "<message>"}
         */
        inline nlohmann::json make_error_response(const std::string &message)
        {
            return {{"error", message}};
        }

    } // namespace http
} // namespace timestamp
