#ifndef STREAMGATE_ENVELOPE_H
#define STREAMGATE_ENVELOPE_H

#include <chrono>
#include <string>
#include <string_view>
#include <boost/json/object.hpp>
#include <boost/json/value.hpp>

namespace streamgate {

class HttpError;
class Response;

/** @brief ISO-8601 UTC with milliseconds, e.g. 2024-01-01T12:00:00.000Z */
std::string iso_timestamp(std::chrono::system_clock::time_point tp = std::chrono::system_clock::now());

namespace envelope {

    /**
     * @brief {success:true, data, message?, timestamp, requestId, version}
     */
    boost::json::object success(boost::json::value data, std::string_view request_id,
                                std::string_view version, std::string_view message = {});

    /**
     * @brief {success:false, error:{code, message, details?}, timestamp, requestId, version}
     */
    boost::json::object error(std::string_view code, std::string_view message,
                              std::string_view request_id, std::string_view version,
                              const boost::json::value& details = nullptr);

    /**
     * @brief Writes the error envelope for @p e into @p res.
     *
     * With @p production set, 500 messages are replaced by a generic text and
     * no details are attached.
     */
    void write_error(Response& res, const HttpError& e, std::string_view request_id,
                     std::string_view version, bool production);

    /**
     * @brief Writes a 500 envelope for an unexpected exception. The exception text
     * is only exposed in @p details outside production.
     */
    void write_internal(Response& res, const std::exception& e, std::string_view request_id,
                        std::string_view version, bool production);

} // namespace envelope

} // namespace streamgate

#endif // STREAMGATE_ENVELOPE_H
