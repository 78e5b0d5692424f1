#include <streamgate/envelope.h>
#include <streamgate/exceptions.h>
#include <streamgate/response.h>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace streamgate {

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    const auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
    std::tm tm_buf{};
    gmtime_r(&time_t_val, &tm_buf);

    std::stringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S") << '.'
       << std::setw(3) << std::setfill('0') << ms << 'Z';
    return ss.str();
}

namespace envelope {

boost::json::object success(boost::json::value data, std::string_view request_id,
                            std::string_view version, std::string_view message) {
    boost::json::object out;
    out["success"] = true;
    out["data"] = std::move(data);
    if (!message.empty()) {
        out["message"] = message;
    }
    out["timestamp"] = iso_timestamp();
    out["requestId"] = request_id;
    out["version"] = version;
    return out;
}

boost::json::object error(std::string_view code, std::string_view message,
                          std::string_view request_id, std::string_view version,
                          const boost::json::value& details) {
    boost::json::object err{{"code", code}, {"message", message}};
    if (!details.is_null()) {
        err["details"] = details;
    }

    boost::json::object out;
    out["success"] = false;
    out["error"] = std::move(err);
    out["timestamp"] = iso_timestamp();
    out["requestId"] = request_id;
    out["version"] = version;
    return out;
}

void write_error(Response& res, const HttpError& e, std::string_view request_id,
                 std::string_view version, bool production) {
    // Gateway errors (502-504) carry a classified message that names no internals.
    const bool hide = production && e.status() == 500;
    std::string_view message = hide ? std::string_view("Internal server error") : std::string_view(e.what());

    res.status(e.status()).json(error(e.code(), message, request_id, version,
                                      production ? boost::json::value(nullptr) : e.details()));
}

void write_internal(Response& res, const std::exception& e, std::string_view request_id,
                    std::string_view version, bool production) {
    boost::json::value details = nullptr;
    if (!production) {
        details = boost::json::object{{"exception", e.what()}};
    }
    res.status(500).json(error("INTERNAL_ERROR", "Internal server error", request_id, version, details));
}

} // namespace envelope

} // namespace streamgate
