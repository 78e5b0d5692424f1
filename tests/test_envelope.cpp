#include <catch2/catch_test_macros.hpp>
#include <streamgate/envelope.h>
#include <streamgate/exceptions.h>
#include <streamgate/response.h>
#include <boost/json/parse.hpp>

using namespace streamgate;

TEST_CASE("Envelope: Success shape", "[envelope]") {
    auto out = envelope::success(boost::json::object{{"score", 97}}, "req-1", "v1", "Health score calculated");

    CHECK(out.at("success").as_bool());
    CHECK(out.at("data").at("score").as_int64() == 97);
    CHECK(out.at("message").as_string() == "Health score calculated");
    CHECK(out.at("requestId").as_string() == "req-1");
    CHECK(out.at("version").as_string() == "v1");
    CHECK(out.at("timestamp").as_string().size() == 24);

    auto bare = envelope::success(nullptr, "req-2", "v1");
    CHECK_FALSE(bare.contains("message"));
}

TEST_CASE("Envelope: Errors", "[envelope]") {
    Response res;

    SECTION("Typed errors keep their status and code") {
        envelope::write_error(res, RateLimitError("Too many requests", 5, 0, std::chrono::system_clock::now()),
                              "req-3", "v1", true);
        CHECK(res.get_status() == 429);
        auto body = boost::json::parse(res.body()).as_object();
        CHECK_FALSE(body.at("success").as_bool());
        CHECK(body.at("error").at("code").as_string() == "RATE_LIMIT_ERROR");
        CHECK(body.at("error").at("message").as_string() == "Too many requests");
    }

    SECTION("Details only outside production") {
        PayloadTooLarge err(10, 20);
        envelope::write_error(res, err, "req-4", "v1", false);
        auto dev = boost::json::parse(res.body()).as_object();
        CHECK(dev.at("error").at("details").at("maxSize").as_int64() == 10);

        envelope::write_error(res, err, "req-4", "v1", true);
        auto prod = boost::json::parse(res.body()).as_object();
        CHECK_FALSE(prod.at("error").as_object().contains("details"));
    }

    SECTION("Production hides internal messages but not gateway errors") {
        envelope::write_error(res, InternalError("db exploded"), "req-5", "v1", true);
        auto body = boost::json::parse(res.body()).as_object();
        CHECK(body.at("error").at("message").as_string() == "Internal server error");

        envelope::write_error(res, GatewayTimeoutError("payment"), "req-5", "v1", true);
        auto timeout = boost::json::parse(res.body()).as_object();
        CHECK(res.get_status() == 504);
        CHECK(timeout.at("error").at("message").as_string() == "payment service timeout");
    }

    SECTION("Unexpected exceptions") {
        envelope::write_internal(res, std::runtime_error("null deref"), "req-6", "v1", false);
        CHECK(res.get_status() == 500);
        auto body = boost::json::parse(res.body()).as_object();
        CHECK(body.at("error").at("details").at("exception").as_string() == "null deref");
    }
}

TEST_CASE("Envelope: Timestamps are ISO-8601 UTC", "[envelope]") {
    const auto epoch = std::chrono::system_clock::time_point{} + std::chrono::milliseconds(1500);
    CHECK(iso_timestamp(epoch) == "1970-01-01T00:00:01.500Z");
}
