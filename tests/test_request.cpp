#include <catch2/catch_test_macros.hpp>
#include <streamgate/exceptions.h>
#include <streamgate/request.h>
#include <streamgate/response.h>

using namespace streamgate;

TEST_CASE("Request: Target parsing", "[request]") {
    Request req;
    req.set_target("/api/v1/content/search?q=star%20wars&page=2&flag");

    CHECK(req.path == "/api/v1/content/search");
    CHECK(req.target == "/api/v1/content/search?q=star%20wars&page=2&flag");
    CHECK(req.query_string() == "q=star%20wars&page=2&flag");
    CHECK(req.get_query("q") == "star wars");
    CHECK(req.get_query_int("page", 1) == 2);
    CHECK(req.get_query("flag").empty());
    CHECK(req.get_query("missing", "fallback") == "fallback");

    req.query["page"] = "two";
    CHECK_THROWS_AS(req.get_query_int("page"), ValidationError);
}

TEST_CASE("Request: JSON body", "[request]") {
    Request req;
    req.body = R"({"url": "http://c3:3002", "weight": 2})";
    auto body = req.json();
    CHECK(body.at("weight").as_int64() == 2);

    req.body = "{broken";
    CHECK_THROWS_AS(req.json(), ValidationError);
}

TEST_CASE("Request: Generic Context Storage", "[request]") {
    Request req;

    SECTION("Store and retrieve basic types") {
        req.set("auth_error", std::string("Token has expired"));
        req.set("retry_count", 5);

        CHECK(req.get<std::string>("auth_error") == "Token has expired");
        CHECK(req.get<int>("retry_count") == 5);
    }

    SECTION("Handle missing keys safely") {
        CHECK_FALSE(req.get_opt<int>("non_existent").has_value());
        CHECK_THROWS_AS(req.get<int>("non_existent"), std::runtime_error);
    }

    SECTION("Wrong type reads as absent") {
        req.set("retry_count", 5);
        CHECK_FALSE(req.get_opt<std::string>("retry_count").has_value());
    }
}

TEST_CASE("Request: Caller key", "[request]") {
    Request req;
    req.client_ip = "198.51.100.4";
    CHECK(req.caller_key() == "ip:198.51.100.4");

    req.caller = CallerIdentity{"u-5", "", std::nullopt, std::nullopt};
    CHECK(req.caller_key() == "user:u-5");
}

TEST_CASE("Response: Builders", "[response]") {
    Response res;
    res.status(201).header("X-One", "1").add_header("Set-Cookie", "a=1").add_header("Set-Cookie", "b=2");
    res.json(boost::json::object{{"ok", true}});

    CHECK(res.get_status() == 201);
    CHECK(res.get_header("Content-Type") == "application/json");
    CHECK(res.body() == R"({"ok":true})");
    CHECK(res.get_beast_response().count("Set-Cookie") == 2);

    res.remove_header("X-One");
    CHECK(res.get_header("X-One").empty());

    res.no_content();
    CHECK(res.get_status() == 204);
    CHECK(res.body().empty());
}
