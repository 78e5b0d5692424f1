#include <catch2/catch_test_macros.hpp>
#include <streamgate/environment.h>
#include <fstream>
#include <cstdio>
#include <cstdlib>

using namespace streamgate;

TEST_CASE("Environment: .env Loading", "[env]") {
    std::string test_file = "test.env";

    std::ofstream out(test_file);
    out << "SG_KEY1=VALUE1\n";
    out << "  SG_KEY2 = VALUE2  \n";
    out << "# SG_COMMENT=BLAH\n";
    out << "SG_KEY3=\"QUOTED VALUE\"\n";
    out << "SG_PRESET=from-file\n";
    out.close();

    setenv("SG_PRESET", "from-process", 1);

    SECTION("Loading and Parsing") {
        REQUIRE(load_env(test_file) == true);

        CHECK(std::string(std::getenv("SG_KEY1")) == "VALUE1");
        CHECK(std::string(std::getenv("SG_KEY2")) == "VALUE2");
        CHECK(std::getenv("SG_COMMENT") == nullptr);
        CHECK(std::string(std::getenv("SG_KEY3")) == "QUOTED VALUE");
        CHECK(std::string(std::getenv("SG_PRESET")) == "from-process");
    }

    SECTION("Non-existent file") {
        CHECK(load_env("missing.env") == false);
    }

    std::remove(test_file.c_str());
}

TEST_CASE("Environment: Typed access", "[env]") {
    setenv("SG_INT", "42", 1);
    setenv("SG_BAD_INT", "forty-two", 1);
    setenv("SG_FLAG", "yes", 1);
    setenv("SG_DELAY", "1500", 1);
    setenv("SG_LIST", " a, b ,,c ", 1);

    CHECK(env<int>("SG_INT") == 42);
    CHECK(env<int>("SG_UNSET", 7) == 7);
    CHECK(env<bool>("SG_FLAG"));
    CHECK(env<std::chrono::milliseconds>("SG_DELAY") == std::chrono::milliseconds(1500));
    CHECK(env_list("SG_LIST") == std::vector<std::string>{"a", "b", "c"});
    CHECK(env_list("SG_UNSET", {"x"}) == std::vector<std::string>{"x"});

    CHECK_THROWS_AS(env<int>("SG_BAD_INT"), std::invalid_argument);
    CHECK_THROWS_AS(env<std::string>("SG_UNSET"), std::runtime_error);
}
