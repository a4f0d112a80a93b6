#include <catch2/catch.hpp>
#include "settings.hpp"
#include "test_helpers.hpp"
#include <string>

using namespace memomark;
using memomark::testing::TempDir;

TEST_CASE("Missing settings file", "[settings]") {
    TempDir tmp;
    REQUIRE_FALSE(load_settings(tmp.file("absent.json")).has_value());
}

TEST_CASE("Saved settings load back", "[settings]") {
    TempDir tmp;
    std::string path = tmp.file("settings.json");

    Settings settings;
    settings.images_dir = "/var/memos/img";
    settings.colors = false;
    settings.watch_debounce_ms = 120;
    settings.server_address = "0.0.0.0";
    settings.server_port = 9000;
    save_settings(settings, path);

    auto loaded = load_settings(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->images_dir == "/var/memos/img");
    REQUIRE_FALSE(loaded->colors);
    REQUIRE(loaded->watch_debounce_ms == 120);
    REQUIRE(loaded->server_address == "0.0.0.0");
    REQUIRE(loaded->server_port == 9000);
}

TEST_CASE("Missing fields keep defaults", "[settings]") {
    TempDir tmp;
    std::string path = tmp.write("partial.json", R"({"server_port": 8000})");

    auto loaded = load_settings(path);
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->server_port == 8000);
    REQUIRE(loaded->images_dir == DEFAULT_IMAGES_DIR);
    REQUIRE(loaded->colors);
    REQUIRE(loaded->watch_debounce_ms == DEFAULT_WATCH_DEBOUNCE_MS);
    REQUIRE(loaded->server_address == DEFAULT_SERVER_ADDRESS);
}

TEST_CASE("Invalid settings files are rejected", "[settings]") {
    TempDir tmp;

    SECTION("Malformed JSON") {
        REQUIRE_FALSE(load_settings(tmp.write("bad.json", "{ not json")).has_value());
    }

    SECTION("Not an object") {
        REQUIRE_FALSE(load_settings(tmp.write("array.json", "[1, 2]")).has_value());
    }

    SECTION("Wrong field type") {
        REQUIRE_FALSE(load_settings(tmp.write("typed.json", R"({"server_port": "high"})")).has_value());
    }
}

TEST_CASE("Saving to an unwritable path throws", "[settings]") {
    TempDir tmp;
    REQUIRE_THROWS_AS(save_settings(Settings{}, tmp.file("no/such/dir/s.json")), std::runtime_error);
}
