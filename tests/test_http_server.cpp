#include <catch2/catch.hpp>
#include "http_server.hpp"
#include "image_cache.hpp"
#include "image_store.hpp"
#include "test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>

using namespace memomark;
using memomark::testing::MemoryImageStore;
using memomark::testing::TempDir;
using json = nlohmann::json;

TEST_CASE("Parse endpoint returns the render IR", "[http]") {
    HttpServer server(std::make_shared<MemoryImageStore>(), nullptr);

    ApiResponse res = server.parse_memo("# Hi\n\n- a\n- b");
    REQUIRE(res.status == 200);
    REQUIRE(res.content_type == "application/json");

    json body = json::parse(res.body);
    REQUIRE(body["line_count"].get<int>() == 4);
    REQUIRE(body["blocks"].size() == 2);
    REQUIRE(body["blocks"][0]["type"].get<std::string>() == "heading");
    REQUIRE(body["blocks"][1]["type"].get<std::string>() == "list");
}

TEST_CASE("Inline endpoint returns matches", "[http]") {
    HttpServer server(nullptr, nullptr);

    ApiResponse res = server.inline_matches("a **b** `c`");
    REQUIRE(res.status == 200);

    json body = json::parse(res.body);
    REQUIRE(body.size() == 2);
    REQUIRE(body[0]["type"].get<std::string>() == "bold");
    REQUIRE(body[1]["type"].get<std::string>() == "code");
}

TEST_CASE("Served memo", "[http]") {
    TempDir tmp;
    HttpServer server(nullptr, nullptr);

    SECTION("No memo configured") {
        REQUIRE(server.served_memo().status == 404);
    }

    SECTION("Memo file is parsed on each request") {
        std::string path = tmp.write("memo.md", "# One");
        server.set_memo_path(path);
        REQUIRE(json::parse(server.served_memo().body)["blocks"][0]["content"][0]["text"]
                    .get<std::string>() == "One");

        tmp.write("memo.md", "# Two");
        REQUIRE(json::parse(server.served_memo().body)["blocks"][0]["content"][0]["text"]
                    .get<std::string>() == "Two");
    }

    SECTION("Memo file is gone") {
        server.set_memo_path(tmp.file("missing.md"));
        ApiResponse res = server.served_memo();
        REQUIRE(res.status == 404);
        REQUIRE(json::parse(res.body).contains("error"));
    }
}

TEST_CASE("Saved image can be fetched", "[http][images]") {
    TempDir tmp;
    auto store = std::make_shared<FileImageStore>(tmp.path());
    auto cache = std::make_shared<ImageCache>(store);
    HttpServer server(store, cache);

    ApiResponse saved = server.save_image("GIF89a...", "Diagram.gif");
    REQUIRE(saved.status == 201);

    json body = json::parse(saved.body);
    std::string filename = body["filename"].get<std::string>();
    REQUIRE(filename == content_hash("GIF89a...") + ".gif");
    REQUIRE(body["markdown"].get<std::string>() == "![Diagram](image://" + filename + ")");

    // Registered in the cache without a fetch
    REQUIRE(cache->lookup("cache://" + filename).status == ImageStatus::Ready);
    REQUIRE(cache->fetch_count() == 0);

    ApiResponse fetched = server.get_image(filename);
    REQUIRE(fetched.status == 200);
    REQUIRE(fetched.content_type == "image/gif");
    REQUIRE(fetched.body == "GIF89a...");
}

TEST_CASE("Image endpoint errors", "[http][images]") {
    TempDir tmp;
    HttpServer server(std::make_shared<FileImageStore>(tmp.path()), nullptr);

    REQUIRE(server.get_image("nope.png").status == 404);
    REQUIRE(server.get_image("..").status == 404);
    REQUIRE(server.save_image("", "empty.png").status == 400);

    HttpServer storeless(nullptr, nullptr);
    REQUIRE(storeless.get_image("a.png").status == 500);
    REQUIRE(storeless.save_image("x", "a.png").status == 500);
}

TEST_CASE("Unnamed upload gets a default alt text", "[http][images]") {
    HttpServer server(std::make_shared<MemoryImageStore>(), nullptr);

    ApiResponse saved = server.save_image("bytes", "");
    REQUIRE(saved.status == 201);

    json body = json::parse(saved.body);
    REQUIRE(body["filename"].get<std::string>() == content_hash("bytes") + ".png");
    REQUIRE(body["markdown"].get<std::string>().find("![image](image://") == 0);
}
