#include "http_server.hpp"
#include "image_cache.hpp"
#include "image_store.hpp"
#include "ir_json.hpp"
#include "memo_file.hpp"
#include "verbose.hpp"
#include "markdown/inline_scanner.hpp"
#include "markdown/render_ir.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <filesystem>

using json = nlohmann::json;

namespace memomark {

namespace {
    ApiResponse error_response(int status, const std::string& message) {
        return {status, json{{"error", message}}.dump(), "application/json"};
    }

    void apply(const ApiResponse& api, httplib::Response& res) {
        res.status = api.status;
        res.set_content(api.body, api.content_type);
    }
}

HttpServer::HttpServer(std::shared_ptr<ImageStore> store, std::shared_ptr<ImageCache> cache)
    : store_(std::move(store))
    , cache_(std::move(cache)) {}

HttpServer::~HttpServer() = default;

ApiResponse HttpServer::parse_memo(const std::string& text) const {
    return {200, to_json(markdown::render_ir_from_text(text)).dump(), "application/json"};
}

ApiResponse HttpServer::inline_matches(const std::string& text) const {
    return {200, matches_to_json(markdown::parse_inline(text)).dump(), "application/json"};
}

ApiResponse HttpServer::served_memo() const {
    if (memo_path_.empty()) {
        return error_response(404, "No memo is being served");
    }
    try {
        return parse_memo(read_memo(memo_path_));
    } catch (const std::exception& e) {
        verbose_err("HTTP", e.what());
        return error_response(404, e.what());
    }
}

ApiResponse HttpServer::get_image(const std::string& filename) const {
    if (!store_) {
        return error_response(500, "Image store not available");
    }
    try {
        ImageBytes bytes = store_->get(filename).get();
        return {200, std::move(bytes), image_mime_type(filename)};
    } catch (const std::exception& e) {
        verbose_err("HTTP", e.what());
        return error_response(404, e.what());
    }
}

ApiResponse HttpServer::save_image(const std::string& bytes, const std::string& suggested_name) const {
    if (!store_) {
        return error_response(500, "Image store not available");
    }
    if (bytes.empty()) {
        return error_response(400, "Empty image");
    }

    try {
        std::string filename = store_->save(bytes, suggested_name).get();
        if (cache_) {
            cache_->put(filename, bytes);
        }

        std::string alt = std::filesystem::path(suggested_name).stem().string();
        json j = {
            {"filename", filename},
            {"markdown", image_markdown(alt.empty() ? "image" : alt, filename)}
        };
        return {201, j.dump(), "application/json"};
    } catch (const std::exception& e) {
        verbose_err("HTTP", e.what());
        return error_response(500, e.what());
    }
}

bool HttpServer::start(const std::string& address, int port) {
    server_ = std::make_unique<httplib::Server>();
    httplib::Server& svr = *server_;

    svr.set_logger([](const httplib::Request& req, const httplib::Response& res) {
        verbose_in("HTTP", req.method + " " + req.path + " -> " + std::to_string(res.status));
    });

    svr.Post("/api/parse", [this](const httplib::Request& req, httplib::Response& res) {
        apply(parse_memo(req.body), res);
    });

    svr.Post("/api/inline", [this](const httplib::Request& req, httplib::Response& res) {
        apply(inline_matches(req.body), res);
    });

    svr.Get("/api/memo", [this](const httplib::Request&, httplib::Response& res) {
        apply(served_memo(), res);
    });

    svr.Get(R"(/api/images/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        apply(get_image(req.matches[1]), res);
    });

    svr.Post("/api/images", [this](const httplib::Request& req, httplib::Response& res) {
        std::string name = req.has_param("name") ? req.get_param_value("name") : "";
        apply(save_image(req.body, name), res);
    });

    // Call the on_start callback before blocking
    if (on_start_callback_) {
        on_start_callback_(address, port);
    }

    // This blocks until stop() is called
    return svr.listen(address, port);
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
}

void HttpServer::on_start(std::function<void(const std::string&, int)> callback) {
    on_start_callback_ = std::move(callback);
}

} // namespace memomark
