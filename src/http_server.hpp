#pragma once

/**
 * HTTP preview API.
 *
 * Exposes the markdown engine and the image store to a local front end:
 *
 *   POST /api/parse              body: memo text   -> render IR JSON
 *   POST /api/inline             body: text        -> inline match JSON
 *   GET  /api/memo                                 -> render IR of the served memo file
 *   GET  /api/images/<filename>                    -> image bytes
 *   POST /api/images?name=<name> body: image bytes -> {"filename", "markdown"}
 *
 * Each endpoint is backed by a handler method returning an ApiResponse, so
 * the API can be exercised without opening a socket.
 */

#include <functional>
#include <memory>
#include <string>

namespace httplib {
class Server;
}

namespace memomark {

class ImageCache;
class ImageStore;

struct ApiResponse {
    int status = 200;
    std::string body;
    std::string content_type = "application/json";
};

class HttpServer {
public:
    /**
     * @param store Image store used by the image endpoints
     * @param cache Cache that saved images are registered in; may be null
     */
    HttpServer(std::shared_ptr<ImageStore> store, std::shared_ptr<ImageCache> cache);

    ~HttpServer();

    // Sets the memo file served by GET /api/memo.
    void set_memo_path(const std::string& path) { memo_path_ = path; }

    // Starts the server on the given address and port.
    // This call blocks until the server is stopped.
    // Returns true if server started successfully, false otherwise.
    bool start(const std::string& address, int port);

    // Stops a running server; start() then returns.
    void stop();

    // Sets a callback to be called when the server starts.
    void on_start(std::function<void(const std::string&, int)> callback);

    // ========== Handlers ==========

    ApiResponse parse_memo(const std::string& text) const;
    ApiResponse inline_matches(const std::string& text) const;
    ApiResponse served_memo() const;
    ApiResponse get_image(const std::string& filename) const;
    ApiResponse save_image(const std::string& bytes, const std::string& suggested_name) const;

private:
    std::shared_ptr<ImageStore> store_;
    std::shared_ptr<ImageCache> cache_;
    std::string memo_path_;
    std::unique_ptr<httplib::Server> server_;
    std::function<void(const std::string&, int)> on_start_callback_;
};

} // namespace memomark
