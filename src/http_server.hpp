// http_server.hpp - minimal HTTP/1.1 endpoint serving the ContentStore
// Built on GIO's GThreadedSocketService; one worker thread per connection.

#ifndef PROMFILE_HTTP_SERVER_HPP
#define PROMFILE_HTTP_SERVER_HPP

#include "content_store.hpp"

#include <gio/gio.h>

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace promfile {

struct HttpResponse {
    int status = 200;
    std::string reason = "OK";
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
    bool include_body = true;   // false for HEAD and bodiless statuses

    // Status line, headers and (unless excluded) the body, ready to write
    std::string serialize() const;
};

class HttpServer {
public:
    static constexpr const char* CONTENT_TYPE = "text/plain; version=0.0.4; charset=utf-8";

    HttpServer(const ContentStore& store, std::string endpoint_path);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Binds `address`:`port` (port 0 picks a free one) and starts serving
    bool start(const std::string& address, int port, GError** error);

    // Stops accepting and waits for connections already being handled
    void stop();

    bool is_running() const { return service_ != nullptr; }

    // Port actually bound, 0 when not running
    int port() const { return bound_port_; }

    // Builds the reply for one parsed request
    HttpResponse respond(const std::string& method,
                         const std::string& target,
                         const std::string& if_none_match) const;

private:
    // Tracks connection handlers; outlives the server while a worker
    // thread still holds the signal closure.
    struct ConnectionGate {
        std::mutex mutex;
        std::condition_variable idle;
        HttpServer* server = nullptr;   // null once stopped
        int active = 0;
    };

    static gboolean on_run(GThreadedSocketService* service,
                           GSocketConnection* connection,
                           GObject* source_object,
                           gpointer user_data);

    static void release_gate(gpointer data, GClosure* closure);

    void handle_connection(GSocketConnection* connection);

    const ContentStore& store_;
    const std::string endpoint_path_;

    GMainContext* context_ = nullptr;
    GMainLoop* loop_ = nullptr;
    GSocketService* service_ = nullptr;
    std::thread loop_thread_;
    std::shared_ptr<ConnectionGate> gate_;
    gulong run_handler_ = 0;
    GCancellable* requests_cancel_ = nullptr;   // aborts reads and writes of handlers on stop()
    int bound_port_ = 0;
};

} // namespace promfile

#endif // PROMFILE_HTTP_SERVER_HPP
