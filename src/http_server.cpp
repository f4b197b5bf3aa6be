// http_server.cpp - HTTP endpoint implementation

#include "http_server.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <sstream>
#include <system_error>

namespace promfile {

namespace {

constexpr int MAX_WORKER_THREADS = 16;
constexpr guint SOCKET_TIMEOUT_SECONDS = 10;
constexpr guint DRAIN_TIMEOUT_SECONDS = 1;
constexpr size_t MAX_HEADER_LINES = 100;
constexpr gsize MAX_LINE_LENGTH = 8192;      // terminator included
constexpr gsize MAX_DRAIN_BYTES = 64 * 1024;

enum class LineStatus {
    Ok,
    TooLong,
    Closed      // EOF, timeout, cancellation or read error
};

// Reads one '\n'-terminated line without ever buffering more than
// MAX_LINE_LENGTH bytes of it. A trailing '\r' is dropped.
LineStatus read_line(GBufferedInputStream* stream, std::string& line,
                     GCancellable* cancellable, GError** error) {
    while (true) {
        gsize available = 0;
        const char* data = static_cast<const char*>(g_buffered_input_stream_peek_buffer(stream, &available));
        const char* newline = available > 0 ? static_cast<const char*>(memchr(data, '\n', available)) : nullptr;

        if (newline) {
            gsize consumed = static_cast<gsize>(newline - data) + 1;
            if (consumed > MAX_LINE_LENGTH) {
                return LineStatus::TooLong;
            }
            line.assign(data, consumed - 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            if (g_input_stream_skip(G_INPUT_STREAM(stream), consumed, cancellable, error) < 0) {
                return LineStatus::Closed;
            }
            return LineStatus::Ok;
        }

        if (available >= MAX_LINE_LENGTH) {
            return LineStatus::TooLong;
        }
        if (g_buffered_input_stream_fill(stream, -1, cancellable, error) <= 0) {
            return LineStatus::Closed;
        }
    }
}

// Half-closes and discards what the client is still sending, so that closing
// with unread input does not reset the connection before the reply arrives.
void drain_input(GSocketConnection* connection, GCancellable* cancellable) {
    GSocket* socket = g_socket_connection_get_socket(connection);
    g_socket_set_timeout(socket, DRAIN_TIMEOUT_SECONDS);
    if (!g_socket_shutdown(socket, FALSE, TRUE, nullptr)) {
        return;
    }

    GInputStream* input = g_io_stream_get_input_stream(G_IO_STREAM(connection));
    char discard[4096];
    gsize total = 0;
    while (total < MAX_DRAIN_BYTES) {
        gssize n = g_input_stream_read(input, discard, sizeof(discard), cancellable, nullptr);
        if (n <= 0) {
            break;
        }
        total += static_cast<gsize>(n);
    }
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

HttpResponse plain_response(int status, const std::string& reason, const std::string& body) {
    HttpResponse response;
    response.status = status;
    response.reason = reason;
    response.body = body;
    response.headers.emplace_back("Content-Type", "text/plain; charset=utf-8");
    return response;
}

} // namespace

std::string HttpResponse::serialize() const {
    std::ostringstream out;
    out << "HTTP/1.1 " << status << " " << reason << "\r\n";
    for (const auto& [name, value] : headers) {
        out << name << ": " << value << "\r\n";
    }
    out << "Content-Length: " << body.size() << "\r\n";
    out << "Connection: close\r\n\r\n";
    if (include_body) {
        out << body;
    }
    return out.str();
}

HttpServer::HttpServer(const ContentStore& store, std::string endpoint_path)
    : store_(store)
    , endpoint_path_(std::move(endpoint_path)) {
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start(const std::string& address, int port, GError** error) {
    if (service_) {
        return true;
    }

    GSocketAddress* socket_address = g_inet_socket_address_new_from_string(address.c_str(), static_cast<guint>(port));
    if (!socket_address) {
        g_set_error(error, G_IO_ERROR, G_IO_ERROR_INVALID_ARGUMENT,
                    "invalid listen address: %s", address.c_str());
        Logger::error("[HttpServer] Invalid listen address: " + address);
        return false;
    }

    context_ = g_main_context_new();
    loop_ = g_main_loop_new(context_, FALSE);

    // The service dispatches accepts on the thread-default context at start
    g_main_context_push_thread_default(context_);
    service_ = g_threaded_socket_service_new(MAX_WORKER_THREADS);

    GSocketAddress* effective_address = nullptr;
    gboolean added = g_socket_listener_add_address(G_SOCKET_LISTENER(service_),
                                                   socket_address,
                                                   G_SOCKET_TYPE_STREAM,
                                                   G_SOCKET_PROTOCOL_TCP,
                                                   nullptr,
                                                   &effective_address,
                                                   error);
    g_object_unref(socket_address);

    if (!added) {
        g_main_context_pop_thread_default(context_);
        Logger::error("[HttpServer] Failed to bind " + address + ":" + std::to_string(port));
        stop();
        return false;
    }

    bound_port_ = g_inet_socket_address_get_port(G_INET_SOCKET_ADDRESS(effective_address));
    g_object_unref(effective_address);

    requests_cancel_ = g_cancellable_new();
    gate_ = std::make_shared<ConnectionGate>();
    gate_->server = this;
    run_handler_ = g_signal_connect_data(service_, "run", G_CALLBACK(on_run),
                                         new std::shared_ptr<ConnectionGate>(gate_),
                                         release_gate, static_cast<GConnectFlags>(0));
    g_socket_service_start(service_);
    g_main_context_pop_thread_default(context_);

    try {
        loop_thread_ = std::thread([this]() {
            g_main_context_push_thread_default(context_);
            g_main_loop_run(loop_);
            g_main_context_pop_thread_default(context_);
        });
    } catch (const std::system_error& e) {
        g_set_error(error, G_IO_ERROR, G_IO_ERROR_FAILED,
                    "failed to start HTTP loop thread: %s", e.what());
        Logger::error("[HttpServer] Failed to create loop thread: " + std::string(e.what()));
        stop();
        return false;
    }

    Logger::info("[HttpServer] Serving " + endpoint_path_ + " on " + address + ":" + std::to_string(bound_port_));
    return true;
}

void HttpServer::stop() {
    if (service_) {
        g_socket_service_stop(service_);
        g_socket_listener_close(G_SOCKET_LISTENER(service_));
    }

    // Worker threads may still be inside handle_connection(): refuse new
    // ones, abort blocked reads and wait for the rest to return
    if (gate_) {
        if (requests_cancel_) {
            g_cancellable_cancel(requests_cancel_);
        }
        std::unique_lock<std::mutex> lock(gate_->mutex);
        gate_->server = nullptr;
        gate_->idle.wait(lock, [this] { return gate_->active == 0; });
    }
    if (service_ && run_handler_ != 0) {
        g_signal_handler_disconnect(service_, run_handler_);
        run_handler_ = 0;
    }
    gate_.reset();
    if (requests_cancel_) {
        g_object_unref(requests_cancel_);
        requests_cancel_ = nullptr;
    }

    if (loop_) {
        g_main_loop_quit(loop_);
    }
    if (loop_thread_.joinable()) {
        loop_thread_.join();
    }

    if (service_) {
        g_object_unref(service_);
        service_ = nullptr;
        Logger::info("[HttpServer] Stopped");
    }
    if (loop_) {
        g_main_loop_unref(loop_);
        loop_ = nullptr;
    }
    if (context_) {
        g_main_context_unref(context_);
        context_ = nullptr;
    }
    bound_port_ = 0;
}

HttpResponse HttpServer::respond(const std::string& method,
                                 const std::string& target,
                                 const std::string& if_none_match) const {
    std::string path = target.substr(0, target.find('?'));

    if (path != endpoint_path_) {
        return plain_response(404, "Not Found", "not found\n");
    }

    if (method != "GET" && method != "HEAD") {
        HttpResponse response = plain_response(405, "Method Not Allowed", "method not allowed\n");
        response.headers.emplace_back("Allow", "GET, HEAD");
        return response;
    }

    ContentStore::Snapshot snap = store_.snapshot();
    if (!snap.data) {
        return plain_response(503, "Service Unavailable", "content not loaded yet\n");
    }

    std::string etag = "\"" + snap.digest + "\"";

    HttpResponse response;
    if (!snap.digest.empty() && trim(if_none_match) == etag) {
        response.status = 304;
        response.reason = "Not Modified";
        response.include_body = false;
        response.headers.emplace_back("ETag", etag);
        return response;
    }

    response.headers.emplace_back("Content-Type", CONTENT_TYPE);
    if (!snap.digest.empty()) {
        response.headers.emplace_back("ETag", etag);
    }
    response.body = *snap.data;
    response.include_body = method != "HEAD";
    return response;
}

gboolean HttpServer::on_run(GThreadedSocketService* /*service*/,
                            GSocketConnection* connection,
                            GObject* /*source_object*/,
                            gpointer user_data) {
    // Own reference: the closure data may be released once the handler is disconnected
    std::shared_ptr<ConnectionGate> gate = *static_cast<std::shared_ptr<ConnectionGate>*>(user_data);

    HttpServer* server = nullptr;
    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        server = gate->server;
        if (!server) {
            return TRUE;  // stopping; the connection is just closed
        }
        gate->active++;
    }

    server->handle_connection(connection);

    std::lock_guard<std::mutex> lock(gate->mutex);
    if (--gate->active == 0) {
        gate->idle.notify_all();
    }
    return TRUE;
}

void HttpServer::release_gate(gpointer data, GClosure* /*closure*/) {
    delete static_cast<std::shared_ptr<ConnectionGate>*>(data);
}

void HttpServer::handle_connection(GSocketConnection* connection) {
    g_socket_set_timeout(g_socket_connection_get_socket(connection), SOCKET_TIMEOUT_SECONDS);

    GInputStream* input = g_io_stream_get_input_stream(G_IO_STREAM(connection));
    GOutputStream* output = g_io_stream_get_output_stream(G_IO_STREAM(connection));

    // One byte of room beyond the line limit keeps fill() able to make progress
    GInputStream* buffered = g_buffered_input_stream_new_sized(input, MAX_LINE_LENGTH + 1);
    g_filter_input_stream_set_close_base_stream(G_FILTER_INPUT_STREAM(buffered), FALSE);
    GBufferedInputStream* reader = G_BUFFERED_INPUT_STREAM(buffered);

    HttpResponse response;
    GError* error = nullptr;

    std::string request_line;
    LineStatus status = read_line(reader, request_line, requests_cancel_, &error);
    if (status == LineStatus::Closed) {
        if (error) {
            Logger::debug("[HttpServer] Failed to read request: " + std::string(error->message));
            g_clear_error(&error);
        }
        g_object_unref(buffered);
        return;
    }

    std::string method;
    std::string target;
    std::string version;
    if (status == LineStatus::Ok) {
        std::istringstream parts(request_line);
        parts >> method >> target >> version;
    }
    bool malformed = status == LineStatus::TooLong || method.empty() || target.empty() ||
                     version.compare(0, 5, "HTTP/") != 0;

    // Headers up to the empty line; only If-None-Match matters here
    std::string if_none_match;
    bool closed = false;
    for (size_t count = 0; !malformed; ++count) {
        std::string header;
        status = read_line(reader, header, requests_cancel_, &error);
        if (status == LineStatus::Closed) {
            closed = true;
            break;
        }
        if (status == LineStatus::TooLong) {
            malformed = true;
            break;
        }
        if (header.empty()) {
            break;
        }
        if (count >= MAX_HEADER_LINES) {
            malformed = true;
            break;
        }

        size_t colon = header.find(':');
        if (colon != std::string::npos && to_lower(trim(header.substr(0, colon))) == "if-none-match") {
            if_none_match = trim(header.substr(colon + 1));
        }
    }
    if (error) {
        Logger::debug("[HttpServer] Failed to read headers: " + std::string(error->message));
        g_clear_error(&error);
    }
    g_object_unref(buffered);

    // Client gone, timed out, or the server is stopping
    if (closed) {
        return;
    }

    if (malformed) {
        response = plain_response(400, "Bad Request", "bad request\n");
    } else {
        response = respond(method, target, if_none_match);
    }

    Logger::debug("[HttpServer] " + (method.empty() ? std::string("-") : method) + " " + target + " -> " +
                  std::to_string(response.status));

    std::string payload = response.serialize();
    if (!g_output_stream_write_all(output, payload.data(), payload.size(), nullptr, requests_cancel_, &error)) {
        Logger::warn("[HttpServer] Failed to write response: " + std::string(error ? error->message : "unknown error"));
        g_clear_error(&error);
        return;
    }

    if (malformed) {
        drain_input(connection, requests_cancel_);
    }
}

} // namespace promfile
