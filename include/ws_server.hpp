#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

namespace ykmon::server {

// HTTP and WebSocket on one port. Upgrade requests for the configured path become
// push sessions; every other request is answered by the HTTP handler.
class WsServer {
public:
    using SessionId = std::uint64_t;
    using OpenHandler = std::function<void(SessionId)>;
    using CloseHandler = std::function<void(SessionId)>;

    struct HttpRequest {
        std::string method;
        std::string target;
    };

    struct HttpReply {
        unsigned status{200};
        std::string body;
    };

    using HttpHandler = std::function<HttpReply(const HttpRequest&)>;

    explicit WsServer(boost::asio::io_context& io_context);
    ~WsServer();

    WsServer(const WsServer&) = delete;
    WsServer& operator=(const WsServer&) = delete;

    void set_open_handler(OpenHandler handler);
    void set_close_handler(CloseHandler handler);
    void set_http_handler(HttpHandler handler);

    void start(const std::string& host, std::uint16_t port, std::string ws_path);
    void stop();

    // Queues a text frame. Returns false when the session no longer exists.
    bool send(SessionId session_id, const std::string& text);

    std::uint16_t local_port() const;
    std::size_t session_count() const;

private:
    class HttpSession;
    class WebSocketSession;

    void do_accept();
    void register_session(SessionId session_id, const std::shared_ptr<WebSocketSession>& session);
    void unregister_session(SessionId session_id);
    HttpReply handle_http(const HttpRequest& request) const;

    boost::asio::io_context& io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    std::string ws_path_{"/ws"};
    std::atomic_bool running_{false};
    std::atomic_uint64_t next_session_id_{0};

    OpenHandler open_handler_;
    CloseHandler close_handler_;
    HttpHandler http_handler_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<SessionId, std::weak_ptr<WebSocketSession>> sessions_;
};

}  // namespace ykmon::server
