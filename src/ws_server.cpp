#include "ws_server.hpp"

#include <chrono>
#include <deque>
#include <utility>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

#include "util/logging.hpp"

namespace ykmon::server {

namespace {
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

constexpr const char* kServerName = "yubikey-monitor";
constexpr auto kHttpReadTimeout = std::chrono::seconds(30);

std::string path_of(const std::string& target) {
    return target.substr(0, target.find('?'));
}

std::string error_body(const std::string& message) {
    return nlohmann::json{{"success", false}, {"error", message}}.dump();
}
}  // namespace

class WsServer::WebSocketSession : public std::enable_shared_from_this<WebSocketSession> {
public:
    WebSocketSession(WsServer& server, SessionId id, tcp::socket&& socket)
        : server_(server), id_(id), ws_(std::move(socket)) {}

    void run(http::request<http::string_body> request) {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));
        ws_.async_accept(request, beast::bind_front_handler(&WebSocketSession::on_accept, shared_from_this()));
    }

    void send(std::shared_ptr<const std::string> text) {
        asio::post(ws_.get_executor(), [self = shared_from_this(), text = std::move(text)]() mutable {
            self->queue_write(std::move(text));
        });
    }

    void close() {
        asio::post(ws_.get_executor(), [self = shared_from_this()]() {
            beast::get_lowest_layer(self->ws_).close();
        });
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            util::log::warn("WebSocket handshake failed: " + ec.message());
            return;
        }
        server_.register_session(id_, shared_from_this());
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WebSocketSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            finish(ec);
            return;
        }
        // Subscribers only listen; inbound frames are dropped.
        buffer_.consume(buffer_.size());
        do_read();
    }

    void queue_write(std::shared_ptr<const std::string> text) {
        if (closed_) {
            return;
        }
        queue_.push_back(std::move(text));
        if (queue_.size() > 1) {
            return;
        }
        do_write();
    }

    void do_write() {
        ws_.text(true);
        ws_.async_write(asio::buffer(*queue_.front()),
                        beast::bind_front_handler(&WebSocketSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        if (ec) {
            finish(ec);
            return;
        }
        queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        }
    }

    void finish(beast::error_code ec) {
        if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
            util::log::debug("WebSocket session " + std::to_string(id_) + " ended: " + ec.message());
        }
        if (closed_) {
            return;
        }
        closed_ = true;
        queue_.clear();
        server_.unregister_session(id_);
    }

    WsServer& server_;
    const SessionId id_;
    websocket::stream<beast::tcp_stream> ws_;
    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> queue_;
    bool closed_{false};
};

class WsServer::HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(WsServer& server, tcp::socket&& socket) : server_(server), stream_(std::move(socket)) {}

    void run() {
        asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        request_ = {};
        stream_.expires_after(kHttpReadTimeout);
        http::async_read(stream_, buffer_, request_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            shutdown();
            return;
        }
        if (ec) {
            util::log::debug("HTTP read failed: " + ec.message());
            return;
        }

        const std::string target(request_.target().data(), request_.target().size());
        if (websocket::is_upgrade(request_)) {
            if (path_of(target) != server_.ws_path_) {
                write_reply(HttpReply{404, error_body("Not found")});
                return;
            }
            stream_.expires_never();
            const auto session_id = ++server_.next_session_id_;
            std::make_shared<WebSocketSession>(server_, session_id, stream_.release_socket())
                ->run(std::move(request_));
            return;
        }

        const std::string method(request_.method_string().data(), request_.method_string().size());
        write_reply(server_.handle_http(HttpRequest{method, target}));
    }

    void write_reply(const HttpReply& reply) {
        auto response =
            std::make_shared<http::response<http::string_body>>(static_cast<http::status>(reply.status),
                                                                request_.version());
        response->set(http::field::server, kServerName);
        response->set(http::field::content_type, "application/json");
        response->set(http::field::access_control_allow_origin, "*");
        response->set(http::field::access_control_allow_methods, "GET, POST, OPTIONS");
        response->set(http::field::access_control_allow_headers, "Content-Type");
        response->keep_alive(request_.keep_alive());
        if (reply.status != 204 && reply.status != 304) {
            response->body() = reply.body;
        }
        response->prepare_payload();

        http::async_write(stream_, *response,
                          [self = shared_from_this(), response](beast::error_code ec, std::size_t) {
                              self->on_write(response->need_eof(), ec);
                          });
    }

    void on_write(bool close, beast::error_code ec) {
        if (ec) {
            util::log::debug("HTTP write failed: " + ec.message());
            return;
        }
        if (close) {
            shutdown();
            return;
        }
        do_read();
    }

    void shutdown() {
        beast::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    WsServer& server_;
    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
};

WsServer::WsServer(boost::asio::io_context& io_context)
    : io_context_(io_context), acceptor_(asio::make_strand(io_context)) {}

WsServer::~WsServer() {
    stop();
}

void WsServer::set_open_handler(OpenHandler handler) {
    open_handler_ = std::move(handler);
}

void WsServer::set_close_handler(CloseHandler handler) {
    close_handler_ = std::move(handler);
}

void WsServer::set_http_handler(HttpHandler handler) {
    http_handler_ = std::move(handler);
}

void WsServer::start(const std::string& host, std::uint16_t port, std::string ws_path) {
    ws_path_ = std::move(ws_path);
    const tcp::endpoint endpoint(asio::ip::make_address(host), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(asio::socket_base::max_listen_connections);
    running_ = true;
    util::log::info("Listening on " + host + ":" + std::to_string(local_port()) + " (WebSocket path " + ws_path_ +
                    ")");
    do_accept();
}

void WsServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    asio::post(acceptor_.get_executor(), [this]() {
        beast::error_code ec;
        acceptor_.close(ec);
    });

    std::vector<std::shared_ptr<WebSocketSession>> open_sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [id, weak] : sessions_) {
            (void)id;
            if (auto session = weak.lock()) {
                open_sessions.push_back(std::move(session));
            }
        }
    }
    for (const auto& session : open_sessions) {
        session->close();
    }
}

void WsServer::do_accept() {
    acceptor_.async_accept(asio::make_strand(io_context_), [this](beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted) {
            return;
        }
        if (ec) {
            util::log::warn("Accept failed: " + ec.message());
        } else {
            std::make_shared<HttpSession>(*this, std::move(socket))->run();
        }
        if (running_) {
            do_accept();
        }
    });
}

bool WsServer::send(SessionId session_id, const std::string& text) {
    std::shared_ptr<WebSocketSession> session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(session_id);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second.lock();
    }
    if (!session) {
        return false;
    }
    session->send(std::make_shared<const std::string>(text));
    return true;
}

std::uint16_t WsServer::local_port() const {
    beast::error_code ec;
    const auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

std::size_t WsServer::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void WsServer::register_session(SessionId session_id, const std::shared_ptr<WebSocketSession>& session) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_[session_id] = session;
    }
    if (open_handler_) {
        open_handler_(session_id);
    }
}

void WsServer::unregister_session(SessionId session_id) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        removed = sessions_.erase(session_id) > 0;
    }
    if (removed && close_handler_) {
        close_handler_(session_id);
    }
}

WsServer::HttpReply WsServer::handle_http(const HttpRequest& request) const {
    if (!http_handler_) {
        return HttpReply{404, error_body("Not found")};
    }
    try {
        return http_handler_(request);
    } catch (const std::exception& ex) {
        util::log::error("HTTP handler failed for " + request.method + " " + request.target + ": " + ex.what());
        return HttpReply{500, error_body(ex.what())};
    }
}

}  // namespace ykmon::server
