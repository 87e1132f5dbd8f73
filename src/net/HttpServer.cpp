#include "skybridge/net/HttpServer.hpp"
#include "skybridge/telemetry/TelemetryJson.hpp"

#include <atomic>
#include <chrono>
#include <fstream>
#include <iostream>
#include <sstream>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

namespace asio      = boost::asio;
namespace ssl       = asio::ssl;
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

namespace skybridge {

namespace {

constexpr const char* kServerName = "skybridge";
constexpr const char* kPullPath   = "/api/telemetry";
constexpr const char* kHealthPath = "/api/health";
constexpr const char* kPushPath   = "/ws/telemetry";

constexpr auto kHttpTimeout  = std::chrono::seconds(30);
constexpr auto kCloseGrace   = std::chrono::seconds(1);

using PlainStream = beast::tcp_stream;
using TlsStream   = beast::ssl_stream<beast::tcp_stream>;

template <class Stream> struct is_tls : std::false_type {};
template <> struct is_tls<TlsStream> : std::true_type {};

struct Shared {
    const SnapshotApi& api;
    BroadcastHub&      hub;
    std::string        static_root;
    std::atomic<int>   live_push{0};
};

std::string strip_query(beast::string_view target) {
    const auto q = target.find('?');
    return std::string(target.substr(0, q));
}

template <class Socket>
std::string peer_of(Socket& socket) {
    beast::error_code ec;
    auto ep = socket.remote_endpoint(ec);
    if (ec) return "?";
    std::ostringstream o;
    o << ep;
    return o.str();
}

bool read_file(const std::string& path, std::string& out) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.good()) return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}

http::response<http::string_body>
handle_request(const Shared& shared, const http::request<http::string_body>& req) {
    auto respond = [&req](http::status status, std::string body, const char* type) {
        http::response<http::string_body> res{status, req.version()};
        res.set(http::field::server, kServerName);
        res.set(http::field::content_type, type);
        res.set(http::field::access_control_allow_origin, "*");
        res.set(http::field::cache_control, "no-store");
        res.keep_alive(req.keep_alive());
        res.body() = std::move(body);
        res.prepare_payload();
        return res;
    };

    if (req.method() != http::verb::get) {
        auto res = respond(http::status::method_not_allowed,
                           R"({"error":"method not allowed"})", "application/json");
        res.set(http::field::allow, "GET");
        return res;
    }

    const std::string path = strip_query(req.target());

    if (path == kPullPath) {
        ApiResponse r = shared.api.snapshot();
        return respond(http::int_to_status(r.status), std::move(r.body), "application/json");
    }
    if (path == kHealthPath) {
        ApiResponse r = shared.api.health();
        return respond(http::int_to_status(r.status), std::move(r.body), "application/json");
    }
    if (path == kPushPath) {
        return respond(http::status::upgrade_required,
                       R"({"error":"websocket upgrade required"})", "application/json");
    }
    if ((path == "/" || path == "/index.html") && !shared.static_root.empty()) {
        std::string page;
        if (read_file(shared.static_root + "/index.html", page)) {
            return respond(http::status::ok, std::move(page), "text/html; charset=utf-8");
        }
    }
    return respond(http::status::not_found, R"({"error":"not found"})", "application/json");
}

// ---------------------------------------------------------------------------
// Push session. Owns one hub subscription. The hub only posts "ready" and
// "closed" notifications onto this session's strand; all socket work,
// including draining the queue, happens here, one write in flight at a time.
// ---------------------------------------------------------------------------
template <class Stream>
class WebSocketSession : public std::enable_shared_from_this<WebSocketSession<Stream>> {
public:
    WebSocketSession(Stream&& stream, Shared& shared)
        : ws_(std::move(stream)), shared_(shared) {
        shared_.live_push.fetch_add(1);
    }

    ~WebSocketSession() {
        if (sub_ && !finished_) shared_.hub.unsubscribe(sub_->id());
        shared_.live_push.fetch_sub(1);
    }

    void run(http::request<http::string_body> req) {
        peer_ = peer_of(beast::get_lowest_layer(ws_).socket());

        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator(
            [](websocket::response_type& res) {
                res.set(http::field::server, kServerName);
            }));
        ws_.text(true);

        ws_.async_accept(req,
            beast::bind_front_handler(&WebSocketSession::on_accept, this->shared_from_this()));
    }

private:
    void on_accept(beast::error_code ec) {
        if (ec) {
            std::cout << "[WS] Handshake failed from " << peer_ << ": " << ec.message() << "\n";
            return;
        }

        std::weak_ptr<WebSocketSession> weak = this->shared_from_this();
        auto exec = ws_.get_executor();

        sub_ = shared_.hub.subscribe(
            [weak, exec]() {
                asio::post(exec, [weak]() {
                    if (auto self = weak.lock()) self->drain();
                });
            },
            [weak, exec]() {
                asio::post(exec, [weak]() {
                    if (auto self = weak.lock()) self->on_subscription_closed();
                });
            });

        std::cout << "[WS] Subscriber " << sub_->id() << " connected from " << peer_ << "\n";

        do_read();
    }

    // Client frames are not part of the protocol; reading keeps ping/close
    // handling alive and tells us when the client goes away.
    void do_read() {
        ws_.async_read(in_,
            beast::bind_front_handler(&WebSocketSession::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            finish(ec == websocket::error::closed ? "closed by client" : ec.message());
            return;
        }
        in_.consume(in_.size());
        do_read();
    }

    void drain() {
        if (writing_ || closing_ || finished_ || !sub_) return;

        SnapshotPtr snap = sub_->try_pop();
        if (!snap) return;

        out_ = render_snapshot(*snap, MonoClock::now(), shared_.api.stale_after());
        writing_ = true;
        ws_.async_write(asio::buffer(out_),
            beast::bind_front_handler(&WebSocketSession::on_write, this->shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            finish("send failed: " + ec.message());
            return;
        }
        if (close_pending_) {
            start_close();
            return;
        }
        drain();
    }

    void on_subscription_closed() {
        if (finished_ || !sub_) return;

        switch (sub_->close_reason()) {
        case CloseReason::Overflow: {
            // Slow consumer: drop the connection, pending I/O fails out.
            beast::get_lowest_layer(ws_).close();
            finish("dropped, queue full");
            break;
        }
        case CloseReason::Shutdown:
            if (writing_) close_pending_ = true;
            else          start_close();
            break;
        default:
            break;
        }
    }

    void start_close() {
        if (closing_) return;
        closing_ = true;
        ws_.async_close(websocket::close_code::going_away,
            beast::bind_front_handler(&WebSocketSession::on_close, this->shared_from_this()));
    }

    void on_close(beast::error_code ec) {
        finish(ec ? "close failed: " + ec.message() : std::string("server shutdown"));
    }

    void finish(const std::string& why) {
        if (finished_) return;
        finished_ = true;
        if (!sub_) return;
        shared_.hub.unsubscribe(sub_->id());
        std::cout << "[WS] Subscriber " << sub_->id() << " disconnected (" << why << ")\n";
    }

    websocket::stream<Stream> ws_;
    Shared& shared_;
    std::shared_ptr<Subscription> sub_;
    std::string peer_;

    beast::flat_buffer in_;
    std::string out_;

    bool writing_{false};
    bool closing_{false};
    bool close_pending_{false};
    bool finished_{false};
};

template <class Stream>
class HttpSession : public std::enable_shared_from_this<HttpSession<Stream>> {
public:
    HttpSession(Stream&& stream, Shared& shared)
        : stream_(std::move(stream)), shared_(shared) {}

    void run() {
        if constexpr (is_tls<Stream>::value) {
            beast::get_lowest_layer(stream_).expires_after(kHttpTimeout);
            stream_.async_handshake(ssl::stream_base::server,
                beast::bind_front_handler(&HttpSession::on_handshake, this->shared_from_this()));
        } else {
            asio::dispatch(stream_.get_executor(),
                beast::bind_front_handler(&HttpSession::do_read, this->shared_from_this()));
        }
    }

private:
    void on_handshake(beast::error_code ec) {
        if (ec) return;
        do_read();
    }

    void do_read() {
        req_ = {};
        beast::get_lowest_layer(stream_).expires_after(kHttpTimeout);
        http::async_read(stream_, buffer_, req_,
            beast::bind_front_handler(&HttpSession::on_read, this->shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec == http::error::end_of_stream) {
            do_close();
            return;
        }
        if (ec) return;

        if (websocket::is_upgrade(req_) && strip_query(req_.target()) == kPushPath) {
            std::make_shared<WebSocketSession<Stream>>(std::move(stream_), shared_)
                ->run(std::move(req_));
            return;
        }

        res_ = handle_request(shared_, req_);
        const bool close = res_.need_eof();
        http::async_write(stream_, res_,
            beast::bind_front_handler(&HttpSession::on_write, this->shared_from_this(), close));
    }

    void on_write(bool close, beast::error_code ec, std::size_t) {
        if (ec) return;
        if (close) {
            do_close();
            return;
        }
        do_read();
    }

    void do_close() {
        if constexpr (is_tls<Stream>::value) {
            beast::get_lowest_layer(stream_).expires_after(kHttpTimeout);
            stream_.async_shutdown(
                beast::bind_front_handler(&HttpSession::on_shutdown, this->shared_from_this()));
        } else {
            beast::error_code ec;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    void on_shutdown(beast::error_code) {}

    Stream stream_;
    Shared& shared_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    http::response<http::string_body> res_;
};

class Listener : public std::enable_shared_from_this<Listener> {
public:
    Listener(asio::io_context& ioc, ssl::context* tls, const tcp::endpoint& endpoint, Shared& shared)
        : ioc_(ioc), tls_(tls), acceptor_(asio::make_strand(ioc)), shared_(shared) {
        beast::error_code ec;

        acceptor_.open(endpoint.protocol(), ec);
        if (ec) throw boost::system::system_error(ec, "open");

        acceptor_.set_option(asio::socket_base::reuse_address(true), ec);
        if (ec) throw boost::system::system_error(ec, "set_option");

        acceptor_.bind(endpoint, ec);
        if (ec) throw boost::system::system_error(ec, "bind");

        acceptor_.listen(asio::socket_base::max_listen_connections, ec);
        if (ec) throw boost::system::system_error(ec, "listen");

        port_ = acceptor_.local_endpoint().port();
    }

    void run() { do_accept(); }

    void stop() {
        asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
            beast::error_code ec;
            self->acceptor_.close(ec);
        });
    }

    uint16_t port() const { return port_; }

private:
    void do_accept() {
        acceptor_.async_accept(asio::make_strand(ioc_),
            beast::bind_front_handler(&Listener::on_accept, shared_from_this()));
    }

    void on_accept(beast::error_code ec, tcp::socket socket) {
        if (ec == asio::error::operation_aborted || !acceptor_.is_open()) return;

        if (ec) {
            std::cout << "[HTTP] accept error: " << ec.message() << "\n";
        } else if (tls_) {
            std::make_shared<HttpSession<TlsStream>>(TlsStream(std::move(socket), *tls_), shared_)->run();
        } else {
            std::make_shared<HttpSession<PlainStream>>(PlainStream(std::move(socket)), shared_)->run();
        }

        do_accept();
    }

    asio::io_context& ioc_;
    ssl::context* tls_;
    tcp::acceptor acceptor_;
    Shared& shared_;
    uint16_t port_{0};
};

} // namespace

struct HttpServer::Impl {
    Impl(HttpServerOptions o, const SnapshotApi& api, BroadcastHub& hub)
        : opts(std::move(o)),
          shared{api, hub, opts.static_root},
          tls(ssl::context::tls_server),
          ioc(static_cast<int>(opts.threads)) {}

    // Declaration order matters: sessions queued in ioc reference shared and
    // tls, so those must outlive it.
    HttpServerOptions opts;
    Shared shared;
    ssl::context tls;
    asio::io_context ioc;
    std::shared_ptr<Listener> listener;
    std::vector<std::thread> threads;
    uint16_t port{0};
    bool running{false};
};

HttpServer::HttpServer(HttpServerOptions opts, const SnapshotApi& api, BroadcastHub& hub)
    : impl_(std::make_unique<Impl>(std::move(opts), api, hub)) {}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    Impl& s = *impl_;
    if (s.running) return;

    ssl::context* tls = nullptr;
    if (!s.opts.tls_cert.empty()) {
        s.tls.set_options(ssl::context::default_workarounds |
                          ssl::context::no_sslv2 |
                          ssl::context::no_sslv3 |
                          ssl::context::no_tlsv1 |
                          ssl::context::no_tlsv1_1);
        s.tls.use_certificate_chain_file(s.opts.tls_cert);
        s.tls.use_private_key_file(s.opts.tls_key, ssl::context::pem);
        tls = &s.tls;
    }

    const auto address = asio::ip::make_address(s.opts.address);
    s.listener = std::make_shared<Listener>(s.ioc, tls, tcp::endpoint{address, s.opts.port}, s.shared);
    s.port = s.listener->port();
    s.listener->run();

    const unsigned n = s.opts.threads == 0 ? 1 : s.opts.threads;
    s.threads.reserve(n);
    for (unsigned i = 0; i < n; ++i) {
        s.threads.emplace_back([&s]() {
            for (;;) {
                try {
                    s.ioc.run();
                    break;
                } catch (const std::exception& e) {
                    std::cout << "[HTTP] handler error: " << e.what() << "\n";
                }
            }
        });
    }

    s.running = true;
    std::cout << "[HTTP] Listening on " << s.opts.address << ":" << s.port
              << (tls ? " (tls)" : "") << "\n";
}

void HttpServer::stop() {
    Impl& s = *impl_;
    if (!s.running) return;
    s.running = false;

    s.listener->stop();

    const auto deadline = std::chrono::steady_clock::now() + kCloseGrace;
    while (s.shared.live_push.load() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    s.ioc.stop();
    for (auto& t : s.threads) {
        if (t.joinable()) t.join();
    }
    s.threads.clear();
    std::cout << "[HTTP] Stopped\n";
}

uint16_t HttpServer::port() const {
    return impl_->port;
}

} // namespace skybridge
