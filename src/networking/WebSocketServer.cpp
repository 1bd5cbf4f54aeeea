#include "WebSocketServer.h"

#include "logging/Log.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace deskpool::networking {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace asio = boost::asio;
using tcp = asio::ip::tcp;

namespace {

constexpr std::size_t kMaxMessageBytes = 1 << 20;
constexpr std::size_t kMaxQueuedMessages = 256;

} // namespace

class WebSocketServer::Impl {
public:
    Impl(asio::io_context& ioc, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc, tcp::endpoint(tcp::v4(), port)) {}

    void start() {
        logging::info("Server") << "listening on port " << port();
        do_accept();
    }

    void stop() {
        beast::error_code ec;
        acceptor_.close(ec);
        if (ec) logging::debug("Server") << "acceptor close: " << ec.message();

        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, c] : connections_) {
            c->close();
        }
        connections_.clear();
    }

    unsigned short port() const {
        beast::error_code ec;
        const auto ep = acceptor_.local_endpoint(ec);
        return ec ? 0 : ep.port();
    }

    std::size_t client_count() const {
        std::lock_guard<std::mutex> lk(mu_);
        return connections_.size();
    }

    void send(ClientId client, const std::string& msg) {
        std::shared_ptr<class Connection> c;
        {
            std::lock_guard<std::mutex> lk(mu_);
            auto it = connections_.find(client);
            if (it == connections_.end()) return;
            c = it->second;
        }
        c->send(msg);
    }

    void broadcast(const std::string& msg) {
        std::vector<std::shared_ptr<class Connection>> targets;
        {
            std::lock_guard<std::mutex> lk(mu_);
            targets.reserve(connections_.size());
            for (auto& [id, c] : connections_) targets.push_back(c);
        }
        auto shared = std::make_shared<const std::string>(msg);
        for (auto& c : targets) c->send(shared);
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_message(OnMessage cb) { on_message_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              ws_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        ClientId id() const { return id_; }

        void start() {
            ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
            ws_.read_message_max(kMaxMessageBytes);

            ws_.async_accept(
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec) {
                        if (ec) {
                            self->fail("accept", ec);
                            return self->server_.remove_connection(self->id_);
                        }

                        logging::debug("Server") << "client " << self->id_ << " connected";
                        if (self->server_.on_connect_) self->server_.on_connect_(self->id_);
                        self->do_read();
                    }));
        }

        void send(const std::string& msg) {
            send(std::make_shared<const std::string>(msg));
        }

        void send(std::shared_ptr<const std::string> msg) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg = std::move(msg)] {
                    if (self->write_queue_.size() >= kMaxQueuedMessages) {
                        logging::warn("Server") << "client " << self->id_ << " is not reading, dropping message";
                        return;
                    }
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    // Pending reads and writes complete with operation_aborted.
                    beast::get_lowest_layer(self->ws_).close();
                });
        }

    private:
        void do_read() {
            ws_.async_read(
                buffer_,
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        std::string msg = beast::buffers_to_string(self->buffer_.data());
                        self->buffer_.consume(self->buffer_.size());

                        if (self->server_.on_message_) self->server_.on_message_(self->id_, msg);

                        self->do_read();
                    }));
        }

        void do_write() {
            ws_.text(true);
            ws_.async_write(
                asio::buffer(*write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](beast::error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) self->do_write();
                    }));
        }

        void on_close_or_fail(beast::error_code ec) {
            if (closed_) return;
            closed_ = true;

            if (ec != websocket::error::closed && ec != asio::error::operation_aborted) {
                fail("io", ec);
            }
            logging::debug("Server") << "client " << id_ << " disconnected";
            server_.remove_connection(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, beast::error_code ec) {
            logging::warn("Server") << "client " << id_ << " " << what << ": " << ec.message();
        }

        Impl& server_;
        ClientId id_;

        websocket::stream<beast::tcp_stream> ws_;
        asio::strand<asio::io_context::executor_type> strand_;

        beast::flat_buffer buffer_;
        std::deque<std::shared_ptr<const std::string>> write_queue_;
        bool closed_ = false;
    };

    void do_accept() {
        acceptor_.async_accept(
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (ec == asio::error::operation_aborted) return;
                    logging::warn("Server") << "accept: " << ec.message();
                    return do_accept();
                }

                auto id = next_client_id_++;
                auto connection = std::make_shared<Connection>(*this, std::move(socket), id);

                {
                    std::lock_guard<std::mutex> lk(mu_);
                    connections_[id] = connection;
                }

                connection->start();
                do_accept();
            });
    }

    void remove_connection(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        connections_.erase(id);
    }

private:
    asio::io_context& ioc_;
    tcp::acceptor acceptor_;

    std::atomic<ClientId> next_client_id_{1};

    mutable std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnMessage on_message_;
};

// ---- WebSocketServer wrapper ----

WebSocketServer::WebSocketServer(asio::io_context& ioc, unsigned short port)
    : impl_(new Impl(ioc, port)) {}

void WebSocketServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void WebSocketServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void WebSocketServer::set_on_message(OnMessage cb) { impl_->set_on_message(std::move(cb)); }

void WebSocketServer::start() { impl_->start(); }
void WebSocketServer::stop() { impl_->stop(); }

unsigned short WebSocketServer::port() const { return impl_->port(); }
std::size_t WebSocketServer::client_count() const { return impl_->client_count(); }

void WebSocketServer::send(ClientId client, const std::string& msg) { impl_->send(client, msg); }
void WebSocketServer::broadcast(const std::string& msg) { impl_->broadcast(msg); }

WebSocketServer::~WebSocketServer() = default;

} // namespace deskpool::networking
