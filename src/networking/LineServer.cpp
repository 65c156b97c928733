#include "networking/LineServer.h"

#include "util/Log.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/strand.hpp>
#include <boost/asio/write.hpp>

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace meshirc::networking {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;
using error_code = boost::system::error_code;

class LineServer::Impl {
public:
    Impl(asio::io_context& ioc, const std::string& address, unsigned short port)
        : ioc_(ioc),
          acceptor_(ioc) {
        tcp::endpoint endpoint(asio::ip::make_address(address), port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::socket_base::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
    }

    void start() { do_accept(); }

    void stop() {
        error_code ec;
        acceptor_.close(ec);

        // Close all connections
        std::lock_guard<std::mutex> lk(mu_);
        for (auto& [id, c] : connections_) {
            c->close();
        }
        connections_.clear();
    }

    void send(ClientId client, const std::string& line) {
        if (auto c = find(client)) c->send(line);
    }

    void close(ClientId client) {
        if (auto c = find(client)) c->close();
    }

    void set_on_connect(OnConnect cb) { on_connect_ = std::move(cb); }
    void set_on_disconnect(OnDisconnect cb) { on_disconnect_ = std::move(cb); }
    void set_on_line(OnLine cb) { on_line_ = std::move(cb); }

private:
    class Connection : public std::enable_shared_from_this<Connection> {
    public:
        Connection(Impl& server, tcp::socket socket, ClientId id)
            : server_(server),
              id_(id),
              socket_(std::move(socket)),
              strand_(asio::make_strand(server_.ioc_)) {}

        ClientId id() const { return id_; }

        void start() {
            error_code ec;
            auto remote = socket_.remote_endpoint(ec);
            host_ = ec ? std::string("unknown") : remote.address().to_string();

            asio::post(
                strand_,
                [self = shared_from_this()] {
                    if (self->server_.on_connect_) self->server_.on_connect_(self->id_, self->host_);
                    self->do_read();
                });
        }

        void send(const std::string& line) {
            asio::post(
                strand_,
                [self = shared_from_this(), msg = line + "\r\n"] {
                    if (self->closed_ || self->closing_) return;
                    bool writing = !self->write_queue_.empty();
                    self->write_queue_.push_back(msg);
                    if (!writing) self->do_write();
                });
        }

        // Graceful: lets queued lines drain first.
        void close() {
            asio::post(
                strand_,
                [self = shared_from_this()] {
                    self->closing_ = true;
                    if (self->write_queue_.empty()) self->shutdown();
                });
        }

    private:
        void do_read() {
            asio::async_read_until(
                socket_,
                asio::dynamic_buffer(inbuf_, kMaxLineBytes),
                '\n',
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](error_code ec, std::size_t n) {
                        // not_found here means the peer overflowed kMaxLineBytes without a newline.
                        if (ec) return self->on_close_or_fail(ec);

                        std::string line = self->inbuf_.substr(0, n);
                        self->inbuf_.erase(0, n);
                        while (!line.empty() && (line.back() == '\n' || line.back() == '\r')) line.pop_back();

                        if (self->server_.on_line_ && !self->closing_) self->server_.on_line_(self->id_, line);

                        self->do_read();
                    }));
        }

        void do_write() {
            asio::async_write(
                socket_,
                asio::buffer(write_queue_.front()),
                asio::bind_executor(
                    strand_,
                    [self = shared_from_this()](error_code ec, std::size_t) {
                        if (ec) return self->on_close_or_fail(ec);

                        self->write_queue_.pop_front();
                        if (!self->write_queue_.empty()) return self->do_write();
                        if (self->closing_) self->shutdown();
                    }));
        }

        void shutdown() {
            error_code ec;
            socket_.shutdown(tcp::socket::shutdown_both, ec);
            socket_.close(ec);
        }

        void on_close_or_fail(error_code ec) {
            if (closed_) return;
            closed_ = true;

            // EOF and aborted reads are the normal ways a connection ends.
            if (ec != asio::error::eof && ec != asio::error::operation_aborted &&
                ec != asio::error::connection_reset) {
                fail("io", ec);
            }
            shutdown();
            server_.remove_connection(id_);
            if (server_.on_disconnect_) server_.on_disconnect_(id_);
        }

        void fail(const char* what, error_code ec) {
            util::log_warning("Session " + std::to_string(id_)) << what << ": " << ec.message();
        }

        Impl& server_;
        ClientId id_;
        std::string host_;

        tcp::socket socket_;
        // Use the io_context executor type for compatibility with older Boost.Asio.
        asio::strand<asio::io_context::executor_type> strand_;

        std::string inbuf_;
        std::deque<std::string> write_queue_;
        bool closing_ = false;
        bool closed_ = false;
    };

    std::shared_ptr<Connection> find(ClientId id) {
        std::lock_guard<std::mutex> lk(mu_);
        auto it = connections_.find(id);
        if (it == connections_.end()) return nullptr;
        return it->second;
    }

    void do_accept() {
        acceptor_.async_accept(
            [this](error_code ec, tcp::socket socket) {
                if (ec) {
                    // If acceptor closed during shutdown, ignore.
                    if (ec == asio::error::operation_aborted) return;
                    util::log_error("accept") << ec.message();
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

    std::mutex mu_;
    std::unordered_map<ClientId, std::shared_ptr<Connection>> connections_;

    OnConnect on_connect_;
    OnDisconnect on_disconnect_;
    OnLine on_line_;
};

// ---- LineServer wrapper ----

LineServer::LineServer(asio::io_context& ioc, const std::string& address, unsigned short port)
    : impl_(new Impl(ioc, address, port)) {}

void LineServer::set_on_connect(OnConnect cb) { impl_->set_on_connect(std::move(cb)); }
void LineServer::set_on_disconnect(OnDisconnect cb) { impl_->set_on_disconnect(std::move(cb)); }
void LineServer::set_on_line(OnLine cb) { impl_->set_on_line(std::move(cb)); }

void LineServer::start() { impl_->start(); }
void LineServer::stop() { impl_->stop(); }

void LineServer::send(ClientId client, const std::string& line) { impl_->send(client, line); }
void LineServer::close(ClientId client) { impl_->close(client); }

LineServer::~LineServer() = default;

} // namespace meshirc::networking
