#pragma once

#include "networking/Transport.h"

#include <boost/asio/io_context.hpp>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace meshirc::networking {

// Plain TCP server speaking newline-delimited text (CRLF or LF).
class LineServer : public Transport {
public:
    static constexpr std::size_t kMaxLineBytes = 4096;

    using OnConnect    = std::function<void(ClientId, const std::string& host)>;
    using OnDisconnect = std::function<void(ClientId)>;
    using OnLine       = std::function<void(ClientId, const std::string&)>;

    LineServer(boost::asio::io_context& ioc, const std::string& address, unsigned short port);
    ~LineServer() override;

    LineServer(const LineServer&) = delete;
    LineServer& operator=(const LineServer&) = delete;

    void set_on_connect(OnConnect cb);
    void set_on_disconnect(OnDisconnect cb);
    void set_on_line(OnLine cb);

    void start();  // start accepting
    void stop();   // stop accepting + close active sessions

    void send(ClientId client, const std::string& line) override;
    void close(ClientId client) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace meshirc::networking
