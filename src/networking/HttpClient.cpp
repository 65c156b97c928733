#include "networking/HttpClient.h"

#include "util/Log.hpp"
#include "util/Strings.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <cctype>
#include <functional>
#include <stdexcept>
#include <utility>

namespace meshirc::networking {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace ssl = asio::ssl;
using tcp = asio::ip::tcp;
using error_code = boost::system::error_code;

Url parse_url(const std::string& url) {
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string::npos) throw std::invalid_argument("URL has no scheme: " + url);

    Url out;
    out.scheme = util::to_lower(url.substr(0, scheme_end));
    if (out.scheme != "http" && out.scheme != "https") {
        throw std::invalid_argument("unsupported URL scheme: " + out.scheme);
    }

    const auto authority_start = scheme_end + 3;
    const auto path_start = url.find('/', authority_start);
    std::string authority = url.substr(authority_start, path_start == std::string::npos
                                                            ? std::string::npos
                                                            : path_start - authority_start);
    out.target = path_start == std::string::npos ? "/" : url.substr(path_start);

    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
        out.host = authority.substr(0, colon);
        out.port = authority.substr(colon + 1);
    } else {
        out.host = authority;
        out.port = out.scheme == "https" ? "443" : "80";
    }
    if (out.host.empty()) throw std::invalid_argument("URL has no host: " + url);
    return out;
}

std::string url_encode(const std::string& value) {
    static constexpr char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0x0F]);
        }
    }
    return out;
}

namespace {

struct Exchange {
    http::request<http::string_body> req;
    http::response<http::string_body> res;
    beast::flat_buffer buffer;
    error_code ec;
    bool done = false;
};

template <class Stream>
void async_exchange(Stream& stream, Exchange& ex, std::function<void()> finish) {
    http::async_write(stream, ex.req, [&stream, &ex, finish](error_code ec, std::size_t) {
        if (ec) {
            ex.ec = ec;
            return finish();
        }
        http::async_read(stream, ex.buffer, ex.res, [&ex, finish](error_code ec, std::size_t) {
            ex.ec = ec;
            finish();
        });
    });
}

void run_with_deadline(asio::io_context& ioc, std::chrono::seconds timeout, const Exchange& ex) {
    ioc.run_for(timeout);
    if (!ex.done) {
        throw boost::system::system_error(beast::error::timeout, "request timed out");
    }
    if (ex.ec) throw boost::system::system_error(ex.ec);
}

} // namespace

HttpResponse http_get(const std::string& url, std::chrono::seconds timeout, const std::string& user_agent) {
    const Url u = parse_url(url);

    asio::io_context ioc;
    tcp::resolver resolver(ioc);

    Exchange ex;
    ex.req = http::request<http::string_body>{http::verb::get, u.target, 11};
    ex.req.set(http::field::host, u.host);
    ex.req.set(http::field::user_agent, user_agent.empty() ? std::string(BOOST_BEAST_VERSION_STRING) : user_agent);
    ex.req.set(http::field::accept, "application/json");

    util::log_debug("http") << "GET " << u.scheme << "://" << u.host << ":" << u.port << u.target;

    if (u.scheme == "http") {
        beast::tcp_stream stream(ioc);

        resolver.async_resolve(u.host, u.port, [&](error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                ex.ec = ec;
                ex.done = true;
                return;
            }
            stream.expires_after(timeout);
            stream.async_connect(results, [&](error_code ec, const tcp::endpoint&) {
                if (ec) {
                    ex.ec = ec;
                    ex.done = true;
                    return;
                }
                async_exchange(stream, ex, [&] {
                    error_code ignored;
                    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
                    ex.done = true;
                });
            });
        });

        run_with_deadline(ioc, timeout, ex);
    } else {
        ssl::context ctx(ssl::context::tls_client);
        ctx.set_default_verify_paths();
        ctx.set_verify_mode(ssl::verify_peer);

        beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
            throw boost::system::system_error(
                error_code(static_cast<int>(::ERR_get_error()), asio::error::get_ssl_category()));
        }
        stream.set_verify_callback(ssl::host_name_verification(u.host));

        resolver.async_resolve(u.host, u.port, [&](error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                ex.ec = ec;
                ex.done = true;
                return;
            }
            beast::get_lowest_layer(stream).expires_after(timeout);
            beast::get_lowest_layer(stream).async_connect(results, [&](error_code ec, const tcp::endpoint&) {
                if (ec) {
                    ex.ec = ec;
                    ex.done = true;
                    return;
                }
                stream.async_handshake(ssl::stream_base::client, [&](error_code ec) {
                    if (ec) {
                        ex.ec = ec;
                        ex.done = true;
                        return;
                    }
                    async_exchange(stream, ex, [&] {
                        // The response is complete at this point; a truncated
                        // TLS close from the server is common and harmless.
                        ex.done = true;
                        stream.async_shutdown([&](error_code ec) {
                            if (ec && ec != asio::error::eof && ec != ssl::error::stream_truncated) {
                                util::log_debug("http") << "TLS shutdown: " << ec.message();
                            }
                        });
                    });
                });
            });
        });

        run_with_deadline(ioc, timeout, ex);
    }

    return HttpResponse{ex.res.result_int(), std::move(ex.res.body())};
}

} // namespace meshirc::networking
