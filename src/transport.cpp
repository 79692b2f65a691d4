#include "backend_client/transport.hpp"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/ssl/error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core/basic_stream.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <optional>
#include <string>

#include "backend_client/detail/exchange.hpp"

namespace beast = boost::beast;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

namespace backend_client {

    namespace {

        using UnixStream = beast::basic_stream<net::local::stream_protocol>;
        using HttpsStream = beast::ssl_stream<beast::tcp_stream>;

        /// @brief Resolve the URL's host and connect `stream` to it.
        std::optional<Error> dial_tcp(net::io_context& ioc,
                                      beast::tcp_stream& stream,
                                      const UrlComponents& url,
                                      const RequestContext& ctx) {
            const std::string what =
                "connect to " + url.host + ":" + url.port + " failed";
            boost::system::error_code ec;
            tcp::resolver resolver(ioc);
            tcp::resolver::results_type results;

            resolver.async_resolve(
                url.host, url.port,
                [&](boost::system::error_code e,
                    tcp::resolver::results_type r) {
                    ec = e;
                    results = std::move(r);
                });
            auto why =
                detail::run(ioc, ctx, [&resolver] { resolver.cancel(); });
            if (why != detail::Interrupt::None) {
                return detail::interrupt_error(why, what);
            }
            if (ec) {
                return detail::make_error(Error::Code::ConnectionFailed, what,
                                          ec);
            }

            stream.async_connect(
                results, [&ec](boost::system::error_code e,
                               const tcp::endpoint&) { ec = e; });
            why = detail::run_on(ioc, stream, ctx);
            if (why != detail::Interrupt::None) {
                return detail::interrupt_error(why, what);
            }
            if (ec) {
                return detail::make_error(Error::Code::ConnectionFailed, what,
                                          ec);
            }
            return std::nullopt;
        }

        /// @brief SNI is only sent for DNS names, never for IP literals.
        bool set_sni(HttpsStream& stream, const std::string& host,
                     boost::system::error_code& ec) {
            boost::system::error_code addr_ec;
            net::ip::make_address(host, addr_ec);
            if (!addr_ec) return true;

            if (!SSL_set_tlsext_host_name(stream.native_handle(),
                                          host.c_str())) {
                ec = boost::system::error_code(
                    static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category());
                return false;
            }
            return true;
        }

        Result<Response> early_failure(const RequestContext& ctx) {
            auto e = detail::check_context(ctx);
            return Result<Response>::err(std::move(*e));
        }

    }  // namespace

    Result<Response> TcpTransport::round_trip(const Request& req,
                                              const RequestContext& ctx) const {
        auto prepared = prepare_request(req, m_options.user_agent);
        if (prepared.has_error()) return prepared.propagate<Response>();
        if (detail::check_context(ctx)) return early_failure(ctx);

        PreparedRequest& preq = prepared.value();
        net::io_context ioc{1};
        beast::tcp_stream stream(ioc);
        detail::arm_deadline(stream, ctx);

        if (auto err = dial_tcp(ioc, stream, preq.url, ctx)) {
            return Result<Response>::err(std::move(*err));
        }

        return detail::exchange(ioc, stream, preq.beast_req,
                                m_options.max_body_bytes, ctx);
    }

    Result<Response> TlsTransport::round_trip(const Request& req,
                                              const RequestContext& ctx) const {
        auto prepared = prepare_request(req, m_options.user_agent);
        if (prepared.has_error()) return prepared.propagate<Response>();
        if (detail::check_context(ctx)) return early_failure(ctx);

        PreparedRequest& preq = prepared.value();
        net::io_context ioc{1};
        HttpsStream stream(ioc, *m_tls.context);
        detail::arm_deadline(stream, ctx);

        boost::system::error_code ec;
        if (!set_sni(stream, preq.url.host, ec)) {
            return detail::fail(Error::Code::TlsHandshakeFailed,
                                "set SNI failed", ec);
        }

        if (!m_tls.insecure_skip_verify) {
            stream.set_verify_callback(
                ssl::host_name_verification(preq.url.host), ec);
            if (ec) {
                return detail::fail(Error::Code::TlsHandshakeFailed,
                                    "hostname verification setup failed",
                                    ec);
            }
        }

        if (auto err =
                dial_tcp(ioc, beast::get_lowest_layer(stream), preq.url, ctx)) {
            return Result<Response>::err(std::move(*err));
        }

        stream.async_handshake(
            ssl::stream_base::client,
            [&ec](boost::system::error_code e) { ec = e; });
        if (auto why = detail::run_on(ioc, stream, ctx);
            why != detail::Interrupt::None) {
            return Result<Response>::err(
                detail::interrupt_error(why, "TLS handshake"));
        }
        if (ec) {
            return detail::fail(Error::Code::TlsHandshakeFailed,
                                "TLS handshake failed", ec);
        }

        // No TLS shutdown: the request carries "Connection: close" and the
        // socket is closed when the stream goes out of scope.
        return detail::exchange(ioc, stream, preq.beast_req,
                                m_options.max_body_bytes, ctx);
    }

    Result<Response> UnixSocketTransport::round_trip(
        const Request& req, const RequestContext& ctx) const {
        auto prepared = prepare_request(req, m_options.user_agent);
        if (prepared.has_error()) return prepared.propagate<Response>();
        if (detail::check_context(ctx)) return early_failure(ctx);

        PreparedRequest& preq = prepared.value();
        net::io_context ioc{1};
        UnixStream stream(ioc);
        detail::arm_deadline(stream, ctx);

        // The request's host and port are ignored: always dial the socket.
        boost::system::error_code ec;
        stream.async_connect(
            net::local::stream_protocol::endpoint(m_socket_path),
            [&ec](boost::system::error_code e) { ec = e; });
        const std::string what =
            "connect to unix socket " + m_socket_path + " failed";
        if (auto why = detail::run_on(ioc, stream, ctx);
            why != detail::Interrupt::None) {
            return Result<Response>::err(detail::interrupt_error(why, what));
        }
        if (ec) return detail::fail(Error::Code::ConnectionFailed, what, ec);

        return detail::exchange(ioc, stream, preq.beast_req,
                                m_options.max_body_bytes, ctx);
    }

}  // namespace backend_client
