// In-process HTTP servers for transport tests: loopback TCP, Unix socket
// and TLS. Each serves one request per connection on a background thread.
#pragma once

#include <atomic>
#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/local/stream_protocol.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

#include "support/test_certs.hpp"

namespace test_support {

    namespace net = boost::asio;
    namespace beast = boost::beast;
    namespace http = beast::http;
    namespace ssl = net::ssl;
    using tcp = net::ip::tcp;
    using local = net::local::stream_protocol;

    using Handler = std::function<void(const http::request<http::string_body>&,
                                       http::response<http::string_body>&)>;

    /// @brief Answers every request with 200 and the request target as body.
    inline Handler echo_target() {
        return [](const auto& req, auto& res) {
            res.result(http::status::ok);
            res.set(http::field::content_type, "text/plain");
            res.body() = std::string(req.target());
        };
    }

    /// @brief What the server saw in the most recent request.
    struct Captured {
        std::mutex mtx;
        std::atomic<int> request_count{0};
        std::string method;
        std::string target;
        std::string host;
        std::string user_agent;
        std::string request_id;
        std::string body;
        bool client_presented_cert{false};

        std::string last_target() {
            std::lock_guard<std::mutex> lock(mtx);
            return target;
        }
        std::string last_host() {
            std::lock_guard<std::mutex> lock(mtx);
            return host;
        }
        std::string last_request_id() {
            std::lock_guard<std::mutex> lock(mtx);
            return request_id;
        }
    };

    /// @brief Read one request from `stream`, run the handler, reply.
    template <class Stream>
    void serve_one(Stream& stream, const Handler& handler, Captured& seen) {
        beast::error_code ec;
        beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req, ec);
        if (ec) return;

        {
            std::lock_guard<std::mutex> lock(seen.mtx);
            seen.method = std::string(req.method_string());
            seen.target = std::string(req.target());
            seen.host = std::string(req[http::field::host]);
            seen.user_agent = std::string(req[http::field::user_agent]);
            seen.request_id = std::string(req["X-Request-Id"]);
            seen.body = req.body();
        }
        seen.request_count.fetch_add(1, std::memory_order_relaxed);

        http::response<http::string_body> res;
        res.version(req.version());
        handler(req, res);
        if (res.result() == http::status::unknown) res.result(http::status::ok);
        res.keep_alive(false);
        res.prepare_payload();
        http::write(stream, res, ec);
    }

    /// @brief Plain HTTP on 127.0.0.1 with an ephemeral port.
    class TcpTestServer {
       public:
        explicit TcpTestServer(Handler h = echo_target())
            : m_handler(std::move(h)), m_acceptor(m_ioc) {
            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
            m_acceptor.open(ep.protocol());
            m_acceptor.set_option(net::socket_base::reuse_address(true));
            m_acceptor.bind(ep);
            m_acceptor.listen();
            m_port = m_acceptor.local_endpoint().port();
            m_thread = std::thread([this] { run(); });
        }

        ~TcpTestServer() {
            m_stop.store(true);
            beast::error_code ec;
            net::io_context tmp;
            tcp::socket wake(tmp);
            wake.connect(
                tcp::endpoint(net::ip::make_address("127.0.0.1"), m_port), ec);
            if (m_thread.joinable()) m_thread.join();
            m_acceptor.close(ec);
        }

        std::uint16_t port() const noexcept { return m_port; }
        std::string url(const std::string& path = "") const {
            return "http://127.0.0.1:" + std::to_string(m_port) + path;
        }
        Captured& seen() noexcept { return m_seen; }

       private:
        void run() {
            while (!m_stop.load()) {
                beast::error_code ec;
                tcp::socket sock(m_ioc);
                m_acceptor.accept(sock, ec);
                if (ec || m_stop.load()) continue;
                serve_one(sock, m_handler, m_seen);
                sock.shutdown(tcp::socket::shutdown_both, ec);
            }
        }

        Handler m_handler;
        Captured m_seen;
        net::io_context m_ioc;
        tcp::acceptor m_acceptor;
        std::uint16_t m_port{0};
        std::atomic<bool> m_stop{false};
        std::thread m_thread;
    };

    /// @brief Plain HTTP on a Unix domain socket inside a scratch directory.
    class UnixTestServer {
       public:
        explicit UnixTestServer(Handler h = echo_target())
            : m_handler(std::move(h)),
              m_socket_path((m_dir.path() / "backend.sock").string()),
              m_acceptor(m_ioc, local::endpoint(m_socket_path)) {
            m_thread = std::thread([this] { run(); });
        }

        ~UnixTestServer() {
            m_stop.store(true);
            beast::error_code ec;
            net::io_context tmp;
            local::socket wake(tmp);
            wake.connect(local::endpoint(m_socket_path), ec);
            if (m_thread.joinable()) m_thread.join();
            m_acceptor.close(ec);
        }

        const std::string& socket_path() const noexcept { return m_socket_path; }
        Captured& seen() noexcept { return m_seen; }

       private:
        void run() {
            while (!m_stop.load()) {
                beast::error_code ec;
                local::socket sock(m_ioc);
                m_acceptor.accept(sock, ec);
                if (ec || m_stop.load()) continue;
                serve_one(sock, m_handler, m_seen);
                sock.shutdown(local::socket::shutdown_both, ec);
            }
        }

        TempDir m_dir;
        Handler m_handler;
        Captured m_seen;
        std::string m_socket_path;
        net::io_context m_ioc;
        local::acceptor m_acceptor;
        std::atomic<bool> m_stop{false};
        std::thread m_thread;
    };

    /// @brief HTTPS on 127.0.0.1 presenting `server` and, when `client_ca`
    /// is set, requiring a client certificate signed by it.
    class TlsTestServer {
       public:
        explicit TlsTestServer(const KeyPairPem& server,
                               std::string client_ca = {},
                               Handler h = echo_target())
            : m_handler(std::move(h)),
              m_ssl(ssl::context::tls_server),
              m_acceptor(m_ioc) {
            m_ssl.use_certificate_chain(
                net::buffer(server.cert_pem.data(), server.cert_pem.size()));
            m_ssl.use_private_key(
                net::buffer(server.key_pem.data(), server.key_pem.size()),
                ssl::context::pem);
            if (!client_ca.empty()) {
                m_ssl.add_certificate_authority(
                    net::buffer(client_ca.data(), client_ca.size()));
                m_ssl.set_verify_mode(ssl::verify_peer |
                                      ssl::verify_fail_if_no_peer_cert);
            }

            tcp::endpoint ep{net::ip::make_address("127.0.0.1"), 0};
            m_acceptor.open(ep.protocol());
            m_acceptor.set_option(net::socket_base::reuse_address(true));
            m_acceptor.bind(ep);
            m_acceptor.listen();
            m_port = m_acceptor.local_endpoint().port();
            m_thread = std::thread([this] { run(); });
        }

        ~TlsTestServer() {
            m_stop.store(true);
            beast::error_code ec;
            net::io_context tmp;
            tcp::socket wake(tmp);
            wake.connect(
                tcp::endpoint(net::ip::make_address("127.0.0.1"), m_port), ec);
            if (m_thread.joinable()) m_thread.join();
            m_acceptor.close(ec);
        }

        std::uint16_t port() const noexcept { return m_port; }
        std::string url(const std::string& path = "") const {
            return "https://127.0.0.1:" + std::to_string(m_port) + path;
        }
        Captured& seen() noexcept { return m_seen; }
        int handshake_failures() const noexcept {
            return m_handshake_failures.load();
        }

       private:
        void run() {
            while (!m_stop.load()) {
                beast::error_code ec;
                tcp::socket sock(m_ioc);
                m_acceptor.accept(sock, ec);
                if (ec || m_stop.load()) continue;

                ssl::stream<tcp::socket> stream(std::move(sock), m_ssl);
                stream.handshake(ssl::stream_base::server, ec);
                if (ec) {
                    m_handshake_failures.fetch_add(1);
                    continue;
                }
                {
                    std::lock_guard<std::mutex> lock(m_seen.mtx);
                    X509* peer = SSL_get1_peer_certificate(stream.native_handle());
                    m_seen.client_presented_cert = peer != nullptr;
                    X509_free(peer);
                }
                serve_one(stream, m_handler, m_seen);
                stream.next_layer().shutdown(tcp::socket::shutdown_both, ec);
            }
        }

        Handler m_handler;
        Captured m_seen;
        net::io_context m_ioc;
        ssl::context m_ssl;
        tcp::acceptor m_acceptor;
        std::uint16_t m_port{0};
        std::atomic<bool> m_stop{false};
        std::atomic<int> m_handshake_failures{0};
        std::thread m_thread;
    };

}  // namespace test_support
