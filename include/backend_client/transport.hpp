#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "trust_store.hpp"

namespace backend_client {

    /**
     * @brief Per-request state supplied by the caller at request time.
     *
     * Every field is optional. Dialing honors the deadline and the
     * cancellation flag; the correlation id is propagated by
     * CorrelationTransport.
     */
    struct RequestContext {
        using clock = std::chrono::steady_clock;

        /** @brief Absolute deadline covering dial, write and read. */
        std::optional<clock::time_point> deadline;

        /** @brief Set to true by the caller to abandon the request. */
        std::shared_ptr<const std::atomic<bool>> cancelled;

        /** @brief Sent as X-Request-Id by CorrelationTransport. */
        std::optional<std::string> correlation_id;

        [[nodiscard]] bool is_cancelled() const noexcept {
            return cancelled && cancelled->load(std::memory_order_relaxed);
        }

        [[nodiscard]] bool expired() const noexcept {
            return deadline && clock::now() >= *deadline;
        }

        /// @brief Copy whose deadline is the earlier of the current one and
        /// `limit`.
        [[nodiscard]] RequestContext with_deadline_at_most(
            clock::time_point limit) const {
            RequestContext out = *this;
            if (!out.deadline || limit < *out.deadline) out.deadline = limit;
            return out;
        }
    };

    /** @brief How a transport reaches the backend. */
    enum class TransportKind {
        UnixSocket, /**< http+unix:// */
        Http,       /**< http:// */
        Https       /**< https:// */
    };

    /**
     * @brief Performs one HTTP exchange.
     *
     * Implementations keep no per-request state, so a single instance
     * serves concurrent requests without external locking.
     */
    class Transport {
       public:
        virtual ~Transport() = default;

        /**
         * @brief Send `req` and read the response.
         * @param req The request; its url must be absolute (http:// or
         * https://).
         * @param ctx Deadline, cancellation and correlation for this call.
         */
        [[nodiscard]] virtual Result<Response> round_trip(
            const Request& req, const RequestContext& ctx) const = 0;

        [[nodiscard]] virtual TransportKind kind() const noexcept = 0;

        /// @brief TLS configuration, or nullptr for plaintext transports.
        [[nodiscard]] virtual const TlsClientSettings* tls_settings()
            const noexcept {
            return nullptr;
        }
    };

    /** @brief Settings shared by the concrete transports. */
    struct TransportOptions {
        std::string user_agent{kDefaultUserAgent};
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U *
                                   1024U};
    };

    /**
     * @brief Plain HTTP over TCP, dialing the host and port of each request.
     */
    class TcpTransport final : public Transport {
       public:
        explicit TcpTransport(TransportOptions options)
            : m_options(std::move(options)) {}

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override;

        TransportKind kind() const noexcept override {
            return TransportKind::Http;
        }

       private:
        TransportOptions m_options;
    };

    /**
     * @brief HTTPS over TCP using a shared, read-only TLS context.
     */
    class TlsTransport final : public Transport {
       public:
        TlsTransport(TransportOptions options, TlsClientSettings tls)
            : m_options(std::move(options)), m_tls(std::move(tls)) {}

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override;

        TransportKind kind() const noexcept override {
            return TransportKind::Https;
        }

        const TlsClientSettings* tls_settings() const noexcept override {
            return &m_tls;
        }

       private:
        TransportOptions m_options;
        TlsClientSettings m_tls;
    };

    /**
     * @brief HTTP over a Unix domain socket.
     *
     * The request URL only supplies the target and Host header; every
     * request dials the same socket path.
     */
    class UnixSocketTransport final : public Transport {
       public:
        UnixSocketTransport(TransportOptions options, std::string socket_path)
            : m_options(std::move(options)),
              m_socket_path(std::move(socket_path)) {}

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override;

        TransportKind kind() const noexcept override {
            return TransportKind::UnixSocket;
        }

        [[nodiscard]] const std::string& socket_path() const noexcept {
            return m_socket_path;
        }

       private:
        TransportOptions m_options;
        std::string m_socket_path;
    };

}  // namespace backend_client
