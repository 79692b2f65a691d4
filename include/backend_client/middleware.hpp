#pragma once

#include <memory>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "transport.hpp"

namespace backend_client {

    /** @brief Header carrying the correlation id to the backend. */
    inline constexpr std::string_view kCorrelationHeader{"X-Request-Id"};

    /**
     * @brief Base for transports that wrap another transport.
     *
     * Reports the inner transport's kind and TLS settings, so a decorated
     * transport still describes how it reaches the backend.
     */
    class DecoratingTransport : public Transport {
       public:
        explicit DecoratingTransport(std::shared_ptr<Transport> inner)
            : m_inner(std::move(inner)) {}

        TransportKind kind() const noexcept override { return m_inner->kind(); }

        const TlsClientSettings* tls_settings() const noexcept override {
            return m_inner->tls_settings();
        }

        [[nodiscard]] const std::shared_ptr<Transport>& inner() const noexcept {
            return m_inner;
        }

       private:
        std::shared_ptr<Transport> m_inner;
    };

    /**
     * @brief Emits a debug log event per round trip: method, URL, outcome
     * and elapsed time.
     */
    class TracingTransport final : public DecoratingTransport {
       public:
        using DecoratingTransport::DecoratingTransport;

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override;
    };

    /**
     * @brief Sends the context's correlation id as X-Request-Id.
     *
     * A request that already carries the header, or a context without an
     * id, is forwarded untouched.
     */
    class CorrelationTransport final : public DecoratingTransport {
       public:
        using DecoratingTransport::DecoratingTransport;

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override;
    };

    TransportDecorator tracing_decorator();
    TransportDecorator correlation_decorator();

    /**
     * @brief Wrap `base` with tracing, then correlation, then each of
     * `extra` in order (the last one ends up outermost).
     */
    std::shared_ptr<Transport> instrument(
        std::shared_ptr<Transport> base,
        const std::vector<TransportDecorator>& extra);

}  // namespace backend_client
