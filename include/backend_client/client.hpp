#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

#include "request.hpp"
#include "response.hpp"
#include "result.hpp"
#include "transport.hpp"

namespace backend_client {

    /**
     * @brief A transport bound to the resolved backend host.
     *
     * Immutable once built. All request methods are const and may be called
     * concurrently from several threads.
     */
    class HttpClient {
       public:
        /**
         * @brief Constructs an HttpClient.
         * @param transport The (decorated) transport requests go through.
         * @param host Base URL requests are composed against, e.g.
         * "http://unix/backend" or "https://backend.example.com".
         * @param timeout Upper bound on each request.
         */
        HttpClient(std::shared_ptr<Transport> transport, std::string host,
                   std::chrono::seconds timeout)
            : m_transport(std::move(transport)),
              m_host(std::move(host)),
              m_timeout(timeout) {}

        HttpClient(const HttpClient&) = delete;
        HttpClient& operator=(const HttpClient&) = delete;

        [[nodiscard]] const std::string& host() const noexcept {
            return m_host;
        }

        [[nodiscard]] std::chrono::seconds timeout() const noexcept {
            return m_timeout;
        }

        [[nodiscard]] const std::shared_ptr<Transport>& transport()
            const noexcept {
            return m_transport;
        }

        [[nodiscard]] TransportKind kind() const noexcept {
            return m_transport->kind();
        }

        /// @brief TLS configuration of the transport, nullptr if plaintext.
        [[nodiscard]] const TlsClientSettings* tls_settings() const noexcept {
            return m_transport->tls_settings();
        }

        /// @brief Full URL for `path` on the resolved host.
        [[nodiscard]] std::string url_for(std::string_view path) const;

        /**
         * @brief Sends a request.
         *
         * A relative request URL is resolved against host(). The client
         * timeout caps the context deadline.
         */
        [[nodiscard]] Result<Response> send(
            const Request& request, const RequestContext& ctx = {}) const;

        /**
         * @brief Convenience methods for common HTTP verbs; `path` is
         * relative to host().
         * @{
         */
        [[nodiscard]] Result<Response> get(std::string_view path,
                                           const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> head(
            std::string_view path, const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> del(std::string_view path,
                                           const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> options(
            std::string_view path, const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> post(
            std::string_view path, std::string body,
            const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> put(std::string_view path,
                                           std::string body,
                                           const RequestContext& ctx = {}) const;
        [[nodiscard]] Result<Response> patch(
            std::string_view path, std::string body,
            const RequestContext& ctx = {}) const;
        /** @} */

       private:
        std::shared_ptr<Transport> m_transport;
        std::string m_host;
        std::chrono::seconds m_timeout;
    };

}  // namespace backend_client
