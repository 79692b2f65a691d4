#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ratio>
#include <string>
#include <string_view>
#include <vector>

namespace backend_client {

    class Transport;

    /** @brief URL prefix selecting the Unix domain socket transport. */
    inline constexpr std::string_view kUnixSocketProtocol{"http+unix://"};
    /** @brief URL prefix selecting the plain HTTP transport. */
    inline constexpr std::string_view kHttpProtocol{"http://"};
    /** @brief URL prefix selecting the HTTPS transport. */
    inline constexpr std::string_view kHttpsProtocol{"https://"};

    /** @brief Synthetic host used for requests sent over a Unix socket. */
    inline constexpr std::string_view kSocketBaseUrl{"http://unix"};

    /** @brief Read timeout applied when the caller passes 0. */
    inline constexpr std::uint64_t kDefaultReadTimeoutSeconds{300};

    inline constexpr std::string_view kDefaultUserAgent{"backend_client/1.0"};

    /**
     * @brief Wraps a transport in another one (tracing, correlation, auth...).
     *
     * A decorator must return a transport that forwards to the one it was
     * given, without changing request or response semantics.
     */
    using TransportDecorator =
        std::function<std::shared_ptr<Transport>(std::shared_ptr<Transport>)>;

    /**
     * @brief Certificate and private key presented for mutual TLS.
     */
    struct ClientCertificate {
        /** @brief PEM file holding the certificate (optionally its chain). */
        std::filesystem::path cert_path;
        /** @brief PEM file holding the matching private key. */
        std::filesystem::path key_path;
    };

    /**
     * @brief Everything build_client() needs to assemble an HttpClient.
     */
    struct ClientConfig {
        /** @brief Backend URL: http+unix://<socket>, http://... or https://... */
        std::string url;

        /** @brief Path prefix appended to the synthetic socket host. */
        std::string relative_url_root;

        /** @brief Extra PEM bundle added to the trust pool. */
        std::optional<std::filesystem::path> ca_file;

        /** @brief Directory whose regular files are added to the trust pool. */
        std::optional<std::filesystem::path> ca_path;

        /** @brief Disable certificate and hostname verification. */
        bool self_signed_cert{false};

        /** @brief Read timeout in seconds, 0 selects the default. */
        std::uint64_t read_timeout_seconds{0};

        /** @brief Optional mutual TLS key pair. */
        std::optional<ClientCertificate> client_certificate;

        /** @brief User-Agent string sent with each request. */
        std::string user_agent{kDefaultUserAgent};

        /** @brief Maximum size of response bodies in bytes. */
        std::size_t max_body_bytes{static_cast<std::size_t>(10) * 1024U * 1024U};

        /** @brief Applied outside the built-in tracing and correlation. */
        std::vector<TransportDecorator> decorators;

        /// @brief Copy of this config presenting the given key pair.
        [[nodiscard]] ClientConfig with_client_cert(
            std::filesystem::path cert_path,
            std::filesystem::path key_path) const {
            ClientConfig out = *this;
            out.client_certificate =
                ClientCertificate{std::move(cert_path), std::move(key_path)};
            return out;
        }

        /// @brief Copy of this config with one more transport decorator.
        [[nodiscard]] ClientConfig with_decorator(
            TransportDecorator decorator) const {
            ClientConfig out = *this;
            out.decorators.push_back(std::move(decorator));
            return out;
        }

        /// @brief True only when both halves of the key pair are set.
        [[nodiscard]] bool has_cert_and_key() const noexcept {
            return client_certificate.has_value() &&
                   !client_certificate->cert_path.empty() &&
                   !client_certificate->key_path.empty();
        }
    };

    /**
     * @brief Largest timeout in seconds, chosen so that converting it to
     * nanoseconds does not overflow (roughly 292 years).
     */
    inline constexpr std::uint64_t kMaxReadTimeoutSeconds{
        static_cast<std::uint64_t>(std::chrono::nanoseconds::max().count() /
                                   std::nano::den)};

    /// @brief Client timeout for the given setting (0 means the default).
    /// Values above kMaxReadTimeoutSeconds are clamped to it.
    inline constexpr std::chrono::seconds read_timeout(
        std::uint64_t timeout_seconds) noexcept {
        if (timeout_seconds == 0) timeout_seconds = kDefaultReadTimeoutSeconds;
        if (timeout_seconds > kMaxReadTimeoutSeconds) {
            timeout_seconds = kMaxReadTimeoutSeconds;
        }
        return std::chrono::seconds(
            static_cast<std::chrono::seconds::rep>(timeout_seconds));
    }

}  // namespace backend_client
