#pragma once

#include <boost/asio/ssl/context.hpp>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <string_view>

#include "config.hpp"
#include "result.hpp"

namespace backend_client {

    /**
     * @brief What went into the trust pool while building a TLS context.
     *
     * Unreadable or unparseable CA files never fail construction; they are
     * only counted here.
     */
    struct TrustStoreStats {
        /** @brief System default roots were loaded into the pool. */
        bool system_roots_loaded{false};
        /** @brief Certificates added from ClientConfig::ca_file. */
        std::size_t ca_file_certificates{0};
        /** @brief Certificates added from files in ClientConfig::ca_path. */
        std::size_t ca_path_certificates{0};
        /** @brief CA files that yielded no certificate. */
        std::size_t skipped_files{0};
    };

    /**
     * @brief A TLS client context ready to be shared by an HTTPS transport,
     * along with a description of how it was configured.
     */
    struct TlsClientSettings {
        std::shared_ptr<boost::asio::ssl::context> context;
        /** @brief Peer chain and hostname verification are disabled. */
        bool insecure_skip_verify{false};
        /** @brief Number of certificates presented for mutual TLS (0 or 1). */
        std::size_t client_certificate_count{0};
        TrustStoreStats trust;
    };

    /**
     * @brief Build the TLS client context for an https:// backend.
     *
     * The trust pool starts from the system roots (empty if they cannot be
     * loaded) and is extended with the CA file and every regular file
     * directly inside the CA directory. The minimum protocol version is
     * TLS 1.2. Verification is disabled when config.self_signed_cert is set.
     * When config.has_cert_and_key(), the key pair is loaded and presented
     * to the server.
     *
     * @return The settings, or InvalidClientCertificate when the key pair
     * cannot be loaded.
     */
    Result<TlsClientSettings> build_tls_context(const ClientConfig& config);

    /// @brief Add every PEM certificate in `pem` to the context's trust pool.
    /// @return Number of certificates added.
    std::size_t add_pem_certificates(boost::asio::ssl::context& ctx,
                                     std::string_view pem);

    /// @brief Read `file` and add its PEM certificates to the trust pool.
    /// @return Number of certificates added, 0 when the file is unreadable.
    std::size_t add_certificate_file(boost::asio::ssl::context& ctx,
                                     const std::filesystem::path& file);

    /// @brief Whether the first certificate in `pem` is in the trust pool.
    bool trusts_certificate(boost::asio::ssl::context& ctx,
                            std::string_view pem);

}  // namespace backend_client
