#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "client.hpp"
#include "config.hpp"
#include "result.hpp"

namespace backend_client {

    /**
     * @brief Build a client for the backend described by `config`.
     *
     * The transport is chosen by URL prefix, in this order:
     * - `http+unix://<path>`: every request dials <path>; host() is
     *   "http://unix" plus the trimmed relative URL root.
     * - `http://`: plain TCP; host() is the URL.
     * - `https://`: TLS (see build_tls_context()); host() is the URL.
     *
     * The transport is then wrapped with tracing, correlation and
     * config.decorators. The timeout is config.read_timeout_seconds, or
     * kDefaultReadTimeoutSeconds when that is 0.
     *
     * @return The client, or UnsupportedUrlScheme / InvalidClientCertificate.
     */
    Result<std::shared_ptr<HttpClient>> build_client(const ClientConfig& config);

    /**
     * @brief Legacy entry point without mutual TLS.
     *
     * Logs construction errors and returns nullptr instead of reporting
     * them.
     */
    [[deprecated("use build_client")]] std::shared_ptr<HttpClient>
    new_http_client(const std::string& url,
                    const std::string& relative_url_root,
                    const std::string& ca_file, const std::string& ca_path,
                    bool self_signed_cert, std::uint64_t read_timeout_seconds);

}  // namespace backend_client
