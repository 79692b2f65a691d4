#pragma once
#include <string>

namespace backend_client {
    /**
     * @brief Represents an error raised while building a client or
     * performing a round trip.
     */
    struct Error {
        /** @brief Enumeration of error codes. */
        enum class Code {
            UnsupportedUrlScheme,     /**< URL prefix selects no transport. */
            InvalidClientCertificate, /**< Client key pair failed to load. */
            TlsConfigurationFailed,   /**< TLS context could not be set up. */
            InvalidUrl,               /**< Request URL is malformed. */
            ConnectionFailed,         /**< Failed to dial the backend. */
            TlsHandshakeFailed,       /**< Failed to perform TLS handshake. */
            Timeout,                  /**< The request deadline passed. */
            Cancelled,                /**< The caller cancelled the request. */
            SendFailed,               /**< Failed to send the request. */
            ReceiveFailed,            /**< Failed to receive the response. */
            Unknown,                  /**< An unknown error occurred. */
        };

        /** @brief The error code. */
        Code code;
        /** @brief A descriptive error message. */
        std::string message;
    };

    /// @brief Stable name for an error code, used in log lines.
    inline const char* to_string(Error::Code code) noexcept {
        switch (code) {
            case Error::Code::UnsupportedUrlScheme:
                return "unsupported_url_scheme";
            case Error::Code::InvalidClientCertificate:
                return "invalid_client_certificate";
            case Error::Code::TlsConfigurationFailed:
                return "tls_configuration_failed";
            case Error::Code::InvalidUrl:
                return "invalid_url";
            case Error::Code::ConnectionFailed:
                return "connection_failed";
            case Error::Code::TlsHandshakeFailed:
                return "tls_handshake_failed";
            case Error::Code::Timeout:
                return "timeout";
            case Error::Code::Cancelled:
                return "cancelled";
            case Error::Code::SendFailed:
                return "send_failed";
            case Error::Code::ReceiveFailed:
                return "receive_failed";
            case Error::Code::Unknown:
                break;
        }
        return "unknown";
    }
}  // namespace backend_client
