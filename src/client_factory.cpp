#include "backend_client/client_factory.hpp"

#include <string_view>
#include <utility>

#include "backend_client/logging.hpp"
#include "backend_client/middleware.hpp"
#include "backend_client/trust_store.hpp"
#include "backend_client/url.hpp"

namespace backend_client {

    namespace {

        struct BuiltTransport {
            std::shared_ptr<Transport> transport;
            std::string host;
        };

        TransportOptions transport_options(const ClientConfig& config) {
            TransportOptions opts;
            opts.user_agent = config.user_agent;
            opts.max_body_bytes = config.max_body_bytes;
            return opts;
        }

        BuiltTransport build_socket_transport(const ClientConfig& config) {
            std::string socket_path(
                url_utils::trim_prefix(config.url, kUnixSocketProtocol));
            return BuiltTransport{
                std::make_shared<UnixSocketTransport>(
                    transport_options(config), std::move(socket_path)),
                url_utils::socket_host(config.relative_url_root)};
        }

        BuiltTransport build_http_transport(const ClientConfig& config) {
            return BuiltTransport{
                std::make_shared<TcpTransport>(transport_options(config)),
                config.url};
        }

        Result<BuiltTransport> build_https_transport(const ClientConfig& config) {
            auto tls = build_tls_context(config);
            if (tls.has_error()) return tls.propagate<BuiltTransport>();

            return Result<BuiltTransport>::ok(BuiltTransport{
                std::make_shared<TlsTransport>(transport_options(config),
                                               std::move(tls).value()),
                config.url});
        }

        Result<BuiltTransport> build_transport(const ClientConfig& config) {
            // Order matters: "http+unix://" must win over "http://".
            if (url_utils::has_prefix(config.url, kUnixSocketProtocol)) {
                return Result<BuiltTransport>::ok(build_socket_transport(config));
            }
            if (url_utils::has_prefix(config.url, kHttpProtocol)) {
                return Result<BuiltTransport>::ok(build_http_transport(config));
            }
            if (url_utils::has_prefix(config.url, kHttpsProtocol)) {
                return build_https_transport(config);
            }
            return Result<BuiltTransport>::err(
                Error::Code::UnsupportedUrlScheme,
                "unknown URL prefix: " + config.url);
        }

    }  // namespace

    Result<std::shared_ptr<HttpClient>> build_client(const ClientConfig& config) {
        auto built = build_transport(config);
        if (built.has_error()) {
            return built.propagate<std::shared_ptr<HttpClient>>();
        }

        BuiltTransport bt = std::move(built).value();
        return Result<std::shared_ptr<HttpClient>>::ok(
            std::make_shared<HttpClient>(
                instrument(std::move(bt.transport), config.decorators),
                std::move(bt.host),
                read_timeout(config.read_timeout_seconds)));
    }

    std::shared_ptr<HttpClient> new_http_client(
        const std::string& url, const std::string& relative_url_root,
        const std::string& ca_file, const std::string& ca_path,
        bool self_signed_cert, std::uint64_t read_timeout_seconds) {
        ClientConfig config;
        config.url = url;
        config.relative_url_root = relative_url_root;
        if (!ca_file.empty()) config.ca_file = ca_file;
        if (!ca_path.empty()) config.ca_path = ca_path;
        config.self_signed_cert = self_signed_cert;
        config.read_timeout_seconds = read_timeout_seconds;

        auto client = build_client(config);
        if (client.has_error()) {
            logger()->error("new http client with opts: {}",
                            client.error().message);
            return nullptr;
        }
        return std::move(client).value();
    }

}  // namespace backend_client
