#pragma once

#include <string>
#include <string_view>

#include "config.hpp"
#include "result.hpp"

namespace backend_client {

    struct UrlComponents {
        bool https{false};
        std::string host;
        std::string port;
        // Request target: path plus optional query, always starting with '/'.
        std::string target;
    };

    namespace url_utils {

        /// @brief Check whether `s` starts with `prefix`.
        inline constexpr bool has_prefix(std::string_view s,
                                         std::string_view prefix) noexcept {
            return s.substr(0, prefix.size()) == prefix;
        }

        /// @brief Remove `prefix` from the front of `s` if present.
        inline std::string_view trim_prefix(std::string_view s,
                                            std::string_view prefix) noexcept {
            if (has_prefix(s, prefix)) s.remove_prefix(prefix.size());
            return s;
        }

        /// @brief Trim leading and trailing slashes.
        inline std::string trim_slashes(std::string_view s) {
            while (!s.empty() && s.front() == '/') s.remove_prefix(1);
            while (!s.empty() && s.back() == '/') s.remove_suffix(1);
            return std::string(s);
        }

        /// @brief Synthetic host for the Unix socket transport:
        /// "http://unix", plus "/<root>" when the trimmed root is non-empty.
        inline std::string socket_host(std::string_view relative_url_root) {
            std::string host(kSocketBaseUrl);
            std::string root = trim_slashes(relative_url_root);
            if (!root.empty()) {
                host += '/';
                host += root;
            }
            return host;
        }

        /// @brief Join a resolved host and a request path.
        /// "" => host + "/", "api" => host + "/api", "/api" => host + "/api".
        inline std::string join_host_and_path(std::string_view host,
                                               std::string_view path) {
            std::string out(host);
            while (!out.empty() && out.back() == '/') out.pop_back();
            if (path.empty() || path.front() != '/') out += '/';
            out.append(path);
            return out;
        }

    }  // namespace url_utils

    /// @brief Parse an absolute http:// or https:// URL into its components.
    /// @param url The URL string to parse.
    /// @return The UrlComponents on success, or an InvalidUrl Error.
    inline Result<UrlComponents> parse_url(std::string_view url) {
        auto make_err = [&](std::string msg) -> Result<UrlComponents> {
            return Result<UrlComponents>::err(Error::Code::InvalidUrl,
                                              std::move(msg) + ": " +
                                                  std::string(url));
        };

        std::string_view s(url);

        bool https = false;
        if (url_utils::has_prefix(s, kHttpsProtocol)) {
            https = true;
            s.remove_prefix(kHttpsProtocol.size());
        } else if (url_utils::has_prefix(s, kHttpProtocol)) {
            s.remove_prefix(kHttpProtocol.size());
        } else {
            return make_err("URL must start with http:// or https://");
        }

        // Split host[:port] from path
        std::string_view hostport = s;
        std::string_view path = "/";
        if (auto slash = s.find_first_of("/?"); slash != std::string_view::npos) {
            hostport = s.substr(0, slash);
            path = s.substr(slash);
        }

        if (hostport.empty()) {
            return make_err("URL missing host");
        }

        std::string host;
        std::string port;

        // Bracketed IPv6 literal: [::1]:8080
        std::string_view after_host = hostport;
        if (hostport.front() == '[') {
            auto close = hostport.find(']');
            if (close == std::string_view::npos) {
                return make_err("URL has unterminated IPv6 literal");
            }
            host = std::string(hostport.substr(1, close - 1));
            after_host = hostport.substr(close + 1);
            if (!after_host.empty() && after_host.front() != ':') {
                return make_err("URL has garbage after IPv6 literal");
            }
        } else if (auto colon = hostport.rfind(':');
                   colon != std::string_view::npos) {
            host = std::string(hostport.substr(0, colon));
            after_host = hostport.substr(colon);
        } else {
            host = std::string(hostport);
            after_host = {};
        }

        if (!after_host.empty()) {
            port = std::string(after_host.substr(1));
            if (port.empty()) {
                return make_err("URL has empty port");
            }
            if (port.find_first_not_of("0123456789") != std::string::npos) {
                return make_err("URL has non-numeric port");
            }
        } else {
            port = https ? "443" : "80";
        }

        if (host.empty()) {
            return make_err("URL has empty host");
        }

        UrlComponents out;
        out.https = https;
        out.host = std::move(host);
        out.port = std::move(port);
        out.target = std::string(path);
        if (out.target.front() == '?') out.target.insert(out.target.begin(), '/');
        return Result<UrlComponents>::ok(std::move(out));
    }

}  // namespace backend_client
