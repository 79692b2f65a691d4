#pragma once
#include <boost/beast/http/field.hpp>
#include <boost/beast/http/fields.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/core/string.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "http_method.hpp"
#include "url.hpp"

namespace backend_client {

    struct Request {
        HttpMethod method;
        std::string url;
        std::unordered_map<std::string, std::string> headers;
        std::optional<std::string> body;
    };

    /// @brief Case-insensitive header presence check.
    inline bool has_header(const Request& req, std::string_view name) {
        const boost::beast::string_view wanted(name.data(), name.size());
        for (const auto& [k, v] : req.headers) {
            (void)v;
            if (boost::beast::iequals(k, wanted)) return true;
        }
        return false;
    }

    /// @brief Apply Request headers into a Boost.Beast header container.
    /// @note Uses `set()`, so duplicate keys overwrite previous values.
    inline void apply_request_headers(
        const std::unordered_map<std::string, std::string>& in,
        boost::beast::http::fields& out) {
        for (const auto& [k, v] : in) {
            out.set(k, v);
        }
    }

    /// @brief Build the wire request. One request per connection, so the
    /// request always asks the server to close.
    inline boost::beast::http::request<boost::beast::http::string_body>
    prepare_beast_request(const Request& req, const UrlComponents& url,
                          const std::string& user_agent) {
        namespace http = boost::beast::http;
        http::request<http::string_body> beast_req;
        beast_req.version(11);
        beast_req.method(to_boost_http_method(req.method));
        beast_req.target(url.target);
        std::string host = url.host.find(':') == std::string::npos
                               ? url.host
                               : "[" + url.host + "]";
        if ((url.https && url.port == "443") ||
            (!url.https && url.port == "80")) {
            beast_req.set(http::field::host, host);
        } else {
            beast_req.set(http::field::host, host + ":" + url.port);
        }
        beast_req.set(http::field::user_agent, user_agent);
        apply_request_headers(req.headers, beast_req.base());
        beast_req.keep_alive(false);
        if (req.body.has_value()) {
            beast_req.body() = *req.body;
        }
        if (req.body.has_value() || req.method == HttpMethod::Post ||
            req.method == HttpMethod::Put || req.method == HttpMethod::Patch) {
            beast_req.prepare_payload();
        }
        return beast_req;
    }

    struct PreparedRequest {
        UrlComponents url;
        boost::beast::http::request<boost::beast::http::string_body> beast_req;
    };

    /// @brief Parse the request URL and build the wire request.
    /// @return InvalidUrl for a malformed URL, Unknown for an unmapped verb.
    inline Result<PreparedRequest> prepare_request(
        const Request& req, const std::string& user_agent) {
        auto parsed = parse_url(req.url);
        if (parsed.has_error()) return parsed.propagate<PreparedRequest>();

        if (to_boost_http_method(req.method) ==
            boost::beast::http::verb::unknown) {
            return Result<PreparedRequest>::err(Error::Code::Unknown,
                                                "Unknown HTTP method");
        }

        PreparedRequest out;
        out.url = std::move(parsed).value();
        out.beast_req = prepare_beast_request(req, out.url, user_agent);
        return Result<PreparedRequest>::ok(std::move(out));
    }

}  // namespace backend_client
