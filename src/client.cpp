#include "backend_client/client.hpp"

#include <chrono>

#include "backend_client/url.hpp"

namespace backend_client {

    std::string HttpClient::url_for(std::string_view path) const {
        return url_utils::join_host_and_path(m_host, path);
    }

    Result<Response> HttpClient::send(const Request& request,
                                      const RequestContext& ctx) const {
        using clock = RequestContext::clock;
        const auto now = clock::now();

        // A timeout reaching past the clock's range leaves the caller's
        // deadline as it is.
        RequestContext bounded = ctx;
        if (m_timeout < std::chrono::duration_cast<std::chrono::seconds>(
                            clock::time_point::max() - now)) {
            bounded = ctx.with_deadline_at_most(
                now + std::chrono::duration_cast<clock::duration>(m_timeout));
        }

        if (url_utils::has_prefix(request.url, kHttpProtocol) ||
            url_utils::has_prefix(request.url, kHttpsProtocol)) {
            return m_transport->round_trip(request, bounded);
        }

        Request resolved = request;
        resolved.url = url_for(request.url);
        return m_transport->round_trip(resolved, bounded);
    }

    Result<Response> HttpClient::get(std::string_view path,
                                     const RequestContext& ctx) const {
        Request r{HttpMethod::Get, url_for(path), {}, std::nullopt};
        return send(r, ctx);
    }

    Result<Response> HttpClient::head(std::string_view path,
                                      const RequestContext& ctx) const {
        Request r{HttpMethod::Head, url_for(path), {}, std::nullopt};
        return send(r, ctx);
    }

    Result<Response> HttpClient::del(std::string_view path,
                                     const RequestContext& ctx) const {
        Request r{HttpMethod::Delete, url_for(path), {}, std::nullopt};
        return send(r, ctx);
    }

    Result<Response> HttpClient::options(std::string_view path,
                                         const RequestContext& ctx) const {
        Request r{HttpMethod::Options, url_for(path), {}, std::nullopt};
        return send(r, ctx);
    }

    Result<Response> HttpClient::post(std::string_view path, std::string body,
                                      const RequestContext& ctx) const {
        Request r{HttpMethod::Post, url_for(path), {}, std::move(body)};
        return send(r, ctx);
    }

    Result<Response> HttpClient::put(std::string_view path, std::string body,
                                     const RequestContext& ctx) const {
        Request r{HttpMethod::Put, url_for(path), {}, std::move(body)};
        return send(r, ctx);
    }

    Result<Response> HttpClient::patch(std::string_view path, std::string body,
                                       const RequestContext& ctx) const {
        Request r{HttpMethod::Patch, url_for(path), {}, std::move(body)};
        return send(r, ctx);
    }

}  // namespace backend_client
