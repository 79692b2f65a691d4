#include "backend_client/middleware.hpp"

#include <chrono>
#include <string>

#include "backend_client/logging.hpp"

namespace backend_client {

    Result<Response> TracingTransport::round_trip(
        const Request& req, const RequestContext& ctx) const {
        const auto start = std::chrono::steady_clock::now();
        Result<Response> res = inner()->round_trip(req, ctx);
        const auto elapsed_ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - start)
                .count();

        auto log = logger();
        if (res.has_value()) {
            log->debug("{} {} -> {} ({} ms)", to_string(req.method), req.url,
                       res.value().status_code, elapsed_ms);
        } else {
            log->debug("{} {} -> {}: {} ({} ms)", to_string(req.method),
                       req.url, to_string(res.error().code),
                       res.error().message, elapsed_ms);
        }
        return res;
    }

    Result<Response> CorrelationTransport::round_trip(
        const Request& req, const RequestContext& ctx) const {
        if (!ctx.correlation_id || ctx.correlation_id->empty() ||
            has_header(req, kCorrelationHeader)) {
            return inner()->round_trip(req, ctx);
        }

        Request copy = req;
        copy.headers.emplace(std::string(kCorrelationHeader),
                             *ctx.correlation_id);
        return inner()->round_trip(copy, ctx);
    }

    TransportDecorator tracing_decorator() {
        return [](std::shared_ptr<Transport> inner) -> std::shared_ptr<Transport> {
            return std::make_shared<TracingTransport>(std::move(inner));
        };
    }

    TransportDecorator correlation_decorator() {
        return [](std::shared_ptr<Transport> inner) -> std::shared_ptr<Transport> {
            return std::make_shared<CorrelationTransport>(std::move(inner));
        };
    }

    std::shared_ptr<Transport> instrument(
        std::shared_ptr<Transport> base,
        const std::vector<TransportDecorator>& extra) {
        std::shared_ptr<Transport> t =
            correlation_decorator()(tracing_decorator()(std::move(base)));
        for (const auto& decorate : extra) {
            if (decorate) t = decorate(std::move(t));
        }
        return t;
    }

}  // namespace backend_client
