#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "backend_client/middleware.hpp"
#include "support/capture_logger.hpp"

using namespace backend_client;

namespace {

    /// Records the last request it was given and answers with a canned
    /// result.
    class RecordingTransport final : public Transport {
       public:
        explicit RecordingTransport(TransportKind kind = TransportKind::Http)
            : m_kind(kind) {}

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& /*ctx*/) const override {
            last = req;
            ++calls;
            if (fail) {
                return Result<Response>::err(Error::Code::ConnectionFailed,
                                             "refused");
            }
            Response res;
            res.status_code = 204;
            res.body = "inner";
            return Result<Response>::ok(std::move(res));
        }

        TransportKind kind() const noexcept override { return m_kind; }

        mutable Request last{};
        mutable int calls{0};
        bool fail{false};

       private:
        TransportKind m_kind;
    };

    /// Appends its tag to a shared trace so tests can see wrapping order.
    class TaggingTransport final : public DecoratingTransport {
       public:
        TaggingTransport(std::shared_ptr<Transport> inner, std::string tag,
                         std::shared_ptr<std::vector<std::string>> trace)
            : DecoratingTransport(std::move(inner)),
              m_tag(std::move(tag)),
              m_trace(std::move(trace)) {}

        Result<Response> round_trip(const Request& req,
                                    const RequestContext& ctx) const override {
            m_trace->push_back(m_tag);
            return inner()->round_trip(req, ctx);
        }

       private:
        std::string m_tag;
        std::shared_ptr<std::vector<std::string>> m_trace;
    };

    TransportDecorator tag(std::string name,
                           std::shared_ptr<std::vector<std::string>> trace) {
        return [name, trace](std::shared_ptr<Transport> inner)
                   -> std::shared_ptr<Transport> {
            return std::make_shared<TaggingTransport>(std::move(inner), name,
                                                      trace);
        };
    }

    Request get(const std::string& url) {
        return Request{HttpMethod::Get, url, {}, std::nullopt};
    }

}  // namespace

TEST(CorrelationTransportTest, AddsHeaderFromContext) {
    auto inner = std::make_shared<RecordingTransport>();
    CorrelationTransport t(inner);

    RequestContext ctx;
    ctx.correlation_id = "corr-123";
    auto res = t.round_trip(get("http://host/x"), ctx);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(inner->last.headers.at("X-Request-Id"), "corr-123");
}

TEST(CorrelationTransportTest, KeepsExistingHeader) {
    auto inner = std::make_shared<RecordingTransport>();
    CorrelationTransport t(inner);

    Request req = get("http://host/x");
    req.headers["x-request-id"] = "caller";
    RequestContext ctx;
    ctx.correlation_id = "corr-123";
    auto res = t.round_trip(req, ctx);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(inner->last.headers.size(), 1u);
    EXPECT_EQ(inner->last.headers.at("x-request-id"), "caller");
}

TEST(CorrelationTransportTest, NoIdLeavesRequestUnchanged) {
    auto inner = std::make_shared<RecordingTransport>();
    CorrelationTransport t(inner);

    auto res = t.round_trip(get("http://host/x"), RequestContext{});
    ASSERT_TRUE(res.has_value());
    EXPECT_TRUE(inner->last.headers.empty());
    EXPECT_EQ(inner->last.url, "http://host/x");
}

TEST(TracingTransportTest, ForwardsResultAndLogs) {
    test_support::CaptureLogger capture;
    auto inner = std::make_shared<RecordingTransport>();
    TracingTransport t(inner);

    auto res = t.round_trip(get("http://host/traced"), RequestContext{});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().status_code, 204);
    EXPECT_EQ(res.value().body, "inner");
    EXPECT_TRUE(capture.contains("GET http://host/traced -> 204"));
}

TEST(TracingTransportTest, ForwardsErrorUnchanged) {
    test_support::CaptureLogger capture;
    auto inner = std::make_shared<RecordingTransport>();
    inner->fail = true;
    TracingTransport t(inner);

    auto res = t.round_trip(get("http://host/down"), RequestContext{});
    ASSERT_TRUE(res.has_error());
    EXPECT_EQ(res.error().code, Error::Code::ConnectionFailed);
    EXPECT_EQ(res.error().message, "refused");
    EXPECT_TRUE(capture.contains("connection_failed"));
}

TEST(DecoratingTransportTest, ReportsInnerKind) {
    auto inner = std::make_shared<RecordingTransport>(TransportKind::UnixSocket);
    auto outer = instrument(inner, {});
    EXPECT_EQ(outer->kind(), TransportKind::UnixSocket);
    EXPECT_EQ(outer->tls_settings(), nullptr);
}

TEST(InstrumentTest, CallerDecoratorsWrapBuiltIns) {
    auto trace = std::make_shared<std::vector<std::string>>();
    auto inner = std::make_shared<RecordingTransport>();
    auto outer = instrument(inner, {tag("first", trace), tag("second", trace)});

    RequestContext ctx;
    ctx.correlation_id = "abc";
    auto res = outer->round_trip(get("http://host/"), ctx);
    ASSERT_TRUE(res.has_value());

    // Last decorator is outermost, so it runs first.
    ASSERT_EQ(trace->size(), 2u);
    EXPECT_EQ((*trace)[0], "second");
    EXPECT_EQ((*trace)[1], "first");
    EXPECT_EQ(inner->calls, 1);
    EXPECT_EQ(inner->last.headers.at("X-Request-Id"), "abc");
}
