#pragma once

#include <boost/asio/error.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core/error.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/error.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/write.hpp>
#include <boost/system/error_code.hpp>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

#include "../response.hpp"
#include "../result.hpp"
#include "../transport.hpp"

namespace backend_client::detail {

    /// @brief Why a watched run of the io_context was cut short.
    enum class Interrupt { None, Cancelled, Expired };

    /// @brief How often a running request looks at its context.
    inline constexpr std::chrono::milliseconds kContextPollInterval{10};

    /**
     * @brief Drive the io_context until every pending operation completes.
     *
     * While it runs, the request context is polled; once it is cancelled or
     * its deadline has passed, `abort` is called exactly once so the pending
     * operations complete with an error.
     */
    template <class Abort>
    Interrupt run(boost::asio::io_context& ioc, const RequestContext& ctx,
                  Abort&& abort) {
        ioc.restart();
        if (!ctx.cancelled && !ctx.deadline) {
            ioc.run();
            return Interrupt::None;
        }

        Interrupt why = Interrupt::None;
        while (!ioc.stopped()) {
            ioc.run_for(kContextPollInterval);
            if (why != Interrupt::None || ioc.stopped()) continue;
            if (ctx.is_cancelled()) {
                why = Interrupt::Cancelled;
            } else if (ctx.expired()) {
                why = Interrupt::Expired;
            }
            if (why != Interrupt::None) abort();
        }
        return why;
    }

    /// @brief run() for an operation on `stream`; aborting closes it.
    template <class Stream>
    Interrupt run_on(boost::asio::io_context& ioc, Stream& stream,
                     const RequestContext& ctx) {
        return run(ioc, ctx, [&stream] {
            boost::beast::get_lowest_layer(stream).close();
        });
    }

    /// @brief Error for a Boost failure, mapping stream expiry to Timeout.
    inline Error make_error(Error::Code code, const std::string& what,
                            const boost::system::error_code& ec) {
        if (ec == boost::beast::error::timeout) {
            return Error{Error::Code::Timeout, what + ": deadline exceeded"};
        }
        return Error{code, what + ": " + ec.message()};
    }

    /// @brief Error for an operation abandoned because of its context.
    inline Error interrupt_error(Interrupt why, const std::string& what) {
        if (why == Interrupt::Cancelled) {
            return Error{Error::Code::Cancelled, what + ": request cancelled"};
        }
        return Error{Error::Code::Timeout, what + ": deadline exceeded"};
    }

    inline Result<Response> fail(Error::Code code, const std::string& what,
                                 const boost::system::error_code& ec) {
        return Result<Response>::err(make_error(code, what, ec));
    }

    /// @brief Fail fast before any I/O when the caller already gave up.
    inline std::optional<Error> check_context(const RequestContext& ctx) {
        if (ctx.is_cancelled()) {
            return Error{Error::Code::Cancelled, "request cancelled"};
        }
        if (ctx.expired()) {
            return Error{Error::Code::Timeout, "deadline exceeded"};
        }
        return std::nullopt;
    }

    /// @brief Apply the context deadline to the lowest layer of `stream`.
    template <class Stream>
    void arm_deadline(Stream& stream, const RequestContext& ctx) {
        auto& lowest = boost::beast::get_lowest_layer(stream);
        if (ctx.deadline) {
            lowest.expires_at(*ctx.deadline);
        } else {
            lowest.expires_never();
        }
    }

    /**
     * @brief Write one request on a connected stream and read its response.
     *
     * Works for any Beast stream (TCP, TLS or Unix socket) whose lowest
     * layer is a basic_stream bound to `ioc`. Cancelling `ctx` closes the
     * stream mid-exchange.
     */
    template <class Stream>
    Result<Response> exchange(
        boost::asio::io_context& ioc, Stream& stream,
        boost::beast::http::request<boost::beast::http::string_body>& req,
        std::size_t max_body_bytes, const RequestContext& ctx) {
        namespace http = boost::beast::http;
        boost::system::error_code ec;

        http::async_write(stream, req,
                          [&ec](boost::system::error_code e, std::size_t) {
                              ec = e;
                          });
        if (auto why = run_on(ioc, stream, ctx); why != Interrupt::None) {
            return Result<Response>::err(interrupt_error(why, "write"));
        }
        if (ec) return fail(Error::Code::SendFailed, "write failed", ec);

        boost::beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(max_body_bytes);

        http::async_read(stream, buffer, parser,
                         [&ec](boost::system::error_code e, std::size_t) {
                             ec = e;
                         });
        if (auto why = run_on(ioc, stream, ctx); why != Interrupt::None) {
            return Result<Response>::err(interrupt_error(why, "read"));
        }
        if (ec) return fail(Error::Code::ReceiveFailed, "read failed", ec);

        return Result<Response>::ok(parse_beast_response(parser.release()));
    }

}  // namespace backend_client::detail
