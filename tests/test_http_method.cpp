#include <gtest/gtest.h>

#include <boost/beast/http.hpp>
#include <string>

#include "backend_client/http_method.hpp"

using namespace backend_client;
namespace http = boost::beast::http;

TEST(HttpMethodTest, MapsEveryVerbToBeast) {
    EXPECT_EQ(to_boost_http_method(HttpMethod::Get), http::verb::get);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Post), http::verb::post);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Put), http::verb::put);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Patch), http::verb::patch);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Delete), http::verb::delete_);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Head), http::verb::head);
    EXPECT_EQ(to_boost_http_method(HttpMethod::Options), http::verb::options);
}

TEST(HttpMethodTest, NamesMatchBeastVerbStrings) {
    for (HttpMethod m : {HttpMethod::Get, HttpMethod::Post, HttpMethod::Put,
                         HttpMethod::Patch, HttpMethod::Delete,
                         HttpMethod::Head, HttpMethod::Options}) {
        EXPECT_EQ(std::string(to_string(m)),
                  std::string(http::to_string(to_boost_http_method(m))));
    }
}

TEST(HttpMethodTest, OutOfRangeValue) {
    const auto bogus = static_cast<HttpMethod>(999);
    EXPECT_EQ(to_boost_http_method(bogus), http::verb::unknown);
    EXPECT_STREQ(to_string(bogus), "UNKNOWN");
}
