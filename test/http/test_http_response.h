#pragma once
#include "http/http_response.h"
#include <gtest/gtest.h>

namespace zsession::zhttp
{
    TEST(HttpResponseTest, StatusCodeAndMessage)
    {
        HttpResponse resp;
        resp.set_status_code(HttpResponse::StatusCode::NotFound);
        resp.set_status_message("Not Found");
        EXPECT_EQ(resp.get_status_code(), HttpResponse::StatusCode::NotFound);
        EXPECT_EQ(resp.get_status_message(), "Not Found");
    }

    TEST(HttpResponseTest, HeaderAndBody)
    {
        HttpResponse resp;
        resp.set_header("Content-Type", "text/plain");
        resp.set_body("Got: blue");
        EXPECT_EQ(resp.get_header("Content-Type"), "text/plain");
        EXPECT_EQ(resp.get_header("Missing"), "");
        EXPECT_EQ(resp.get_body(), "Got: blue");
    }

    TEST(HttpResponseTest, CookieToString)
    {
        Cookie cookie;
        cookie.name = "sid";
        cookie.value = "abc";
        EXPECT_EQ(cookie.to_string(), "sid=abc; Path=/");

        cookie.max_age = std::chrono::hours(24 * 30);
        cookie.http_only = true;
        cookie.secure = true;
        EXPECT_EQ(cookie.to_string(), "sid=abc; Path=/; Max-Age=2592000; HttpOnly; Secure");
    }

    TEST(HttpResponseTest, SameNameCookieIsReplaced)
    {
        HttpResponse resp;
        resp.add_cookie(Cookie{"sid", "first"});
        resp.add_cookie(Cookie{"theme", "dark"});
        resp.add_cookie(Cookie{"sid", "second"});

        ASSERT_EQ(resp.get_cookies().size(), 2u);
        EXPECT_EQ(resp.get_cookie("sid")->value, "second");
        EXPECT_EQ(resp.get_cookie("theme")->value, "dark");
        EXPECT_FALSE(resp.get_cookie("missing").has_value());
    }

    TEST(HttpResponseTest, ToString)
    {
        HttpResponse resp;
        resp.set_status_code(HttpResponse::StatusCode::OK);
        resp.set_status_message("OK");
        resp.add_cookie(Cookie{"sid", "abc"});
        resp.set_body("hello");

        const std::string out = resp.to_string();
        EXPECT_EQ(out.rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
        EXPECT_NE(out.find("Set-Cookie: sid=abc; Path=/\r\n"), std::string::npos);
        EXPECT_NE(out.find("Content-Length: 5\r\n"), std::string::npos);
        EXPECT_EQ(out.substr(out.size() - 9), "\r\n\r\nhello");
    }
} // namespace zsession::zhttp
