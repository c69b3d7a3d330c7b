#pragma once
#include "session/session_manager.h"
#include "session/memory_storage.h"
#include <gtest/gtest.h>

namespace zsession
{
    /*
     * 模拟一个使用会话的处理函数:
     *   clear=true      清空会话
     *   get=<key>       返回 "Got: <value>" 或 "NotFound"
     *   put=<key>&value 写入属性
     */
    class SessionFlowTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            storage = std::make_shared<zstore::MemoryStorage>(std::chrono::hours(1));
            manager = std::make_unique<SessionManager>(storage, "flow_sid");
        }

        // 发送一次请求，返回响应正文，并跟踪响应中的会话Cookie
        std::string send(const std::string &query)
        {
            zhttp::HttpRequest request;
            request.set_method(zhttp::HttpRequest::Method::GET);
            request.set_path("/");
            request.set_query_parameters(query);
            if (!cookie.empty())
            {
                request.set_header("Cookie", "flow_sid=" + cookie);
            }

            zhttp::HttpResponse response;
            handle(request, &response);

            if (const auto c = response.get_cookie("flow_sid"))
            {
                cookie = c->value;
            }
            return response.get_body();
        }

        void handle(const zhttp::HttpRequest &request, zhttp::HttpResponse *response)
        {
            auto session = manager->begin_session(request, response);
            response->set_status_code(zhttp::HttpResponse::StatusCode::OK);
            response->set_status_message("OK");

            if (!request.get_form_value("clear").empty())
            {
                session->clear();
            }

            if (const std::string key = request.get_form_value("get"); !key.empty())
            {
                const auto value = session->get_attribute(key);
                response->set_body(value ? "Got: " + *value : "NotFound");
            }
            else if (const std::string put_key = request.get_form_value("put"); !put_key.empty())
            {
                session->set_attribute(put_key, request.get_form_value("value"));
                response->set_body("");
            }

            session->commit();
        }

        std::shared_ptr<zstore::MemoryStorage> storage;
        std::unique_ptr<SessionManager> manager;
        std::string cookie;
    };

    TEST_F(SessionFlowTest, GetPutClear)
    {
        EXPECT_EQ(send("get=nothing"), "NotFound");
        const std::string first_sid = cookie;
        ASSERT_EQ(first_sid.size(), 64u);

        EXPECT_EQ(send("put=color&value=blue"), "");
        EXPECT_EQ(cookie, first_sid);

        EXPECT_EQ(send("get=color"), "Got: blue");
        EXPECT_EQ(cookie, first_sid);

        EXPECT_EQ(send("clear=true&get=color"), "NotFound");
        EXPECT_FALSE(cookie.empty());
        EXPECT_NE(cookie, first_sid);

        EXPECT_EQ(storage->fetch(first_sid), nullptr);
        EXPECT_EQ(send("get=color"), "NotFound");
    }

    TEST_F(SessionFlowTest, ValuesWithSpacesAndEscapes)
    {
        EXPECT_EQ(send("put=greeting&value=hello+big%20world"), "");
        EXPECT_EQ(send("get=greeting"), "Got: hello big world");
    }
} // namespace zsession
