#pragma once
#include "session/session.h"
#include "session/session_error.h"
#include <gtest/gtest.h>
#include <thread>
#include <vector>

namespace zsession
{
    TEST(SessionTest, AttributeSetAndGet)
    {
        Session s("sid123");
        s.set_attribute("user", "alice");
        EXPECT_EQ(s.get_attribute("user"), "alice");
        EXPECT_FALSE(s.get_attribute("not_exist").has_value());
    }

    TEST(SessionTest, EmptyValueIsStillPresent)
    {
        Session s("sid");
        s.set_attribute("empty", "");
        ASSERT_TRUE(s.get_attribute("empty").has_value());
        EXPECT_EQ(*s.get_attribute("empty"), "");
    }

    TEST(SessionTest, RemoveAndClearAttributes)
    {
        Session s("sid456");
        s.set_attribute("a", "1");
        s.set_attribute("b", "2");
        s.remove_attribute("a");
        EXPECT_FALSE(s.get_attribute("a").has_value());
        EXPECT_EQ(s.get_attribute("b"), "2");
        s.clear_attributes();
        EXPECT_TRUE(s.get_attributes().empty());
    }

    TEST(SessionTest, ConstructWithValues)
    {
        Session s("sid", Values{{"color", "blue"}});
        EXPECT_EQ(s.get_session_id(), "sid");
        EXPECT_EQ(s.get_attribute("color"), "blue");
    }

    TEST(SessionTest, GetAttributesReturnsCopy)
    {
        Session s("sid");
        s.set_attribute("k", "v");
        Values copy = s.get_attributes();
        copy["k"] = "changed";
        EXPECT_EQ(s.get_attribute("k"), "v");
    }

    TEST(SessionTest, AttributesJson)
    {
        Session s("sid");
        s.set_attribute("user", "bob");
        s.set_attribute("role", "admin");
        const nlohmann::json j = s.get_attributes_json();
        EXPECT_TRUE(j.is_object());
        EXPECT_EQ(j["user"], "bob");
        EXPECT_EQ(j["role"], "admin");

        Session empty("sid2");
        EXPECT_EQ(empty.get_attributes_json().dump(), "{}");
    }

    TEST(SessionTest, ParseAttributesJson)
    {
        const Values values = Session::parse_attributes_json(R"({"a":"1","b":""})");
        ASSERT_EQ(values.size(), 2u);
        EXPECT_EQ(values.at("a"), "1");
        EXPECT_EQ(values.at("b"), "");
    }

    TEST(SessionTest, ParseAttributesJsonRejectsMalformed)
    {
        EXPECT_THROW(Session::parse_attributes_json("not json"), StorageException);
        EXPECT_THROW(Session::parse_attributes_json("[1,2]"), StorageException);
        EXPECT_THROW(Session::parse_attributes_json(R"({"a":1})"), StorageException);
    }

    TEST(SessionTest, UnboundSessionCannotCommit)
    {
        auto s = std::make_shared<Session>("sid");
        EXPECT_THROW(s->commit(), SessionException);
        EXPECT_THROW(s->clear(), SessionException);
    }

    TEST(SessionTest, ActionTokenDefaultsToError)
    {
        Session s("sid");
        EXPECT_EQ(s.action_token(), "error");
        EXPECT_FALSE(s.can_act());

        const std::string token = s.new_action_token();
        EXPECT_EQ(token.size(), 64u);
        EXPECT_EQ(s.action_token(), token);
    }

    TEST(SessionTest, ThreadSafety)
    {
        Session s("sid789");
        std::vector<std::thread> threads;
        threads.reserve(8);
        for (int i = 0; i < 8; ++i)
        {
            threads.emplace_back([&s, i]()
            {
                for (int j = 0; j < 100; ++j)
                {
                    s.set_attribute("key" + std::to_string(i), std::to_string(j));
                    (void) s.get_attribute("key" + std::to_string(i));
                }
            });
        }
        for (auto &t : threads)
        {
            t.join();
        }
        EXPECT_EQ(s.get_attributes().size(), 8u);
        EXPECT_EQ(s.get_attribute("key0"), "99");
    }
} // namespace zsession
