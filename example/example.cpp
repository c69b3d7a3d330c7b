#include "log/logger.h"
#include "session/memory_storage.h"
#include "session/session_error.h"
#include "session/session_manager.h"
#include <iostream>

namespace
{
    const std::string kCookieName = "example_sid";

    // clear=true 清空会话；get=<key> 读取属性；put=<key>&value=<v> 写入属性
    void handle(zsession::SessionManager &manager, const zsession::zhttp::HttpRequest &req,
                zsession::zhttp::HttpResponse *resp)
    {
        auto session = manager.begin_session(req, resp);
        resp->set_status_code(zsession::zhttp::HttpResponse::StatusCode::OK);
        resp->set_status_message("OK");
        resp->set_header("Content-Type", "text/plain");

        if (!req.get_form_value("clear").empty())
        {
            session->clear();
        }

        if (const std::string key = req.get_form_value("get"); !key.empty())
        {
            const auto value = session->get_attribute(key);
            resp->set_body(value ? "Got: " + *value : "NotFound");
        }
        else if (const std::string put_key = req.get_form_value("put"); !put_key.empty())
        {
            session->set_attribute(put_key, req.get_form_value("value"));
            resp->set_body("");
        }

        session->commit();
    }

    // 模拟浏览器：带上上一次响应设置的Cookie
    std::string send(zsession::SessionManager &manager, const std::string &query, std::string &cookie)
    {
        zsession::zhttp::HttpRequest req;
        req.set_method(zsession::zhttp::HttpRequest::Method::GET);
        req.set_path("/");
        req.set_query_parameters(query);
        if (!cookie.empty())
        {
            req.set_header("Cookie", kCookieName + "=" + cookie);
        }

        zsession::zhttp::HttpResponse resp;
        handle(manager, req, &resp);
        if (const auto c = resp.get_cookie(kCookieName))
        {
            cookie = c->value;
        }

        std::cout << "GET /?" << query << zsession::zhttp::delim << resp.to_string() << std::endl << std::endl;
        return resp.get_body();
    }
} // namespace

int main()
{
    zsession::Log::Init(zlog::LogLevel::value::INFO);
    ZSESSION_LOG_INFO("Starting session example");

    try
    {
        auto storage = zsession::StorageFactory<zsession::zstore::MemoryStorage, std::chrono::seconds>::create(
            std::chrono::hours(1));

        zsession::SessionConfig config = zsession::SessionConfig::default_config(kCookieName);
        config.gc_delay = std::chrono::minutes(10);
        zsession::SessionManager manager(storage, config);

        std::string cookie;
        send(manager, "get=nothing", cookie);
        const std::string first_sid = cookie;
        send(manager, "put=color&value=blue", cookie);
        send(manager, "get=color", cookie);
        send(manager, "clear=true&get=color", cookie);

        ZSESSION_LOG_INFO("Session id changed after clear: {}", first_sid != cookie ? "yes" : "no");

        manager.shutdown();
    }
    catch (const zsession::SessionException &e)
    {
        ZSESSION_LOG_FATAL("Session example failed: {}", e.what());
        return 1;
    }
    catch (const std::exception &e)
    {
        ZSESSION_LOG_FATAL("Unexpected error: {}", e.what());
        return 1;
    }

    return 0;
}
