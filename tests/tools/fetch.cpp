/// @file fetch.cpp
/// @brief FetchTool against a local httplib server

#include "mcptool/tools/fetch.hpp"
#include "mcptool/tools/typed_tool.hpp"

#include <httplib.h>

#include <cassert>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

using namespace mcptool;
using namespace mcptool::tools;

static std::string text_of(const CallToolResult& r)
{
    assert(r.content.size() == 1);
    return r.content[0].at("text").get<std::string>();
}

int main()
{
    httplib::Server svr;
    std::mutex seen_mutex;
    std::string seen_user_agent;

    svr.Get("/robots.txt",
            [](const httplib::Request&, httplib::Response& res)
            { res.set_content("User-agent: *\nDisallow: /private/\n", "text/plain"); });
    svr.Get("/test",
            [&](const httplib::Request& req, httplib::Response& res)
            {
                {
                    std::lock_guard<std::mutex> lock(seen_mutex);
                    seen_user_agent = req.get_header_value("User-Agent");
                }
                res.set_content("<html><body><h1>Test Page</h1><p>Content</p></body></html>",
                                "text/html");
            });
    svr.Get("/private/test", [](const httplib::Request&, httplib::Response& res)
            { res.set_content("secret", "text/plain"); });
    svr.Get("/limited", [](const httplib::Request&, httplib::Response& res)
            { res.set_content("1234567890", "text/plain"); });
    svr.Get("/redirect", [](const httplib::Request&, httplib::Response& res)
            { res.set_redirect("/limited"); });
    svr.Get("/not-found", [](const httplib::Request&, httplib::Response& res)
            { res.status = 404; });

    int port = svr.bind_to_any_port("127.0.0.1");
    assert(port > 0);
    std::thread th([&]() { svr.listen_after_bind(); });
    svr.wait_until_ready();

    const std::string base = "http://127.0.0.1:" + std::to_string(port);
    TypedTool<FetchTool> fetch(FetchTool{});

    std::cout << "Test 1: HTML page is converted to markdown...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/test"}});
        assert(!r.failed());
        assert(text_of(r) == "# Test Page\n\nContent");
        std::lock_guard<std::mutex> lock(seen_mutex);
        assert(seen_user_agent.rfind("mcptool/", 0) == 0);
    }
    std::cout << "  [PASS] markdown returned\n";

    std::cout << "Test 2: robots.txt denial...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/private/test"}});
        assert(r.failed());
        assert(text_of(r).rfind("Access denied by robots.txt", 0) == 0);
    }
    std::cout << "  [PASS] disallowed path reported as isError\n";

    std::cout << "Test 3: raw content...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/test"}, {"raw", true}});
        assert(!r.failed());
        assert(text_of(r).find("<html><body>") != std::string::npos);
    }
    std::cout << "  [PASS] raw body returned unchanged\n";

    std::cout << "Test 4: start_index and max_length...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/limited"}, {"max_length", 5}});
        assert(text_of(r) == "12345");
        r = fetch.call(Json{{"url", base + "/limited"}, {"start_index", 5}});
        assert(text_of(r) == "67890");
        r = fetch.call(Json{{"url", base + "/limited"}, {"start_index", 50}});
        assert(!r.failed());
        assert(text_of(r).empty());
    }
    std::cout << "  [PASS] window applied\n";

    std::cout << "Test 5: redirects are followed...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/redirect"}});
        assert(!r.failed());
        assert(text_of(r) == "1234567890");
    }
    std::cout << "  [PASS] redirect followed\n";

    std::cout << "Test 6: failures are isError results...\n";
    {
        auto r = fetch.call(Json{{"url", base + "/not-found"}});
        assert(r.failed());
        assert(text_of(r) == "Failed to fetch URL: HTTP status 404");

        r = fetch.call(Json{{"url", "not-a-url"}});
        assert(r.failed());
        assert(text_of(r).rfind("Invalid URL: ", 0) == 0);

        r = fetch.call(Json{{"url", "ftp://example.com/file"}});
        assert(r.failed());
    }
    std::cout << "  [PASS] 404 and invalid URLs reported\n";

    std::cout << "Test 7: robots.txt can be ignored...\n";
    {
        FetchOptions options;
        options.respect_robots_txt = false;
        FetchTool lenient(options);
        FetchTool::Properties p;
        p.url = base + "/private/test";
        auto r = lenient.call(p);
        assert(!r.failed());
        assert(text_of(r) == "secret");
    }
    std::cout << "  [PASS] robots check skipped\n";

    svr.stop();
    th.join();

    std::cout << "Test 8: unreachable host...\n";
    {
        FetchOptions options;
        options.timeout_seconds = 2;
        FetchTool quick(options);
        FetchTool::Properties p;
        p.url = base + "/test";
        auto r = quick.call(p);
        assert(r.failed());
        assert(text_of(r).rfind("Failed to fetch URL: ", 0) == 0);
    }
    std::cout << "  [PASS] connection failure reported\n";
    return 0;
}
