#include "mcptool/content.hpp"

#include <cassert>

int main()
{
    using namespace mcptool;
    TextContent t{"text", "Hello"};
    Json jt = t;
    assert(jt.at("type") == "text");
    assert(jt.at("text") == "Hello");

    auto ok = CallToolResult::success("done");
    Json jok = ok;
    assert(jok["isError"] == false);
    assert(jok["content"].size() == 1);
    assert(jok["content"][0]["text"] == "done");
    assert(!jok.contains("_meta"));
    assert(!ok.failed());

    auto err = CallToolResult::error("Failed to fetch URL: timeout");
    assert(err.failed());
    assert(Json(err)["isError"] == true);

    // Round trip keeps content, isError and _meta.
    CallToolResult original = CallToolResult::success("a");
    original.content.push_back(Json{{"type", "text"}, {"text", "b"}});
    original.meta = Json{{"source", "test"}, {"n", 2}};
    auto back = Json(original).get<CallToolResult>();
    assert(back.content == original.content);
    assert(back.is_error == original.is_error);
    assert(back.meta == original.meta);

    // isError absent stays absent.
    auto bare = Json{{"content", Json::array()}}.get<CallToolResult>();
    assert(!bare.is_error.has_value());
    assert(!Json(bare).contains("isError"));
    assert(!bare.failed());
    return 0;
}
