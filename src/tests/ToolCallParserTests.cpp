// SPDX-License-Identifier: Apache-2.0
#include <mcp/ToolCallParser.hpp>

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using namespace toolbridge;

TEST_CASE("parseToolCalls extracts an inline call", "[parser]")
{
    auto const calls = parseToolCalls(R"([MCP_TOOL_CALL] server=filesystem tool=search args={"query": "test"})");

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].serverId == "filesystem");
    CHECK(calls[0].toolName == "search");
    CHECK(calls[0].args == nlohmann::json { { "query", "test" } });
}

TEST_CASE("parseToolCalls extracts several calls separated by prose", "[parser]")
{
    auto const text = std::string(R"(Let me look that up.
[MCP_TOOL_CALL] server=filesystem tool=read_file args={"path": "/tmp/a.txt"}
Then I will search the web.
[MCP_TOOL_CALL] server=web tool=search args={"query": "weather", "limit": 3}
Done.)");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0].serverId == "filesystem");
    CHECK(calls[0].toolName == "read_file");
    CHECK(calls[0].args["path"] == "/tmp/a.txt");
    CHECK(calls[1].serverId == "web");
    CHECK(calls[1].toolName == "search");
    CHECK(calls[1].args["limit"] == 3);
}

TEST_CASE("parseToolCalls extracts a fenced multi-line call", "[parser]")
{
    auto const text = std::string(R"([MCP_TOOL_CALL] server=db tool=query args=```json
{
  "sql": "SELECT * FROM users",
  "options": {
    "limit": 10
  }
}
```)");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].serverId == "db");
    CHECK(calls[0].toolName == "query");
    CHECK(calls[0].args["sql"] == "SELECT * FROM users");
    CHECK(calls[0].args["options"]["limit"] == 10);
}

TEST_CASE("parseToolCalls extracts an unfenced nested object running to the next call", "[parser]")
{
    auto const text = std::string(R"([MCP_TOOL_CALL] server=db tool=insert args={"row": {"id": 1, "tags": ["a"]}}
[MCP_TOOL_CALL] server=db tool=count args={"table": "users"})");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0].toolName == "count");
    CHECK(calls[1].toolName == "insert");
    CHECK(calls[1].args["row"]["tags"][0] == "a");
}

TEST_CASE("parseToolCalls returns nothing for text without calls", "[parser]")
{
    CHECK(parseToolCalls("").empty());
    CHECK(parseToolCalls("This is just a regular response without any tool calls.").empty());
    CHECK(parseToolCalls("Mentioning [MCP_TOOL_CALL] without the rest").empty());
}

TEST_CASE("parseToolCalls skips calls with malformed arguments", "[parser]")
{
    auto const text = std::string(R"([MCP_TOOL_CALL] server=fs tool=broken args={not valid json}
[MCP_TOOL_CALL] server=fs tool=list args={"dir": "/"})");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].toolName == "list");
}

TEST_CASE("parseToolCalls skips calls whose arguments are not an object", "[parser]")
{
    auto const calls = parseToolCalls("[MCP_TOOL_CALL] server=fs tool=list args=```json\n[1, 2]\n```");
    CHECK(calls.empty());
}

TEST_CASE("parseToolCalls removes duplicate calls", "[parser]")
{
    auto const text = std::string(R"([MCP_TOOL_CALL] server=fs tool=read args={"path": "/a", "mode": "r"}
Retrying:
[MCP_TOOL_CALL] server=fs tool=read args={"mode": "r", "path": "/a"}
[MCP_TOOL_CALL] server=fs tool=read args={"path": "/b"})");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0].args["path"] == "/a");
    CHECK(calls[1].args["path"] == "/b");
    CHECK(toolCallKey(calls[0]) == R"(fs:read:{"mode":"r","path":"/a"})");
}

TEST_CASE("parseToolCalls treats the inline and fenced forms of one call as the same call", "[parser]")
{
    auto const text = std::string(R"(First try:
[MCP_TOOL_CALL] server=fs tool=read_file args={"path":"/a"}
Same again, fenced:
[MCP_TOOL_CALL] server=fs tool=read_file args=```json
{
  "path": "/a"
}
```)");

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].serverId == "fs");
    CHECK(calls[0].toolName == "read_file");
    CHECK(calls[0].args == nlohmann::json { { "path", "/a" } });
}

TEST_CASE("parseToolCalls handles a call followed by a very long answer", "[parser]")
{
    auto text = std::string(R"([MCP_TOOL_CALL] server=fs tool=read_file args={"path": "a.txt"})");
    text += "\n";
    text += std::string(200 * 1024, 'x');

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 1);
    CHECK(calls[0].args["path"] == "a.txt");
}

TEST_CASE("parseToolCalls handles long prose between calls", "[parser]")
{
    auto const prose = std::string(100 * 1024, 'y') + "\n";
    auto const text = prose + R"([MCP_TOOL_CALL] server=a tool=one args={"n": 1})" + "\n" + prose
                      + R"([MCP_TOOL_CALL] server=b tool=two args={"n": 2})" + "\n" + prose;

    auto const calls = parseToolCalls(text);

    REQUIRE(calls.size() == 2);
    CHECK(calls[0].serverId == "a");
    CHECK(calls[1].serverId == "b");
}

TEST_CASE("parseToolCalls ignores incomplete headers", "[parser]")
{
    CHECK(parseToolCalls("[MCP_TOOL_CALL] server= tool=x args={\"a\": 1}").empty());
    CHECK(parseToolCalls("[MCP_TOOL_CALL] server=fs tool=x").empty());
    CHECK(parseToolCalls("[MCP_TOOL_CALL] server=fs tool=x args=```json\n{\"a\": 1}\n").empty());
    CHECK(parseToolCalls("[MCP_TOOL_CALL] server=fstool=x args={\"a\": 1}").empty());
}

TEST_CASE("formatToolCallForAgent formats simple arguments inline", "[parser]")
{
    auto const text = formatToolCallForAgent("fs", "list", nlohmann::json::object());
    CHECK(text == "[MCP_TOOL_CALL] server=fs tool=list args={}");
}

TEST_CASE("formatToolCallForAgent fences structured arguments", "[parser]")
{
    auto const args = nlohmann::json { { "path", "/tmp/a.txt" }, { "options", { { "recursive", true } } } };
    auto const text = formatToolCallForAgent("filesystem", "read_file", args);

    CHECK(text.starts_with("[MCP_TOOL_CALL] server=filesystem tool=read_file args="));
    CHECK(text.find("```json") != std::string::npos);
    CHECK(text.ends_with("```"));
}

TEST_CASE("formatToolCallForAgent output parses back to the same call", "[parser]")
{
    auto const original = ParsedToolCall {
        .serverId = "filesystem",
        .toolName = "read_file",
        .args = { { "path", "/tmp/{braces}.txt" }, { "lines", { 1, 2, 3 } } },
    };

    auto const calls = parseToolCalls("Calling now:\n" + formatToolCallForAgent(original) + "\n");

    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == original);
}

TEST_CASE("formatToolCallForAgent round-trips assorted argument shapes", "[parser]")
{
    auto const shapes = std::vector<nlohmann::json> {
        nlohmann::json::object(),
        { { "path", "/a" } },
        { { "outer", { { "inner", { { "deep", true } } } } } },
        { { "list", { 1, "two", nullptr, 3.5 } }, { "empty", nlohmann::json::array() } },
        { { "text", "closing } brace and {open" } },
        { { "text", "line one\nline two\n" } },
        { { "content", std::string(100 * 1024, 'z') } },
    };

    for (auto const& args: shapes)
    {
        auto const original = ParsedToolCall { .serverId = "fs", .toolName = "write_file", .args = args };
        auto const calls = parseToolCalls(formatToolCallForAgent(original));

        INFO(args.dump().substr(0, 80));
        REQUIRE(calls.size() == 1);
        CHECK(calls[0] == original);
    }
}

TEST_CASE("parsedToolCallsToJson lists calls in order", "[parser]")
{
    auto const calls = std::vector<ParsedToolCall> {
        { .serverId = "a", .toolName = "x", .args = { { "k", 1 } } },
        { .serverId = "b", .toolName = "y", .args = nlohmann::json::object() },
    };

    auto const rendered = parsedToolCallsToJson(calls);
    REQUIRE(rendered.size() == 2);
    CHECK(rendered[0]["serverId"] == "a");
    CHECK(rendered[0]["toolName"] == "x");
    CHECK(rendered[0]["args"]["k"] == 1);
    CHECK(rendered[1]["serverId"] == "b");
}
