// SPDX-License-Identifier: Apache-2.0
#include "ToolCallParser.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <cctype>
#include <format>
#include <optional>
#include <set>

namespace toolbridge
{

namespace
{
    constexpr auto Fence = std::string_view { "```" };
    constexpr auto JsonFence = std::string_view { "```json" };

    /// @brief A call header: the fields before the arguments, and where the arguments start.
    struct CallHeader
    {
        std::string serverId;
        std::string toolName;
        std::string_view args;
    };

    [[nodiscard]] auto isSpace(char ch) noexcept -> bool
    {
        return std::isspace(static_cast<unsigned char>(ch)) != 0;
    }

    [[nodiscard]] auto skipSpaces(std::string_view text, std::size_t pos) noexcept -> std::size_t
    {
        while (pos < text.size() && isSpace(text[pos]))
            ++pos;
        return pos;
    }

    /// @brief Reads `<key><value>` at pos, where the value runs up to the next whitespace.
    [[nodiscard]] auto readField(std::string_view text, std::size_t& pos, std::string_view key)
        -> std::optional<std::string>
    {
        if (!text.substr(pos).starts_with(key))
            return std::nullopt;

        auto const begin = pos + key.size();
        auto end = begin;
        while (end < text.size() && !isSpace(text[end]))
            ++end;
        if (end == begin)
            return std::nullopt;

        pos = end;
        return std::string(text.substr(begin, end - begin));
    }

    /// @brief Splits the text into runs that each start at a marker and end before the next one.
    auto splitAtMarkers(std::string_view text) -> std::vector<std::string_view>
    {
        auto segments = std::vector<std::string_view> {};
        auto pos = text.find(ToolCallMarker);
        while (pos != std::string_view::npos)
        {
            auto const next = text.find(ToolCallMarker, pos + ToolCallMarker.size());
            auto const end = next == std::string_view::npos ? text.size() : next;
            segments.push_back(text.substr(pos, end - pos));
            pos = next;
        }
        return segments;
    }

    /// @brief Parses `[MCP_TOOL_CALL] server=<id> tool=<name> args=` at the start of a segment.
    auto parseHeader(std::string_view segment) -> std::optional<CallHeader>
    {
        auto pos = skipSpaces(segment, ToolCallMarker.size());

        auto serverId = readField(segment, pos, "server=");
        if (!serverId || pos == skipSpaces(segment, pos))
            return std::nullopt;
        pos = skipSpaces(segment, pos);

        auto toolName = readField(segment, pos, "tool=");
        if (!toolName || pos == skipSpaces(segment, pos))
            return std::nullopt;
        pos = skipSpaces(segment, pos);

        constexpr auto ArgsKey = std::string_view { "args=" };
        if (!segment.substr(pos).starts_with(ArgsKey))
            return std::nullopt;

        return CallHeader {
            .serverId = std::move(*serverId),
            .toolName = std::move(*toolName),
            .args = segment.substr(pos + ArgsKey.size()),
        };
    }

    /// @brief Single-line form: a brace-delimited object containing no closing brace.
    auto inlineArguments(std::string_view args) -> std::optional<std::string_view>
    {
        if (!args.starts_with('{'))
            return std::nullopt;
        auto const close = args.find('}', 1);
        if (close == std::string_view::npos || close == 1)
            return std::nullopt;
        return args.substr(0, close + 1);
    }

    /// @brief Multi-line form: a ```json fence, or an object that is the last thing in its segment.
    auto multilineArguments(std::string_view args) -> std::optional<std::string_view>
    {
        if (args.starts_with(JsonFence))
        {
            auto const body = JsonFence.size();
            auto const close = args.find(Fence, body);
            if (close == std::string_view::npos)
                return std::nullopt;
            return args.substr(body, close - body);
        }

        if (!args.starts_with('{'))
            return std::nullopt;

        auto end = args.size();
        while (end > 0 && isSpace(args[end - 1]))
            --end;
        if (end < 2 || args[end - 1] != '}')
            return std::nullopt;
        return args.substr(0, end);
    }

    auto decodeCall(std::string serverId, std::string toolName, std::string_view argsText)
        -> std::optional<ParsedToolCall>
    {
        auto args = json::parse(argsText);
        if (!args)
        {
            log::debug("Dropping tool call {}:{}: {}", serverId, toolName, args.error().message);
            return std::nullopt;
        }
        if (!args->is_object())
        {
            log::debug("Dropping tool call {}:{}: arguments are not an object", serverId, toolName);
            return std::nullopt;
        }
        return ParsedToolCall { .serverId = std::move(serverId), .toolName = std::move(toolName), .args = std::move(*args) };
    }
} // namespace

auto parseToolCalls(std::string_view text) -> std::vector<ParsedToolCall>
{
    auto calls = std::vector<ParsedToolCall> {};
    auto seen = std::set<std::string> {};

    auto const accept = [&](std::optional<ParsedToolCall> call) {
        if (!call)
            return;
        if (seen.insert(toolCallKey(*call)).second)
            calls.push_back(std::move(*call));
    };

    auto headers = std::vector<CallHeader> {};
    for (auto const segment: splitAtMarkers(text))
    {
        if (auto header = parseHeader(segment))
            headers.push_back(std::move(*header));
    }

    // Inline calls first, then the multi-line ones; the second pass only adds what the first missed.
    for (auto const& header: headers)
    {
        if (auto const args = inlineArguments(header.args))
            accept(decodeCall(header.serverId, header.toolName, *args));
    }

    for (auto const& header: headers)
    {
        if (auto const args = multilineArguments(header.args))
            accept(decodeCall(header.serverId, header.toolName, *args));
    }

    return calls;
}

auto formatToolCallForAgent(std::string_view serverId, std::string_view toolName, const nlohmann::json& args)
    -> std::string
{
    auto const pretty = args.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    if (pretty.find('\n') != std::string::npos)
        return std::format("{} server={} tool={} args=```json\n{}\n```", ToolCallMarker, serverId, toolName, pretty);

    return std::format("{} server={} tool={} args={}", ToolCallMarker, serverId, toolName, json::canonical(args));
}

auto formatToolCallForAgent(const ParsedToolCall& call) -> std::string
{
    return formatToolCallForAgent(call.serverId, call.toolName, call.args);
}

auto toolCallKey(const ParsedToolCall& call) -> std::string
{
    return std::format("{}:{}:{}", call.serverId, call.toolName, json::canonical(call.args));
}

auto parsedToolCallsToJson(const std::vector<ParsedToolCall>& calls) -> nlohmann::json
{
    auto result = nlohmann::json::array();
    for (const auto& call: calls)
    {
        result.push_back({
            { "serverId", call.serverId },
            { "toolName", call.toolName },
            { "args", call.args },
        });
    }
    return result;
}

} // namespace toolbridge
