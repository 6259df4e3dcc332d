// SPDX-License-Identifier: Apache-2.0
#include "JsonRpc.hpp"

#include <core/JsonUtils.hpp>

#include <format>

namespace toolbridge::jsonrpc
{

auto makeRequest(int64_t id, std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeNotification(std::string_view method, nlohmann::json params) -> nlohmann::json
{
    auto msg = nlohmann::json {
        { "jsonrpc", "2.0" },
        { "method", method },
    };

    if (!params.is_null())
        msg["params"] = std::move(params);

    return msg;
}

auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json
{
    return nlohmann::json {
        { "jsonrpc", "2.0" },
        { "id", id },
        { "error", { { "code", code }, { "message", message } } },
    };
}

auto parseResponse(const nlohmann::json& message) -> Result<Response>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");

    if (message.contains("jsonrpc") && message["jsonrpc"] != "2.0")
        return makeError(ErrorCode::ProtocolError, "Not a valid JSON-RPC 2.0 message");

    if (!message.contains("id") && !message.contains("method"))
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither id nor method");

    auto response = Response {};

    if (message.contains("id"))
        response.id = message["id"];

    if (message.contains("error") && !message["error"].is_null())
    {
        auto const& err = message["error"];
        if (err.is_object())
        {
            response.error = RpcError {
                .code = json::getIntOr(err, "code", 0),
                .message = json::getStringOr(err, "message", "Unknown error"),
                .data = err.value("data", nlohmann::json {}),
            };
        }
        else
        {
            response.error = RpcError { .code = 0, .message = err.dump(), .data = {} };
        }
    }
    else if (message.contains("result"))
    {
        response.result = message["result"];
    }
    else if (!message.contains("method"))
    {
        response.result = nlohmann::json::object();
    }

    return response;
}

auto decodeMessage(const nlohmann::json& message) -> Result<Message>
{
    if (!message.is_object())
        return makeError(ErrorCode::ProtocolError, "JSON-RPC message is not an object");

    auto const hasId = message.contains("id") && !message["id"].is_null();
    if (message.contains("method") && message["method"].is_string())
    {
        if (hasId)
        {
            return Request {
                .id = message["id"],
                .method = message["method"].get<std::string>(),
                .params = message.value("params", nlohmann::json {}),
            };
        }

        return Notification {
            .method = message["method"].get<std::string>(),
            .params = message.value("params", nlohmann::json {}),
            .raw = message,
        };
    }

    if (hasId)
        return parseResponse(message).transform([](Response response) -> Message { return response; });

    return makeError(ErrorCode::ProtocolError, "JSON-RPC message has neither id nor method");
}

auto decodeLine(std::string_view line) -> Result<Message>
{
    return json::parse(line).and_then([](const nlohmann::json& message) { return decodeMessage(message); });
}

auto encode(const nlohmann::json& message) -> std::string
{
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

auto LineBuffer::feed(std::string_view chunk) -> std::vector<std::string>
{
    auto lines = std::vector<std::string> {};

    if (_discarding)
    {
        auto const newlinePos = chunk.find('\n');
        if (newlinePos == std::string_view::npos)
            return lines;
        chunk.remove_prefix(newlinePos + 1);
        _discarding = false;
    }

    _buffer.append(chunk);

    auto start = std::size_t { 0 };
    while (true)
    {
        auto const newlinePos = _buffer.find('\n', start);
        if (newlinePos == std::string::npos)
            break;

        auto line = std::string_view(_buffer).substr(start, newlinePos - start);
        if (line.ends_with('\r'))
            line.remove_suffix(1);
        if (line.find_first_not_of(" \t") != std::string_view::npos)
            lines.emplace_back(line);

        start = newlinePos + 1;
    }

    _buffer.erase(0, start);

    if (_buffer.size() > _maxLineLength)
    {
        _buffer.clear();
        _discarding = true;
        ++_discardedLines;
    }

    return lines;
}

} // namespace toolbridge::jsonrpc
