// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace toolbridge::jsonrpc
{

/// @brief JSON-RPC 2.0 error code for an unsupported method.
constexpr auto MethodNotFound = -32601;

/// @brief Represents a JSON-RPC 2.0 error.
struct RpcError
{
    int code = 0;
    std::string message;
    nlohmann::json data;
};

/// @brief Represents a parsed JSON-RPC 2.0 response.
struct Response
{
    nlohmann::json id;
    std::optional<nlohmann::json> result;
    std::optional<RpcError> error;

    /// @brief Returns true if this response indicates success.
    [[nodiscard]] auto isSuccess() const -> bool { return !error.has_value(); }
};

/// @brief A server-initiated message without an id.
struct Notification
{
    std::string method;
    nlohmann::json params;
    nlohmann::json raw;
};

/// @brief A server-initiated message that carries both a method and an id and expects a reply.
struct Request
{
    nlohmann::json id;
    std::string method;
    nlohmann::json params;
};

/// @brief A decoded inbound message.
using Message = std::variant<Response, Notification, Request>;

/// @brief Builds a JSON-RPC 2.0 request message.
/// @param id The request ID.
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC request object.
[[nodiscard]] auto makeRequest(int64_t id, std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 notification message (no id).
/// @param method The method name.
/// @param params Optional parameters.
/// @return The JSON-RPC notification object.
[[nodiscard]] auto makeNotification(std::string_view method, nlohmann::json params = nullptr)
    -> nlohmann::json;

/// @brief Builds a JSON-RPC 2.0 error response to a request.
[[nodiscard]] auto makeErrorResponse(const nlohmann::json& id, int code, std::string_view message) -> nlohmann::json;

/// @brief Parses a JSON-RPC 2.0 response.
///
/// A missing "jsonrpc" member is tolerated; a present one must be "2.0".
/// A result-less, error-less response (e.g. {"id":1}) succeeds with an empty result.
/// @param message The JSON message to parse.
/// @return The parsed response or an Error.
[[nodiscard]] auto parseResponse(const nlohmann::json& message) -> Result<Response>;

/// @brief Classifies one inbound JSON value.
///
/// Messages with a method are requests when they carry a non-null id and notifications
/// otherwise. Messages with a non-null id and no method are responses. Anything else is a
/// protocol error.
[[nodiscard]] auto decodeMessage(const nlohmann::json& message) -> Result<Message>;

/// @brief Parses and classifies one line of wire text.
[[nodiscard]] auto decodeLine(std::string_view line) -> Result<Message>;

/// @brief Serializes a message for the wire, terminated by a single newline.
[[nodiscard]] auto encode(const nlohmann::json& message) -> std::string;

/// @brief Default upper bound for a partial line kept by LineBuffer.
constexpr auto DefaultMaxLineLength = std::size_t { 4 * 1024 * 1024 };

/// @brief Accumulates stream chunks and splits them into complete lines.
///
/// A trailing partial line is kept until its newline arrives. Blank lines and a trailing
/// carriage return are dropped. A partial line that grows beyond the limit is discarded
/// together with the rest of that line up to its newline.
class LineBuffer
{
  public:
    explicit LineBuffer(std::size_t maxLineLength = DefaultMaxLineLength) noexcept: _maxLineLength(maxLineLength) {}

    /// @brief Appends a chunk and returns every line it completed.
    [[nodiscard]] auto feed(std::string_view chunk) -> std::vector<std::string>;

    /// @brief Returns the buffered partial line.
    [[nodiscard]] auto pending() const noexcept -> std::string_view { return _buffer; }

    /// @brief Returns how many overlong lines were discarded since the last call, and resets it.
    [[nodiscard]] auto takeDiscardedLines() noexcept -> std::size_t { return std::exchange(_discardedLines, 0); }

    void clear() noexcept
    {
        _buffer.clear();
        _discarding = false;
    }

  private:
    std::size_t _maxLineLength;
    std::string _buffer;
    bool _discarding = false;
    std::size_t _discardedLines = 0;
};

} // namespace toolbridge::jsonrpc
