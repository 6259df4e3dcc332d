// SPDX-License-Identifier: Apache-2.0
#include "ToolClient.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <format>
#include <optional>
#include <ranges>
#include <string>
#include <variant>
#include <vector>

namespace toolbridge
{

namespace
{
    template <typename... Ts>
    struct Overloaded: Ts...
    {
        using Ts::operator()...;
    };
} // namespace

ToolClient::ToolClient(Connection& connection): _connection(connection)
{
}

auto ToolClient::listTools() -> Result<std::vector<ToolDescriptor>>
{
    return sendRequest("tools/list", nlohmann::json::object())
        .transform([](const nlohmann::json& result) {
            auto tools = std::vector<ToolDescriptor> {};

            if (!result.contains("tools") || !result["tools"].is_array())
                return tools;

            for (const auto& toolJson: result["tools"])
            {
                auto tool = ToolDescriptor {
                    .name = json::getStringOr(toolJson, "name", ""),
                    .description = json::getStringOr(toolJson, "description", ""),
                    .inputSchema = toolJson.is_object() ? toolJson.value("inputSchema", nlohmann::json::object())
                                                        : nlohmann::json::object(),
                };
                tools.push_back(std::move(tool));
            }

            return tools;
        });
}

auto ToolClient::callTool(std::string_view name, const nlohmann::json& arguments) -> Result<ToolOutput>
{
    auto params = nlohmann::json {
        { "name", name },
        { "arguments", arguments },
    };

    return sendRequest("tools/call", std::move(params)).transform([name](const nlohmann::json& result) {
        if (result.value("isError", false))
            log::debug("Tool '{}' reported an error result", name);
        return selectToolOutput(result);
    });
}

auto ToolClient::listResources() -> Result<std::vector<ResourceDescriptor>>
{
    return sendRequest("resources/list", nlohmann::json::object())
        .transform([](const nlohmann::json& result) {
            auto resources = std::vector<ResourceDescriptor> {};

            if (!result.contains("resources") || !result["resources"].is_array())
                return resources;

            for (const auto& item: result["resources"])
            {
                resources.push_back(ResourceDescriptor {
                    .uri = json::getStringOr(item, "uri", ""),
                    .name = json::getStringOr(item, "name", ""),
                    .description = json::getStringOr(item, "description", ""),
                    .mimeType = json::getStringOr(item, "mimeType", ""),
                });
            }

            return resources;
        });
}

auto ToolClient::readResource(std::string_view uri) -> Result<std::optional<ResourceContents>>
{
    return sendRequest("resources/read", nlohmann::json { { "uri", uri } })
        .transform([](const nlohmann::json& result) -> std::optional<ResourceContents> {
            if (!result.contains("contents") || !result["contents"].is_array() || result["contents"].empty())
                return std::nullopt;

            auto const& first = result["contents"].front();
            auto contents = ResourceContents {
                .uri = json::getStringOr(first, "uri", ""),
                .mimeType = json::getStringOr(first, "mimeType", ""),
                .text = std::nullopt,
                .blob = std::nullopt,
            };
            if (auto text = json::getString(first, "text"))
                contents.text = std::move(*text);
            if (auto blob = json::getString(first, "blob"))
                contents.blob = std::move(*blob);
            return contents;
        });
}

auto ToolClient::sendRequest(std::string_view method, nlohmann::json params) -> Result<nlohmann::json>
{
    if (!_connection.isConnected())
        return makeError(ErrorCode::NotInitialized, "Not initialized");

    return _connection.request(method, std::move(params));
}

auto parseContentBlock(const nlohmann::json& block) -> ContentBlock
{
    auto const type = json::getStringOr(block, "type", "");
    if (type == "text")
        return TextBlock { .text = json::getStringOr(block, "text", "") };
    if (type == "image")
        return ImageBlock { .data = json::getStringOr(block, "data", ""),
                            .mimeType = json::getStringOr(block, "mimeType", "") };
    return OtherBlock { .type = type, .raw = block };
}

auto selectToolOutput(const nlohmann::json& result) -> ToolOutput
{
    if (!result.is_object() || !result.contains("content") || !result["content"].is_array())
        return ToolOutput { std::in_place_type<nlohmann::json>, result };

    auto texts = std::vector<std::string> {};
    auto image = std::optional<ImageOutput> {};

    for (const auto& item: result["content"])
    {
        std::visit(Overloaded {
                       [&](const TextBlock& block) {
                           if (!block.text.empty())
                               texts.push_back(block.text);
                       },
                       [&](const ImageBlock& block) {
                           if (!image)
                               image = ImageOutput { .data = block.data, .mimeType = block.mimeType };
                       },
                       [](const OtherBlock&) {},
                   },
                   parseContentBlock(item));
    }

    if (!texts.empty())
    {
        auto text = texts.front();
        for (auto const& more: texts | std::views::drop(1))
            text += "\n" + more;
        return text;
    }

    if (image)
        return *image;

    return ToolOutput { std::in_place_type<nlohmann::json>, result };
}

auto toolOutputToJson(const ToolOutput& output) -> nlohmann::json
{
    return std::visit(Overloaded {
                          [](const std::string& text) -> nlohmann::json { return text; },
                          [](const ImageOutput& image) -> nlohmann::json {
                              return { { "type", "image" }, { "data", image.data }, { "mimeType", image.mimeType } };
                          },
                          [](const nlohmann::json& raw) -> nlohmann::json { return raw; },
                      },
                      output);
}

} // namespace toolbridge
