#pragma once

#include "errors.hpp"
#include "result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace msghistory::core {

// JSON alias; keys keep insertion order
using Json = nlohmann::ordered_json;

using ToolCallId = std::string;

// Message roles
enum class Role {
    System,
    Human,
    Ai,
    ToolResult
};

inline std::string_view role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::Human: return "human";
        case Role::Ai: return "ai";
        case Role::ToolResult: return "tool";
    }
    return "unknown";
}

inline std::optional<Role> role_from_string(std::string_view str) {
    if (str == "system") return Role::System;
    if (str == "human") return Role::Human;
    if (str == "ai") return Role::Ai;
    if (str == "tool") return Role::ToolResult;
    return std::nullopt;
}

// Structured tool invocation carried by an ai message
struct ToolCall {
    ToolCallId id;
    std::string name;
    Json arguments;

    Json to_json() const {
        return Json{
            {"id", id},
            {"name", name},
            {"arguments", arguments}
        };
    }

    static ToolCall from_json(const Json& j) {
        return ToolCall{
            .id = j.value("id", ""),
            .name = j.value("name", ""),
            .arguments = j.value("arguments", Json::object())
        };
    }
};

// Image part of a mixed text/image payload
struct ImageContent {
    std::string data;        // Base64 encoded image data
    std::string media_type;  // e.g., "image/jpeg", "image/png"

    Json to_json() const {
        return Json{
            {"type", "image"},
            {"media_type", media_type},
            {"data", data}
        };
    }

    static ImageContent from_json(const Json& j) {
        return ImageContent{
            .data = j.value("data", ""),
            .media_type = j.value("media_type", "")
        };
    }
};

// Message with a discriminated role. The history layer treats everything
// but the role as opaque.
struct Message {
    Role role;
    std::string content;
    std::vector<ImageContent> images;
    std::vector<ToolCall> tool_calls;          // Ai only
    std::optional<ToolCallId> tool_call_id;    // ToolResult only

    Message() : role(Role::Human) {}

    Message(Role r, std::string c)
        : role(r), content(std::move(c)) {}

    static Message system(std::string content) {
        return Message{Role::System, std::move(content)};
    }

    static Message human(std::string content) {
        return Message{Role::Human, std::move(content)};
    }

    static Message ai(std::string content, std::vector<ToolCall> calls = {}) {
        Message m{Role::Ai, std::move(content)};
        m.tool_calls = std::move(calls);
        return m;
    }

    static Message tool_result(ToolCallId tool_call_id, std::string content) {
        Message m{Role::ToolResult, std::move(content)};
        m.tool_call_id = std::move(tool_call_id);
        return m;
    }

    bool has_tool_calls() const { return !tool_calls.empty(); }
    bool is_system() const { return role == Role::System; }

    Json to_json() const {
        Json j{
            {"role", std::string(role_to_string(role))},
            {"content", content}
        };
        if (!images.empty()) {
            j["images"] = Json::array();
            for (const auto& img : images) {
                j["images"].push_back(img.to_json());
            }
        }
        if (!tool_calls.empty()) {
            j["tool_calls"] = Json::array();
            for (const auto& tc : tool_calls) {
                j["tool_calls"].push_back(tc.to_json());
            }
        }
        if (tool_call_id) j["tool_call_id"] = *tool_call_id;
        return j;
    }

    static Result<Message, Error> from_json(const Json& j) {
        if (!j.is_object() || !j.contains("role") || !j["role"].is_string()) {
            return Result<Message, Error>::err(
                ErrorCode::MalformedState,
                "Message is missing a role"
            );
        }

        auto role = role_from_string(j["role"].get<std::string>());
        if (!role) {
            return Result<Message, Error>::err(
                ErrorCode::MalformedState,
                "Unknown message role",
                j["role"].get<std::string>()
            );
        }

        try {
            Message m{*role, j.value("content", "")};
            if (j.contains("images")) {
                for (const auto& img : j["images"]) {
                    m.images.push_back(ImageContent::from_json(img));
                }
            }
            if (j.contains("tool_calls")) {
                for (const auto& tc : j["tool_calls"]) {
                    m.tool_calls.push_back(ToolCall::from_json(tc));
                }
            }
            if (j.contains("tool_call_id")) {
                m.tool_call_id = j["tool_call_id"].get<std::string>();
            }
            return Result<Message, Error>::ok(std::move(m));
        } catch (const Json::exception& e) {
            return Result<Message, Error>::err(
                ErrorCode::MalformedState,
                std::string("Invalid message payload: ") + e.what()
            );
        }
    }
};

}  // namespace msghistory::core
