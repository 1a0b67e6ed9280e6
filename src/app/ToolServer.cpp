/**
 * @file ToolServer.cpp
 * @brief Implementation of ToolServer.
 */

#include "app/ToolServer.hpp"
#include <iostream>
#include "domain/ScratchpadError.hpp"

namespace scratchpad::app {

using json = nlohmann::json;
using application::OperationResult;
using domain::ScratchpadError;

namespace {

json RpcResult(const json& id, const json& result) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}};
}

json RpcError(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json TextResult(const std::string& text, bool isError) {
    return json{
        {"content", json::array({json{{"type", "text"}, {"text", text}}})},
        {"isError", isError}
    };
}

json StringProperty(const std::string& description, std::size_t maxLength) {
    return json{{"type", "string"}, {"description", description}, {"maxLength", maxLength}};
}

json ToolDescriptor(const std::string& name, const std::string& description,
                    const json& properties, const json& required) {
    return json{
        {"name", name},
        {"description", description},
        {"inputSchema", {{"type", "object"}, {"properties", properties}, {"required", required}}}
    };
}

// Absent or null -> nullopt; any other non-string is a validation failure.
std::optional<std::string> OptionalString(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return std::nullopt;
    }
    if (!args[key].is_string()) {
        throw ScratchpadError::Validation(key, "must be a string");
    }
    return args[key].get<std::string>();
}

std::optional<bool> OptionalBool(const json& args, const char* key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) {
        return std::nullopt;
    }
    if (!args[key].is_boolean()) {
        throw ScratchpadError::Validation(key, "must be a boolean");
    }
    return args[key].get<bool>();
}

std::string ItemSummary(const OperationResult& result) {
    if (!result.item) return "";
    const auto& item = *result.item;
    return "\n\n**Type:** " + domain::Capitalize(domain::ItemTypeToString(item.type)) +
           " | **Priority:** " + domain::Capitalize(domain::PriorityToString(item.priority)) +
           "\n**Note:** " + item.text;
}

json ToToolResult(const OperationResult& result, const std::string& successText) {
    if (!result.success) {
        return TextResult("❌ Error: " + result.message, true);
    }
    return TextResult(successText, false);
}

} // namespace

ToolServer::ToolServer(application::ScratchpadService& service) : m_service(service) {}

json ToolServer::listTools() const {
    const auto& config = m_service.config();
    const json noteOnly = {{"note", StringProperty("Text of the item", config.maxNoteLen)}};

    json logProperties = {
        {"note", StringProperty("The note/idea to log", config.maxNoteLen)},
        {"type", {{"type", "string"}, {"description", "Type of entry"},
                  {"enum", {"idea", "bug", "feature", "question", "contact", "refactor", "task", "note"}},
                  {"default", "note"}}},
        {"priority", {{"type", "string"}, {"description", "Priority level"},
                      {"enum", {"high", "medium", "low"}}, {"default", "medium"}}}
    };

    json createProperties = {
        {"location", StringProperty("Path for scratchpad (default: " + config.defaultLocation + ")", config.maxPathLen)},
        {"overwrite", {{"type", "boolean"}, {"description", "Replace an existing scratchpad"}, {"default", config.overwriteOnCreate}}}
    };

    return json::array({
        ToolDescriptor("scratchpad_read", "Read the contents of the scratchpad file. Rate limited.",
                       json::object(), json::array()),
        ToolDescriptor("scratchpad_create",
                       "Create a new scratchpad. Location must be inside an allowed directory and end in .md, .txt or .markdown.",
                       createProperties, json::array()),
        ToolDescriptor("scratchpad_find", "Find the scratchpad location in the workspace",
                       json::object(), json::array()),
        ToolDescriptor("scratchpad_log_interruption",
                       "Log an interruption, idea, bug, or task to the scratchpad.",
                       logProperties, json::array({"note"})),
        ToolDescriptor("scratchpad_update_focus", "Update the current focus/task in the scratchpad.",
                       json{{"task", StringProperty("Description of the current task", config.maxTaskLen)}},
                       json::array({"task"})),
        ToolDescriptor("scratchpad_add_to_review_later", "Add an item to the To Review Later section.",
                       noteOnly, json::array({"note"})),
        ToolDescriptor("scratchpad_mark_completed",
                       "Move an item (matched by exact text) to Completed Today.",
                       noteOnly, json::array({"note"})),
        ToolDescriptor("scratchpad_archive_item",
                       "Move an item (matched by exact text) to Archived / Dismissed.",
                       noteOnly, json::array({"note"}))
    });
}

json ToolServer::callTool(const std::string& name, const json& arguments) {
    try {
        if (name == "scratchpad_read") {
            auto result = m_service.read();
            return ToToolResult(result, result.content);
        }
        if (name == "scratchpad_create") {
            auto result = m_service.create(OptionalString(arguments, "location"), OptionalBool(arguments, "overwrite"));
            return ToToolResult(result, "✅ " + result.message);
        }
        if (name == "scratchpad_find") {
            auto result = m_service.find();
            if (result.success && !result.exists) {
                return TextResult("❌ No scratchpad found. Use scratchpad_create to create one.", false);
            }
            return ToToolResult(result, "📍 " + result.message);
        }
        if (name == "scratchpad_log_interruption") {
            auto result = m_service.logInterruption(OptionalString(arguments, "note").value_or(""),
                                                    OptionalString(arguments, "type"),
                                                    OptionalString(arguments, "priority"));
            return ToToolResult(result, "✅ " + result.message + ItemSummary(result));
        }
        if (name == "scratchpad_update_focus") {
            auto task = OptionalString(arguments, "task").value_or("");
            auto result = m_service.updateFocus(task);
            return ToToolResult(result, "✅ " + result.message + "\n\n**Task:** " + task);
        }
        if (name == "scratchpad_add_to_review_later") {
            auto result = m_service.addToReviewLater(OptionalString(arguments, "note").value_or(""));
            return ToToolResult(result, "✅ " + result.message + ItemSummary(result));
        }
        if (name == "scratchpad_mark_completed") {
            auto result = m_service.markCompleted(OptionalString(arguments, "note").value_or(""));
            return ToToolResult(result, "✅ " + result.message + ItemSummary(result));
        }
        if (name == "scratchpad_archive_item") {
            auto result = m_service.archiveItem(OptionalString(arguments, "note").value_or(""));
            return ToToolResult(result, "✅ " + result.message + ItemSummary(result));
        }
    } catch (const ScratchpadError& e) {
        std::cerr << "[ToolServer] Bad arguments for " << name << ": " << e.what() << std::endl;
        return TextResult("❌ Error: " + e.publicMessage(), true);
    }

    return TextResult("❌ Unknown tool: " + name, true);
}

json ToolServer::handle(const json& request) {
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        return RpcError(request.is_object() && request.contains("id") ? request["id"] : json(), -32600, "Invalid Request");
    }

    const std::string method = request["method"].get<std::string>();
    const bool isNotification = !request.contains("id");
    const json id = isNotification ? json() : request["id"];
    const json params = request.contains("params") ? request["params"] : json::object();

    if (isNotification) {
        return json();
    }

    if (method == "initialize") {
        return RpcResult(id, {
            {"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", kServerName}, {"version", kServerVersion}}}
        });
    }
    if (method == "ping") {
        return RpcResult(id, json::object());
    }
    if (method == "tools/list") {
        return RpcResult(id, {{"tools", listTools()}});
    }
    if (method == "tools/call") {
        if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
            return RpcError(id, -32602, "Invalid params");
        }
        const json arguments = params.contains("arguments") ? params["arguments"] : json::object();
        return RpcResult(id, callTool(params["name"].get<std::string>(), arguments));
    }

    return RpcError(id, -32601, "Method not found");
}

std::optional<std::string> ToolServer::handleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r\n") == std::string::npos) {
        return std::nullopt;
    }

    json request = json::parse(line, nullptr, false);
    json response;
    if (request.is_discarded()) {
        std::cerr << "[ToolServer] Discarding malformed request line" << std::endl;
        response = RpcError(json(), -32700, "Parse error");
    } else {
        response = handle(request);
    }

    if (response.is_null()) {
        return std::nullopt;
    }
    return response.dump(-1, ' ', false, json::error_handler_t::replace);
}

void ToolServer::run(std::istream& in, std::ostream& out) {
    std::string line;
    while (std::getline(in, line)) {
        auto response = handleLine(line);
        if (response) {
            out << *response << "\n";
            out.flush();
        }
    }
}

} // namespace scratchpad::app
