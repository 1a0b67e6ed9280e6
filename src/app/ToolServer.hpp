/**
 * @file ToolServer.hpp
 * @brief Line-delimited JSON-RPC 2.0 front end exposing the scratchpad as MCP tools.
 */

#pragma once
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <nlohmann/json.hpp>
#include "application/ScratchpadService.hpp"

namespace scratchpad::app {

/**
 * @class ToolServer
 * @brief Maps `tools/call` requests onto ScratchpadService operations.
 *
 * Only sanitized OperationResult messages reach the client; diagnostics stay on stderr.
 */
class ToolServer {
public:
    static constexpr const char* kServerName = "scratchpad-mcp";
    static constexpr const char* kServerVersion = "1.0.0";
    static constexpr const char* kProtocolVersion = "2024-11-05";

    explicit ToolServer(application::ScratchpadService& service);

    /**
     * @brief Handles one raw request line.
     * @return Serialized response, or nullopt for notifications.
     */
    std::optional<std::string> handleLine(const std::string& line);

    /** @brief Handles one parsed JSON-RPC message. Returns null json for notifications. */
    nlohmann::json handle(const nlohmann::json& request);

    /** @brief Tool descriptors advertised by `tools/list`. */
    nlohmann::json listTools() const;

    /** @brief Runs one tool and returns an MCP tool result. */
    nlohmann::json callTool(const std::string& name, const nlohmann::json& arguments);

    /** @brief Reads requests from @p in until EOF, writing one response per line to @p out. */
    void run(std::istream& in, std::ostream& out);

private:
    application::ScratchpadService& m_service;
};

} // namespace scratchpad::app
