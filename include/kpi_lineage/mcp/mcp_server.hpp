#pragma once

#include <kpi_lineage/mcp/tool_registry.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace kpi_lineage {

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 tool server over newline-delimited JSON-RPC 2.0.
//
// Methods: initialize, ping, tools/list, tools/call. Notifications (no "id")
// never get a response. A malformed line gets a -32700 parse error and the
// loop continues.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process one input line; returns the response to write, if any.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool Initialized() const noexcept { return initialized_; }
    [[nodiscard]] std::size_t RequestCount() const noexcept { return request_count_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    static nlohmann::json MakeError(const nlohmann::json& id,
                                    int code, const std::string& message);
    static nlohmann::json MakeResult(const nlohmann::json& id,
                                     const nlohmann::json& result);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
    std::size_t request_count_ = 0;
};

} // namespace kpi_lineage
