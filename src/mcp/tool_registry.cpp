#include <kpi_lineage/mcp/tool_registry.hpp>

#include <kpi_lineage/core/log.hpp>

#include <algorithm>

namespace kpi_lineage {

ToolResult MakeTextResult(bool is_error, const std::string& text) {
    return ToolResult{
        is_error,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& input_schema,
                            ToolHandler handler) {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&](const ToolSchema& schema) { return schema.name == name; });
    if (it != schemas_.end()) {
        *it = ToolSchema{name, description, input_schema};
    } else {
        schemas_.push_back({name, description, input_schema});
    }
    handlers_[name] = std::move(handler);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    return handlers_.count(name) > 0;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& params) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return MakeTextResult(true, "Unknown tool: " + name);
    }

    try {
        return it->second(params);
    } catch (const nlohmann::json::exception& e) {
        LogWarn("mcp", "tool " + name + " rejected its arguments: " + e.what());
        return MakeTextResult(true, std::string("Invalid arguments: ") + e.what());
    } catch (const std::exception& e) {
        LogError("mcp", "tool " + name + " failed: " + e.what());
        return MakeTextResult(true, std::string("Tool error: ") + e.what());
    }
}

} // namespace kpi_lineage
