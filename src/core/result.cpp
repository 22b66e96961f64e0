#include <kpi_lineage/core/result.hpp>

#include <nlohmann/json.hpp>

namespace kpi_lineage {

std::string Error::ToJson() const {
    nlohmann::json body;
    body["category"] = CategoryName();
    body["operation"] = operation;
    if (!subject.empty()) {
        body["subject"] = subject;
    }
    body["message"] = message;
    if (hint.has_value() && !hint->empty()) {
        body["hint"] = *hint;
    }
    body["exit_code"] = ExitCode();
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace kpi_lineage
