#include <kpi_lineage/core/types.hpp>

#include <algorithm>
#include <cmath>

namespace kpi_lineage {

// ---------------------------------------------------------------------------
// SqlText
// ---------------------------------------------------------------------------
Result<SqlText, std::string> SqlText::Create(std::string_view text,
                                             std::size_t max_bytes) {
    const auto cap = std::max(max_bytes, kMinSqlBytesCap);
    if (text.size() > cap) {
        return Result<SqlText, std::string>::Err(
            "SQL text is " + std::to_string(text.size()) +
            " bytes, limit is " + std::to_string(cap));
    }
    const auto nul = text.find('\0');
    if (nul != std::string_view::npos) {
        return Result<SqlText, std::string>::Err(
            "SQL text contains a NUL byte at offset " + std::to_string(nul));
    }
    return Result<SqlText, std::string>::Ok(SqlText(std::string(text)));
}

// ---------------------------------------------------------------------------
// Viewport
// ---------------------------------------------------------------------------
Result<Viewport, std::string> Viewport::Create(double width, double height) {
    if (!std::isfinite(width) || !std::isfinite(height)) {
        return Result<Viewport, std::string>::Err(
            "Viewport dimensions must be finite");
    }
    if (width <= 0.0 || height <= 0.0) {
        return Result<Viewport, std::string>::Err(
            "Viewport dimensions must be positive, got " +
            std::to_string(width) + "x" + std::to_string(height));
    }
    if (width > kMaxViewportExtent || height > kMaxViewportExtent) {
        return Result<Viewport, std::string>::Err(
            "Viewport dimensions must not exceed " +
            std::to_string(static_cast<int>(kMaxViewportExtent)));
    }
    return Result<Viewport, std::string>::Ok(Viewport(width, height));
}

} // namespace kpi_lineage
