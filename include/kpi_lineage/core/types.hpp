#pragma once

#include <kpi_lineage/core/result.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace kpi_lineage {

// Lower bound for the SQL size cap: inputs up to 1 MiB must always be
// accepted, whatever the configuration says.
constexpr std::size_t kMinSqlBytesCap = 1024 * 1024;
constexpr std::size_t kDefaultMaxSqlBytes = 4 * 1024 * 1024;

// ---------------------------------------------------------------------------
// SqlText — query text accepted by the lineage facade.
//
// Rules:
//   - At most max_bytes bytes (max_bytes is raised to kMinSqlBytesCap)
//   - No NUL bytes
// Empty text is valid; it simply yields empty lineage.
// ---------------------------------------------------------------------------
class SqlText {
public:
    static Result<SqlText, std::string> Create(
        std::string_view text, std::size_t max_bytes = kDefaultMaxSqlBytes);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] bool Empty() const noexcept { return value_.empty(); }

    bool operator==(const SqlText& other) const { return value_ == other.value_; }
    bool operator!=(const SqlText& other) const { return value_ != other.value_; }

private:
    explicit SqlText(std::string value) : value_(std::move(value)) {}
    std::string value_;
};

// ---------------------------------------------------------------------------
// Viewport — the drawing area handed to the flow layout.
//
// Rules:
//   - width and height are finite and strictly positive
//   - each dimension is at most kMaxViewportExtent units
// ---------------------------------------------------------------------------
class Viewport {
public:
    static constexpr double kMaxViewportExtent = 100000.0;

    static Result<Viewport, std::string> Create(double width, double height);

    [[nodiscard]] double Width() const noexcept { return width_; }
    [[nodiscard]] double Height() const noexcept { return height_; }

    bool operator==(const Viewport& other) const {
        return width_ == other.width_ && height_ == other.height_;
    }
    bool operator!=(const Viewport& other) const { return !(*this == other); }

private:
    Viewport(double width, double height) : width_(width), height_(height) {}
    double width_;
    double height_;
};

} // namespace kpi_lineage
