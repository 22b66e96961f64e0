#include <kpi_lineage/cli/output_formatter.hpp>
#include <kpi_lineage/core/terminal.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace kpi_lineage {

namespace {

using namespace kpi_lineage::ansi;

// ---------------------------------------------------------------------------
// Table helpers
// ---------------------------------------------------------------------------

std::vector<size_t> ColumnWidths(const std::vector<std::string>& headers,
                                 const std::vector<std::vector<std::string>>& rows) {
    std::vector<size_t> widths;
    widths.reserve(headers.size());
    for (const auto& header : headers) {
        widths.push_back(header.size());
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < widths.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }
    return widths;
}

void WritePaddedRow(std::ostream& out, const std::vector<std::string>& cells,
                    const std::vector<size_t>& widths) {
    for (size_t c = 0; c < widths.size() && c < cells.size(); ++c) {
        if (c > 0) out << "  ";
        out << std::left << std::setw(static_cast<int>(widths[c])) << cells[c];
    }
    out << "\n";
}

// Header row in bold with a light rule under it.
std::string RenderFtxuiTable(const std::vector<std::string>& headers,
                             const std::vector<std::vector<std::string>>& rows) {
    std::vector<std::vector<std::string>> cells;
    cells.reserve(rows.size() + 1);
    cells.push_back(headers);
    cells.insert(cells.end(), rows.begin(), rows.end());

    auto table = ftxui::Table(cells);
    table.SelectRow(0).Decorate(ftxui::bold);
    table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
    table.SelectRow(0).BorderBottom(ftxui::LIGHT);

    auto element = table.Render();
    auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
    ftxui::Render(screen, element);
    return screen.ToString();
}

// ---------------------------------------------------------------------------
// Tree helpers
// ---------------------------------------------------------------------------

struct TreeLine {
    std::string key;
    std::string value;
    bool header = false;  // section title, no value
    bool nested = false;  // inside a titled section
    bool last = false;    // last sibling at its depth
};

// Titled sections become sub-trees, untitled ones put their entries at the
// root. Empty sections are dropped.
std::vector<TreeLine> FlattenSections(const std::vector<DetailSection>& sections) {
    std::vector<TreeLine> lines;
    for (const auto& section : sections) {
        if (section.entries.empty()) continue;
        if (!section.title.empty()) {
            lines.push_back({section.title, "", true, false, false});
        }
        const bool nested = !section.title.empty();
        for (size_t i = 0; i < section.entries.size(); ++i) {
            const bool last_child = nested && i + 1 == section.entries.size();
            lines.push_back({section.entries[i].first, section.entries[i].second,
                             false, nested, last_child});
        }
    }
    auto root = std::find_if(lines.rbegin(), lines.rend(),
                             [](const TreeLine& line) { return !line.nested; });
    if (root != lines.rend()) {
        root->last = true;
    }
    return lines;
}

const char* Branch(bool last, bool unicode) {
    if (unicode) {
        return last ? "└── " : "├── ";
    }
    return last ? "+-- " : "|-- ";
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json object = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                object[headers[c]] = row[c];
            }
            array.push_back(std::move(object));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        out_ << RenderFtxuiTable(headers, rows) << "\n";
        return;
    }

    const auto widths = ColumnWidths(headers, rows);
    WritePaddedRow(out_, headers, widths);
    std::vector<std::string> rule;
    for (auto width : widths) {
        rule.emplace_back(width, '-');
    }
    WritePaddedRow(out_, rule, widths);
    for (const auto& row : rows) {
        WritePaddedRow(out_, row, widths);
    }
}

void OutputFormatter::PrintDetail(
    const std::string& title,
    const std::vector<DetailSection>& sections) const {

    if (color_mode_) {
        out_ << kBold << title << kReset << "\n";
    } else {
        out_ << title << "\n";
    }

    for (const auto& line : FlattenSections(sections)) {
        const char* indent = line.nested ? "    " : "";
        if (color_mode_) {
            out_ << kDim << indent << Branch(line.last, true) << kReset;
        } else {
            out_ << indent << Branch(line.last, false);
        }

        if (!line.header) {
            out_ << line.key << ": " << line.value << "\n";
        } else if (color_mode_) {
            out_ << kBold << line.key << kReset << "\n";
        } else {
            out_ << line.key << "\n";
        }
    }
}

void OutputFormatter::PrintJson(const std::string& json) const {
    out_ << json << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset << kBold << error.operation << kReset;
        if (!error.subject.empty()) {
            err_ << kDim << " [" << error.subject << "]" << kReset;
        }
        err_ << "\n  " << error.message << "\n";
        if (error.hint.has_value() && !error.hint->empty()) {
            err_ << "  " << kYellow << "Hint: " << kReset << *error.hint << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.subject.empty()) {
        err_ << " [" << error.subject << "]";
    }
    err_ << "\n  " << error.message << "\n";
    if (error.hint.has_value() && !error.hint->empty()) {
        err_ << "  Hint: " << *error.hint << "\n";
    }
}

void OutputFormatter::PrintWarning(const std::string& message) const {
    if (json_mode_) {
        return;
    }
    if (color_mode_) {
        err_ << kYellow << "Warning: " << kReset << message << "\n";
        return;
    }
    err_ << "Warning: " << message << "\n";
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
    } else if (color_mode_) {
        out_ << kGreen << "OK" << kReset << " " << message << "\n";
    } else {
        out_ << message << "\n";
    }
}

} // namespace kpi_lineage
