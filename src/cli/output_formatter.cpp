#include <dv_alm/cli/output_formatter.hpp>
#include <dv_alm/core/ansi.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <iomanip>

#include <ftxui/dom/elements.hpp>
#include <ftxui/dom/table.hpp>
#include <ftxui/screen/screen.hpp>

namespace dv_alm {

namespace {

using namespace dv_alm::ansi;

nlohmann::json RunResultJson(const RunResult& result) {
    nlohmann::json solutions = nlohmann::json::array();
    for (const auto& s : result.solutions) {
        nlohmann::json steps = nlohmann::json::array();
        for (const auto& step : s.steps) {
            steps.push_back({
                {"step", step.step_name},
                {"outcome", StepOutcomeName(step.outcome)},
                {"message", step.message},
                {"duration_ms", step.duration.count()},
            });
        }
        nlohmann::json item = {
            {"name", s.solution_name},
            {"success", s.success},
            {"action", s.action},
            {"from_version", s.from_version},
            {"to_version", s.to_version},
            {"message", s.message},
            {"elapsed_ms", s.elapsed.count()},
            {"steps", steps},
        };
        if (s.error.has_value()) {
            item["error"] = nlohmann::json::parse(s.error->ToJson())["error"];
        }
        solutions.push_back(std::move(item));
    }
    return {
        {"command", result.command},
        {"success", result.success},
        {"summary", result.summary},
        {"duration_ms", result.total_duration.count()},
        {"solutions", solutions},
    };
}

} // anonymous namespace

void OutputFormatter::PrintTable(
    const std::vector<std::string>& headers,
    const std::vector<std::vector<std::string>>& rows) const {

    if (json_mode_) {
        nlohmann::json array = nlohmann::json::array();
        for (const auto& row : rows) {
            nlohmann::json obj = nlohmann::json::object();
            for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
                obj[headers[c]] = row[c];
            }
            array.push_back(std::move(obj));
        }
        out_ << array.dump() << "\n";
        return;
    }

    if (color_mode_) {
        std::vector<std::vector<std::string>> table_data;
        table_data.push_back(headers);
        for (const auto& row : rows) {
            table_data.push_back(row);
        }

        auto table = ftxui::Table(table_data);
        table.SelectRow(0).Decorate(ftxui::bold);
        table.SelectRow(0).SeparatorVertical(ftxui::LIGHT);
        table.SelectRow(0).BorderBottom(ftxui::LIGHT);

        auto element = table.Render();
        auto screen = ftxui::Screen::Create(ftxui::Dimension::Fit(element));
        ftxui::Render(screen, element);
        out_ << screen.ToString() << "\n";
        return;
    }

    std::vector<size_t> widths(headers.size(), 0);
    for (size_t c = 0; c < headers.size(); ++c) {
        widths[c] = headers[c].size();
    }
    for (const auto& row : rows) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            widths[c] = std::max(widths[c], row[c].size());
        }
    }

    auto print_row = [&](const std::vector<std::string>& row) {
        for (size_t c = 0; c < headers.size() && c < row.size(); ++c) {
            if (c > 0) out_ << "  ";
            out_ << std::left << std::setw(static_cast<int>(widths[c])) << row[c];
        }
        out_ << "\n";
    };

    print_row(headers);
    for (size_t c = 0; c < headers.size(); ++c) {
        if (c > 0) out_ << "  ";
        out_ << std::string(widths[c], '-');
    }
    out_ << "\n";
    for (const auto& row : rows) {
        print_row(row);
    }
}

void OutputFormatter::PrintRunResult(const RunResult& result) const {
    if (json_mode_) {
        out_ << RunResultJson(result).dump() << "\n";
        return;
    }
    if (quiet_) {
        return;
    }

    std::vector<std::vector<std::string>> rows;
    for (const auto& s : result.solutions) {
        std::string versions = s.from_version;
        if (!s.to_version.empty() && s.to_version != s.from_version) {
            versions += versions.empty() ? s.to_version : " -> " + s.to_version;
        }
        rows.push_back({s.success ? "OK" : "FAILED", s.solution_name, s.action,
                        versions, s.message});
    }
    PrintTable({"Status", "Solution", "Action", "Version", "Message"}, rows);

    out_ << Paint(result.command, result.success ? kGreen : kRed, color_mode_)
         << " " << result.summary << " "
         << Paint("(" + std::to_string(result.total_duration.count()) + "ms)", kDim,
                  color_mode_)
         << "\n";
}

void OutputFormatter::PrintError(const Error& error) const {
    if (json_mode_) {
        err_ << error.ToJson() << "\n";
        return;
    }

    if (color_mode_) {
        err_ << kRed << "Error: " << kReset;
        err_ << kBold << error.operation << kReset;
        if (!error.target.empty()) {
            err_ << " [" << error.target << "]";
        }
        if (error.http_status.has_value()) {
            err_ << kDim << " (HTTP " << error.http_status.value() << ")" << kReset;
        }
        err_ << "\n";
        err_ << "  " << error.message << "\n";
        if (error.platform_error.has_value() && !error.platform_error->empty()) {
            err_ << "  " << kDim << "Dataverse: " << kReset
                 << error.platform_error.value() << "\n";
        }
        return;
    }

    err_ << "Error: " << error.operation;
    if (!error.target.empty()) {
        err_ << " [" << error.target << "]";
    }
    if (error.http_status.has_value()) {
        err_ << " (HTTP " << error.http_status.value() << ")";
    }
    err_ << "\n";
    err_ << "  " << error.message << "\n";
    if (error.platform_error.has_value() && !error.platform_error->empty()) {
        err_ << "  Dataverse: " << error.platform_error.value() << "\n";
    }
}

void OutputFormatter::PrintSuccess(const std::string& message) const {
    if (json_mode_) {
        out_ << nlohmann::json{{"success", true}, {"message", message}}.dump() << "\n";
        return;
    }
    if (quiet_) {
        return;
    }
    if (color_mode_) {
        out_ << Paint("OK", kGreen, true) << " " << message << "\n";
        return;
    }
    out_ << message << "\n";
}

} // namespace dv_alm
