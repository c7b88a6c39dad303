#pragma once

#include <dv_alm/core/result.hpp>
#include <dv_alm/workflow/workflow_result.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace dv_alm {

// ---------------------------------------------------------------------------
// OutputFormatter — human-readable and JSON output for the CLI.
//
// When color_mode is true and json_mode is false, tables are rendered with
// FTXUI and messages use ANSI escape codes. Quiet mode suppresses everything
// except errors.
// ---------------------------------------------------------------------------
class OutputFormatter {
public:
    explicit OutputFormatter(bool json_mode, bool color_mode = false,
                             bool quiet = false,
                             std::ostream& out = std::cout,
                             std::ostream& err = std::cerr)
        : json_mode_(json_mode), color_mode_(color_mode && !json_mode),
          quiet_(quiet), out_(out), err_(err) {}

    [[nodiscard]] bool IsJsonMode() const noexcept { return json_mode_; }
    [[nodiscard]] bool IsColorMode() const noexcept { return color_mode_; }

    // Print a table with headers and rows. In JSON mode, outputs a JSON
    // array of objects keyed by header.
    void PrintTable(const std::vector<std::string>& headers,
                    const std::vector<std::vector<std::string>>& rows) const;

    // Per-solution table followed by the summary line, or one JSON object.
    void PrintRunResult(const RunResult& result) const;

    // Print an error to stderr.
    void PrintError(const Error& error) const;

    void PrintSuccess(const std::string& message) const;

private:
    bool json_mode_;
    bool color_mode_;
    bool quiet_;
    std::ostream& out_;
    std::ostream& err_;
};

} // namespace dv_alm
