/**
 * @file json_reporter.hpp
 * @brief Machine-readable JSON output of analysis reports
 *
 * Writes one file per analysis, `report_<analysis_id>.json`, into the
 * configured output directory. Reports reference guest and host paths only;
 * credentials never appear.
 *
 * **Usage Example**:
 * @code
 * JsonReporterConfig config;
 * config.output_directory = "./sandbox_results";
 *
 * JsonReporter reporter(config);
 * auto report_path = reporter.GenerateReport(report);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace vmsandbox {

namespace core {
struct AnalysisReport;
}

namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Configuration for JSON report generation
 */
struct JsonReporterConfig {
    std::filesystem::path output_directory{"./sandbox_results"};  ///< Output directory
    bool pretty_print{true};              ///< Pretty print JSON
    int indent_size{2};                   ///< Indentation spaces
};

class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = JsonReporterConfig());

    /**
     * @brief Write a report file
     *
     * @param report Analysis report
     * @return Path of the written file
     *
     * @throws std::runtime_error if the file cannot be written
     */
    std::filesystem::path GenerateReport(const core::AnalysisReport& report);

    /// Report as a JSON document
    static nlohmann::json ToJson(const core::AnalysisReport& report);

    /// Report rendered with the configured formatting
    std::string GenerateJsonString(const core::AnalysisReport& report) const;

    static std::string FormatTimestamp(const std::chrono::system_clock::time_point& time);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace vmsandbox
