#pragma once

#include "Logger.hpp"
#include <istream>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace flowgraph {
namespace app {

using ParamMap = std::map<std::string, std::string>;

/**
 * Settings of the flowgraph command line tool.
 *
 * Sources, lowest priority first: built-in defaults, the --config file
 * (key=value lines), command line flags.
 *
 * Recognized keys: log_level, log_file, format, max_rows.
 */
struct AppConfig {
    std::string graphPath;                // Positional GRAPH.json
    std::optional<std::string> nodeId;    // -n/--node, every node when unset
    std::string format = "json";          // json | table
    LogLevel logLevel = LogLevel::INFO;
    std::string logFile;                  // Empty: log to stderr
    size_t maxRows = 10;                  // Rows shown by the table format
    bool printEvents = false;
    bool listNodes = false;
    bool showHelp = false;
    std::string configFile;
    std::vector<std::string> warnings;    // Reported once the logger is configured

    /**
     * Parse key=value lines. Blank lines and lines starting with '#' are
     * skipped, as are lines without '='. Keys and values are trimmed.
     */
    static ParamMap parseParams(std::istream& input);

    /**
     * Read a parameter file; a leading '@' on the path is ignored.
     * Throws std::runtime_error if the file cannot be opened.
     */
    static ParamMap loadParamsFile(const std::string& path);

    /**
     * Apply recognized keys; unknown keys are recorded in `warnings` and ignored.
     * Throws std::invalid_argument for an invalid value.
     */
    void applyParams(const ParamMap& params);

    /**
     * Build the configuration from command line arguments (program name excluded).
     * Throws std::invalid_argument for unknown options or missing values.
     */
    static AppConfig fromArgs(const std::vector<std::string>& args);
    static AppConfig fromArgs(int argc, char* argv[]);

    static std::string usage(const std::string& program);
};

} // namespace app
} // namespace flowgraph
