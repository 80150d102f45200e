#include "AppConfig.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace flowgraph {
namespace app {

namespace {

std::string trim(std::string s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n')) s.pop_back();
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.erase(s.begin());
    return s;
}

size_t parseMaxRows(const std::string& value) {
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw std::invalid_argument("Invalid max_rows: " + value);
    }
    try {
        return static_cast<size_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Invalid max_rows: " + value);
    }
}

} // anonymous namespace

ParamMap AppConfig::parseParams(std::istream& input) {
    ParamMap params;
    std::string line;
    while (std::getline(input, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = trim(line.substr(0, eq));
        std::string val = trim(line.substr(eq + 1));
        params[key] = val;
    }
    return params;
}

ParamMap AppConfig::loadParamsFile(const std::string& path) {
    std::string filePath = path;
    if (!filePath.empty() && filePath[0] == '@') filePath = filePath.substr(1);

    std::ifstream paramFile(filePath);
    if (!paramFile.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filePath);
    }
    return parseParams(paramFile);
}

void AppConfig::applyParams(const ParamMap& params) {
    for (const auto& [key, value] : params) {
        if (key == "log_level") {
            logLevel = Logger::parseLevel(value);
        } else if (key == "log_file") {
            logFile = value;
        } else if (key == "format") {
            if (value != "json" && value != "table") {
                throw std::invalid_argument("Invalid format: " + value + " (expected json or table)");
            }
            format = value;
        } else if (key == "max_rows") {
            maxRows = parseMaxRows(value);
        } else {
            warnings.push_back("Ignoring unknown config key: " + key);
        }
    }
}

AppConfig AppConfig::fromArgs(const std::vector<std::string>& args) {
    AppConfig config;
    ParamMap overrides;

    auto next = [&args](size_t& i, const std::string& option) -> const std::string& {
        if (i + 1 >= args.size()) {
            throw std::invalid_argument("Missing value for " + option);
        }
        return args[++i];
    };

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-n" || arg == "--node") {
            config.nodeId = next(i, arg);
        } else if (arg == "-f" || arg == "--format") {
            overrides["format"] = next(i, arg);
        } else if (arg == "-l" || arg == "--log-level") {
            overrides["log_level"] = next(i, arg);
        } else if (arg == "--log-file") {
            overrides["log_file"] = next(i, arg);
        } else if (arg == "--max-rows") {
            overrides["max_rows"] = next(i, arg);
        } else if (arg == "--config") {
            config.configFile = next(i, arg);
        } else if (arg == "--events") {
            config.printEvents = true;
        } else if (arg == "--list-nodes") {
            config.listNodes = true;
        } else if (arg == "-h" || arg == "--help") {
            config.showHelp = true;
        } else if (!arg.empty() && arg[0] == '-') {
            throw std::invalid_argument("Unknown option: " + arg);
        } else if (config.graphPath.empty()) {
            config.graphPath = arg;
        } else {
            throw std::invalid_argument("Unexpected argument: " + arg);
        }
    }

    if (!config.configFile.empty()) {
        config.applyParams(loadParamsFile(config.configFile));
    }
    config.applyParams(overrides);

    return config;
}

AppConfig AppConfig::fromArgs(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }
    return fromArgs(args);
}

std::string AppConfig::usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " GRAPH.json [options]\n"
        << "Options:\n"
        << "  -n, --node ID        Node to evaluate (default: every node)\n"
        << "  -f, --format FMT     Output format: json, table (default: json)\n"
        << "  --max-rows N         Rows shown per frame in table format (default: 10)\n"
        << "  -l, --log-level LVL  Log level: debug, info, warn, error (default: info)\n"
        << "  --log-file PATH      Append logs to a file instead of stderr\n"
        << "  --config FILE        Parameters file (key=value lines, @file syntax)\n"
        << "                       Keys: log_level, log_file, format, max_rows\n"
        << "  --events             Print execution events as JSON lines on stderr\n"
        << "  --list-nodes         List available node kinds and exit\n"
        << "  -h, --help           Show this help\n";
    return oss.str();
}

} // namespace app
} // namespace flowgraph
