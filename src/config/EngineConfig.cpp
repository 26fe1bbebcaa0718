#include "config/EngineConfig.hpp"
#include "util/StringUtil.hpp"
#include <fstream>
#include <stdexcept>

namespace conngraph {
namespace config {

namespace {

bool parseBool(const std::string& key, const std::string& value) {
    std::string v = util::toLower(value);
    if (v == "true" || v == "1" || v == "yes" || v == "on") return true;
    if (v == "false" || v == "0" || v == "no" || v == "off") return false;
    throw std::invalid_argument("Invalid boolean for " + key + ": " + value);
}

} // namespace

std::map<std::string, std::string> EngineConfig::parseLines(std::istream& in) {
    std::map<std::string, std::string> values;
    std::string line;
    while (std::getline(in, line)) {
        line = util::trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto eq = line.find('=');
        if (eq == std::string::npos) {
            CG_LOG_WARN("Config: ignoring line without '=': " + line);
            continue;
        }
        std::string key = util::trim(line.substr(0, eq));
        std::string val = util::trim(line.substr(eq + 1));
        values[key] = val;
    }
    return values;
}

EngineConfig EngineConfig::fromFile(const std::string& path) {
    std::string filepath = path;
    if (!filepath.empty() && filepath[0] == '@') filepath = filepath.substr(1);

    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw std::runtime_error("Cannot open config file: " + filepath);
    }

    auto values = parseLines(file);
    CG_LOG_INFO("Loaded " + std::to_string(values.size()) + " engine parameters from " + filepath);
    return fromMap(values);
}

EngineConfig EngineConfig::fromMap(const std::map<std::string, std::string>& values) {
    EngineConfig config;
    for (const auto& [key, value] : values) {
        if (key == "log_level") {
            config.logLevel = util::Logger::stringToLevel(util::toLower(value));
        } else if (key == "log_file") {
            config.logFile = value;
        } else if (key == "warning_color") {
            config.warningColor = graph::Color::fromHex(value);
        } else if (key == "animate_automation_edges") {
            config.animateAutomationEdges = parseBool(key, value);
        } else if (key == "default_flow_direction") {
            config.defaultFlowDirection = graph::stringToFlowDirection(util::toLower(value));
        } else {
            CG_LOG_WARN("Config: unknown key '" + key + "' ignored");
        }
    }
    return config;
}

void EngineConfig::apply() const {
    auto& logger = util::Logger::instance();
    logger.setLevel(logLevel);
    if (logFile.empty()) {
        logger.disableFileLogging();
    } else {
        logger.enableFileLogging(logFile);
    }
}

} // namespace config
} // namespace conngraph
