#pragma once

#include "graph/Types.hpp"
#include "util/Logger.hpp"
#include <map>
#include <string>

namespace conngraph {
namespace config {

/**
 * Engine settings.
 *
 * File format: one key=value per line, blank lines and lines starting
 * with '#' ignored. Keys:
 *   log_level                 debug | info | warn | error
 *   log_file                  path, empty disables file logging
 *   warning_color             #RRGGBB[AA]
 *   animate_automation_edges  true | false
 *   default_flow_direction    none | forward | backward | bidirectional
 */
struct EngineConfig {
    util::LogLevel logLevel = util::LogLevel::INFO;
    std::string logFile;
    graph::Color warningColor = graph::colors::Amber;
    bool animateAutomationEdges = true;
    graph::FlowDirection defaultFlowDirection = graph::FlowDirection::Forward;

    /**
     * Load from a key=value file; a leading '@' on the path is accepted.
     * Throws std::runtime_error if the file cannot be opened and
     * std::invalid_argument on a bad value.
     */
    static EngineConfig fromFile(const std::string& path);

    /**
     * Apply parsed settings over the defaults. Unknown keys are logged
     * and ignored.
     */
    static EngineConfig fromMap(const std::map<std::string, std::string>& values);

    static std::map<std::string, std::string> parseLines(std::istream& in);

    /**
     * Push the logging settings to the Logger
     */
    void apply() const;
};

} // namespace config
} // namespace conngraph
