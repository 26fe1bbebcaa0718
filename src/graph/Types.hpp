#pragma once

#include <string>
#include <cstdint>

namespace conngraph {
namespace graph {

/**
 * Direction of a port - edges always run Output -> Input
 */
enum class PortDirection {
    Input,
    Output
};

/**
 * Kind of a diagram node.
 *
 * Automation nodes use the first six kinds; ERD entities, ETL steps and
 * other diagram shapes are Generic unless the host says otherwise.
 */
enum class NodeKind {
    Trigger,
    Action,
    Condition,
    DataSource,
    Transform,
    Output,
    Conditional,
    Generic
};

/**
 * Semantic status of an edge, shown as an indicator on the line
 */
enum class EdgeStatus {
    Normal,
    Warning,
    Error
};

/**
 * How an edge consumes its ports.
 *
 * SingleUse: both ports become unavailable while the edge exists
 *            (automation family).
 * Shared:    ports stay available, fan-out/fan-in allowed (generic nodes).
 */
enum class EdgePolicy {
    SingleUse,
    Shared
};

/**
 * ERD multiplicity markers drawn at each end of an edge
 */
enum class Multiplicity {
    Unspecified,
    ZeroOrOne,   // circle + bar
    OneOnly,     // double bar
    OneOrMany,   // bar + crow's foot
    ZeroOrMany,  // circle + crow's foot
    Many,        // crow's foot only
    One          // single bar
};

/**
 * Direction of the animated data flow along an edge
 */
enum class FlowDirection {
    None,
    Forward,
    Backward,
    Bidirectional
};

/**
 * RGBA color for status and data-flow indicators
 */
struct Color {
    uint8_t r = 0;
    uint8_t g = 0;
    uint8_t b = 0;
    uint8_t a = 255;

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }

    /**
     * "#RRGGBB" or "#RRGGBBAA"; throws std::invalid_argument otherwise
     */
    static Color fromHex(const std::string& hex);
    std::string toHex() const;
};

namespace colors {
    constexpr Color Amber{255, 152, 0, 255};
    constexpr Color Red{244, 67, 54, 255};
    constexpr Color Green{0, 128, 0, 255};
    constexpr Color Blue{0, 0, 255, 255};
    constexpr Color Orange{255, 165, 0, 255};
    constexpr Color Purple{128, 0, 128, 255};
    constexpr Color Crimson{255, 0, 0, 255};
    constexpr Color Brown{165, 42, 42, 255};
    constexpr Color Pink{255, 192, 203, 255};
    constexpr Color Gray{128, 128, 128, 255};
    constexpr Color Cyan{0, 255, 255, 255};
} // namespace colors

// === String conversion (interchange and logging) ===

std::string portDirectionToString(PortDirection direction);

std::string nodeKindToString(NodeKind kind);
NodeKind stringToNodeKind(const std::string& str);

std::string edgeStatusToString(EdgeStatus status);
EdgeStatus stringToEdgeStatus(const std::string& str);

std::string edgePolicyToString(EdgePolicy policy);
EdgePolicy stringToEdgePolicy(const std::string& str);

std::string multiplicityToString(Multiplicity m);
Multiplicity stringToMultiplicity(const std::string& str);

std::string flowDirectionToString(FlowDirection direction);
FlowDirection stringToFlowDirection(const std::string& str);

} // namespace graph
} // namespace conngraph
