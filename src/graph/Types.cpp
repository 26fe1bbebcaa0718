#include "graph/Types.hpp"
#include "util/StringUtil.hpp"
#include <cstdio>
#include <stdexcept>

namespace conngraph {
namespace graph {

// === Color ===

Color Color::fromHex(const std::string& hex) {
    if ((hex.size() != 7 && hex.size() != 9) || hex[0] != '#') {
        throw std::invalid_argument("Invalid color: " + hex);
    }

    auto channel = [&hex](size_t pos) {
        size_t consumed = 0;
        int value = 0;
        try {
            value = std::stoi(hex.substr(pos, 2), &consumed, 16);
        } catch (const std::exception&) {
            throw std::invalid_argument("Invalid color: " + hex);
        }
        if (consumed != 2 || value < 0) {
            throw std::invalid_argument("Invalid color: " + hex);
        }
        return static_cast<uint8_t>(value);
    };

    Color c;
    c.r = channel(1);
    c.g = channel(3);
    c.b = channel(5);
    c.a = hex.size() == 9 ? channel(7) : 255;
    return c;
}

std::string Color::toHex() const {
    char buf[10];
    if (a == 255) {
        std::snprintf(buf, sizeof(buf), "#%02X%02X%02X", r, g, b);
    } else {
        std::snprintf(buf, sizeof(buf), "#%02X%02X%02X%02X", r, g, b, a);
    }
    return buf;
}

// === Enums ===

std::string portDirectionToString(PortDirection direction) {
    return direction == PortDirection::Input ? "input" : "output";
}

std::string nodeKindToString(NodeKind kind) {
    switch (kind) {
        case NodeKind::Trigger:     return "Trigger";
        case NodeKind::Action:      return "Action";
        case NodeKind::Condition:   return "Condition";
        case NodeKind::DataSource:  return "DataSource";
        case NodeKind::Transform:   return "Transform";
        case NodeKind::Output:      return "Output";
        case NodeKind::Conditional: return "Conditional";
        case NodeKind::Generic:     return "Generic";
    }
    return "Unknown";
}

NodeKind stringToNodeKind(const std::string& str) {
    if (util::iequals(str, "Trigger"))     return NodeKind::Trigger;
    if (util::iequals(str, "Action"))      return NodeKind::Action;
    if (util::iequals(str, "Condition"))   return NodeKind::Condition;
    if (util::iequals(str, "DataSource"))  return NodeKind::DataSource;
    if (util::iequals(str, "Transform"))   return NodeKind::Transform;
    if (util::iequals(str, "Output"))      return NodeKind::Output;
    if (util::iequals(str, "Conditional")) return NodeKind::Conditional;
    if (util::iequals(str, "Generic"))     return NodeKind::Generic;
    throw std::invalid_argument("Unknown node kind: " + str);
}

std::string edgeStatusToString(EdgeStatus status) {
    switch (status) {
        case EdgeStatus::Normal:  return "normal";
        case EdgeStatus::Warning: return "warning";
        case EdgeStatus::Error:   return "error";
    }
    return "unknown";
}

EdgeStatus stringToEdgeStatus(const std::string& str) {
    if (str == "normal")  return EdgeStatus::Normal;
    if (str == "warning") return EdgeStatus::Warning;
    if (str == "error")   return EdgeStatus::Error;
    throw std::invalid_argument("Unknown edge status: " + str);
}

std::string edgePolicyToString(EdgePolicy policy) {
    return policy == EdgePolicy::SingleUse ? "single_use" : "shared";
}

EdgePolicy stringToEdgePolicy(const std::string& str) {
    if (str == "single_use") return EdgePolicy::SingleUse;
    if (str == "shared")     return EdgePolicy::Shared;
    throw std::invalid_argument("Unknown edge policy: " + str);
}

std::string multiplicityToString(Multiplicity m) {
    switch (m) {
        case Multiplicity::Unspecified: return "unspecified";
        case Multiplicity::ZeroOrOne:   return "zero_or_one";
        case Multiplicity::OneOnly:     return "one_only";
        case Multiplicity::OneOrMany:   return "one_or_many";
        case Multiplicity::ZeroOrMany:  return "zero_or_many";
        case Multiplicity::Many:        return "many";
        case Multiplicity::One:         return "one";
    }
    return "unspecified";
}

Multiplicity stringToMultiplicity(const std::string& str) {
    if (str == "unspecified")  return Multiplicity::Unspecified;
    if (str == "zero_or_one")  return Multiplicity::ZeroOrOne;
    if (str == "one_only")     return Multiplicity::OneOnly;
    if (str == "one_or_many")  return Multiplicity::OneOrMany;
    if (str == "zero_or_many") return Multiplicity::ZeroOrMany;
    if (str == "many")         return Multiplicity::Many;
    if (str == "one")          return Multiplicity::One;
    throw std::invalid_argument("Unknown multiplicity: " + str);
}

std::string flowDirectionToString(FlowDirection direction) {
    switch (direction) {
        case FlowDirection::None:          return "none";
        case FlowDirection::Forward:       return "forward";
        case FlowDirection::Backward:      return "backward";
        case FlowDirection::Bidirectional: return "bidirectional";
    }
    return "none";
}

FlowDirection stringToFlowDirection(const std::string& str) {
    if (str == "none")          return FlowDirection::None;
    if (str == "forward")       return FlowDirection::Forward;
    if (str == "backward")      return FlowDirection::Backward;
    if (str == "bidirectional") return FlowDirection::Bidirectional;
    throw std::invalid_argument("Unknown flow direction: " + str);
}

} // namespace graph
} // namespace conngraph
