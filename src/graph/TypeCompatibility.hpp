#pragma once

#include "graph/Types.hpp"
#include <string>
#include <unordered_map>
#include <unordered_set>

namespace conngraph {
namespace graph {

/**
 * Static directed relation over port data-type tags.
 *
 * Answers "can an output of type A feed an input of type B?":
 * - exact match (case-insensitive) is always compatible
 * - "any" on either side is compatible with everything
 * - otherwise only the one-way conversions of the allow-list apply
 *
 * The relation is asymmetric: number -> string is allowed,
 * string -> number is not.
 */
class TypeCompatibilityTable {
public:
    static const TypeCompatibilityTable& instance();

    bool isCompatible(const std::string& outputType, const std::string& inputType) const;

    /**
     * Color of the animated data flow for a port data type
     */
    static Color dataFlowColor(const std::string& dataType);

private:
    TypeCompatibilityTable();

    // lower-cased output type -> lower-cased input types it converts to
    std::unordered_map<std::string, std::unordered_set<std::string>> m_conversions;
};

} // namespace graph
} // namespace conngraph
