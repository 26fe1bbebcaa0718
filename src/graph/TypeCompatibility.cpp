#include "graph/TypeCompatibility.hpp"
#include "util/StringUtil.hpp"

namespace conngraph {
namespace graph {

const TypeCompatibilityTable& TypeCompatibilityTable::instance() {
    static const TypeCompatibilityTable table;
    return table;
}

TypeCompatibilityTable::TypeCompatibilityTable()
    : m_conversions{
        {"number",  {"string"}},            // string conversion
        {"string",  {"object"}},            // JSON parsing
        {"array",   {"object"}},
        {"object",  {"array"}},             // single item array
        {"boolean", {"number", "string"}}   // 0/1 and "true"/"false"
    }
{}

bool TypeCompatibilityTable::isCompatible(const std::string& outputType,
                                          const std::string& inputType) const {
    std::string out = util::toLower(outputType);
    std::string in = util::toLower(inputType);

    if (out == "any" || in == "any") return true;
    if (out == in) return true;

    auto it = m_conversions.find(out);
    return it != m_conversions.end() && it->second.count(in) > 0;
}

Color TypeCompatibilityTable::dataFlowColor(const std::string& dataType) {
    std::string type = util::toLower(dataType);
    if (type == "string")  return colors::Green;
    if (type == "number")  return colors::Blue;
    if (type == "boolean") return colors::Orange;
    if (type == "object")  return colors::Purple;
    if (type == "array")   return colors::Crimson;
    if (type == "file")    return colors::Brown;
    if (type == "image")   return colors::Pink;
    if (type == "binary")  return colors::Gray;
    return colors::Cyan;
}

} // namespace graph
} // namespace conngraph
