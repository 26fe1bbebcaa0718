#pragma once

#include <string>

namespace conngraph {
namespace util {

/**
 * ASCII lower-casing, used for case-insensitive tag and name comparison
 */
std::string toLower(const std::string& str);

/**
 * Case-insensitive equality (ASCII)
 */
bool iequals(const std::string& a, const std::string& b);

/**
 * Strip leading/trailing spaces, tabs and line breaks
 */
std::string trim(const std::string& str);

} // namespace util
} // namespace conngraph
