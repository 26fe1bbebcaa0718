#include "util/StringUtil.hpp"

#include <algorithm>
#include <cctype>

namespace conngraph {
namespace util {

std::string toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool iequals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

std::string trim(const std::string& str) {
    const char* ws = " \t\r\n";
    auto first = str.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    auto last = str.find_last_not_of(ws);
    return str.substr(first, last - first + 1);
}

} // namespace util
} // namespace conngraph
