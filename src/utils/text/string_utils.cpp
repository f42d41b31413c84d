#include "string_utils.hpp"

namespace Rotor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str) {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (std::string::npos == first) {
        return "";
    }
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, (last - first + 1));
}

std::string strip_comment(const std::string& line) {
    size_t hash = line.find('#');
    if (hash == std::string::npos)
        return trim(line);
    return trim(line.substr(0, hash));
}

}  // namespace Text
}  // namespace Utils
}  // namespace Rotor
