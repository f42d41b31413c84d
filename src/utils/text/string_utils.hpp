#pragma once

#include <string>

namespace Rotor {
namespace Utils {
namespace Text {

std::string trim(const std::string& str);

// Drops everything from the first '#' and trims the remainder.
std::string strip_comment(const std::string& line);

}  // namespace Text
}  // namespace Utils
}  // namespace Rotor
