#ifndef PHISCRUB_UTIL_JSON_STRING_HPP
#define PHISCRUB_UTIL_JSON_STRING_HPP

#include <iomanip>
#include <sstream>
#include <string>

namespace phiscrub {
namespace util {

/**
 * @brief Escape a UTF-8 string for use inside JSON double quotes.
 *        Multi-byte sequences pass through unchanged.
 */
inline std::string escapeJsonString(const std::string &in)
{
    std::ostringstream oss;
    for (char c : in) {
        switch (c) {
        case '"':  oss << "\\\""; break;
        case '\\': oss << "\\\\"; break;
        case '\b': oss << "\\b";  break;
        case '\f': oss << "\\f";  break;
        case '\n': oss << "\\n";  break;
        case '\r': oss << "\\r";  break;
        case '\t': oss << "\\t";  break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c)) << std::dec;
            } else {
                oss << c;
            }
            break;
        }
    }
    return oss.str();
}

/// escapeJsonString wrapped in double quotes.
inline std::string quoteJson(const std::string &in)
{
    return "\"" + escapeJsonString(in) + "\"";
}

} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_JSON_STRING_HPP
