#ifndef PHISCRUB_UTIL_UTF8_HPP
#define PHISCRUB_UTIL_UTF8_HPP

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

/**
 * @file utf8.hpp
 * @brief Byte <-> codepoint offset conversion for UTF-8 text.
 *
 * Entity spans are expressed in codepoints so they stay valid whatever the
 * encoding of the caller. Matchers work on bytes, so every match position is
 * translated through a CodepointIndex built once per text.
 *
 * Malformed sequences are not rejected. A lead byte that is not followed by
 * the continuation bytes it announces counts as one codepoint on its own, so
 * the bytes after it keep their own positions. A stray continuation byte
 * also counts as one codepoint.
 */

namespace phiscrub {
namespace util {
namespace utf8 {

/// Sequence length implied by a lead byte.
inline std::size_t sequenceLength(unsigned char lead)
{
    if (lead < 0xC0) return 1;
    if (lead < 0xE0) return 2;
    if (lead < 0xF0) return 3;
    return 4;
}

/// Length of the codepoint starting at @p pos; 1 for a malformed or truncated sequence.
inline std::size_t sequenceLengthAt(const std::string &text, std::size_t pos)
{
    const unsigned char lead = static_cast<unsigned char>(text[pos]);
    if (lead < 0xC0 || lead >= 0xF8) {
        return 1;
    }
    const std::size_t len = sequenceLength(lead);
    if (pos + len > text.size()) {
        return 1;
    }
    for (std::size_t i = 1; i < len; ++i) {
        if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
            return 1;
        }
    }
    return len;
}

/// Number of codepoints in @p text.
inline std::size_t codepointCount(const std::string &text)
{
    std::size_t count = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        pos += sequenceLengthAt(text, pos);
        ++count;
    }
    return count;
}

/**
 * @class CodepointIndex
 * @brief Byte offset of every codepoint start in a text, plus the end offset.
 */
class CodepointIndex
{
public:
    explicit CodepointIndex(const std::string &text)
        : byteSize_(text.size())
    {
        starts_.reserve(text.size() + 1);
        std::size_t pos = 0;
        while (pos < text.size()) {
            starts_.push_back(pos);
            pos += sequenceLengthAt(text, pos);
        }
        starts_.push_back(text.size());
    }

    /// Number of codepoints in the indexed text.
    std::size_t size() const { return starts_.size() - 1; }

    /// Codepoint offset of a byte offset; a byte inside a sequence rounds up.
    std::size_t toCodepoint(std::size_t byteOffset) const
    {
        if (byteOffset >= byteSize_) {
            return size();
        }
        auto it = std::lower_bound(starts_.begin(), starts_.end(), byteOffset);
        return static_cast<std::size_t>(it - starts_.begin());
    }

    /// Byte offset of a codepoint offset; offsets past the end clamp to the byte size.
    std::size_t toByte(std::size_t codepointOffset) const
    {
        if (codepointOffset >= size()) {
            return byteSize_;
        }
        return starts_[codepointOffset];
    }

private:
    std::vector<std::size_t> starts_;
    std::size_t byteSize_;
};

/// Substring of @p text covering codepoints [start, end).
inline std::string substr(const std::string &text, const CodepointIndex &index,
                          std::size_t start, std::size_t end)
{
    std::size_t b0 = index.toByte(start);
    std::size_t b1 = index.toByte(end);
    if (b1 <= b0) {
        return std::string();
    }
    return text.substr(b0, b1 - b0);
}

/// Split @p text into its codepoints, each as a UTF-8 string.
inline std::vector<std::string> codepoints(const std::string &text)
{
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t len = sequenceLengthAt(text, pos);
        out.push_back(text.substr(pos, len));
        pos += len;
    }
    return out;
}

} // namespace utf8
} // namespace util
} // namespace phiscrub

#endif // PHISCRUB_UTIL_UTF8_HPP
