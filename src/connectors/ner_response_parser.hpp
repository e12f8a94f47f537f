#ifndef PHISCRUB_CONNECTORS_NER_RESPONSE_PARSER_HPP
#define PHISCRUB_CONNECTORS_NER_RESPONSE_PARSER_HPP

#include <cctype>
#include <cstddef>
#include <string>
#include <vector>

#include "detection/ner_capability.hpp"
#include "util/errors.hpp"
#include "util/json_string.hpp"
#include "util/logger.hpp"

/**
 * @file ner_response_parser.hpp
 * @brief Wire format of the remote NER service.
 *
 * Request body:   {"text":"..."}
 * Response body:  {"model":"en_core_web_sm",
 *                  "entities":[{"start":0,"end":10,"label":"PERSON"}, ...]}
 *
 * Offsets are codepoints. Labels PERSON map to PERSON; GPE, LOC and LOCATION
 * map to LOCATION; every other label is ignored.
 *
 * This is a small hand-written scanner for exactly this shape: objects,
 * arrays, strings, numbers and literals are walked, only the fields above
 * are kept. Malformed input raises CapabilityUnavailableError.
 */

namespace phiscrub {
namespace connectors {

/// Body of a NER request for @p text.
inline std::string buildNerRequest(const std::string &text)
{
    return "{\"text\":" + util::quoteJson(text) + "}";
}

namespace detail {

/**
 * @class JsonCursor
 * @brief Forward-only cursor over a JSON document.
 */
class JsonCursor
{
public:
    explicit JsonCursor(const std::string &json)
        : json_(json), pos_(0)
    {
    }

    void skipSpace()
    {
        while (pos_ < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos_]))) {
            pos_++;
        }
    }

    bool atEnd()
    {
        skipSpace();
        return pos_ >= json_.size();
    }

    char peek()
    {
        skipSpace();
        if (pos_ >= json_.size()) {
            fail("unexpected end of document");
        }
        return json_[pos_];
    }

    void expect(char c)
    {
        if (peek() != c) {
            fail(std::string("expected '") + c + "'");
        }
        pos_++;
    }

    /// Consume @p c if it is next; return whether it was.
    bool consume(char c)
    {
        if (!atEnd() && json_[pos_] == c) {
            pos_++;
            return true;
        }
        return false;
    }

    std::string readString()
    {
        expect('"');
        std::string out;
        while (pos_ < json_.size()) {
            char c = json_[pos_++];
            if (c == '"') {
                return out;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= json_.size()) {
                break;
            }
            char esc = json_[pos_++];
            switch (esc) {
            case '"':  out.push_back('"');  break;
            case '\\': out.push_back('\\'); break;
            case '/':  out.push_back('/');  break;
            case 'b':  out.push_back('\b'); break;
            case 'f':  out.push_back('\f'); break;
            case 'n':  out.push_back('\n'); break;
            case 'r':  out.push_back('\r'); break;
            case 't':  out.push_back('\t'); break;
            case 'u':
                // Labels and model names are ASCII; keep the escape verbatim.
                out += "\\u";
                break;
            default:
                fail(std::string("bad escape '\\") + esc + "'");
            }
        }
        fail("unterminated string");
        return out;
    }

    /// Longest digit run accepted for an offset; always fits in size_t.
    static constexpr std::size_t kMaxIndexDigits = 18;

    /// Deepest nesting skipValue() descends into.
    static constexpr int kMaxDepth = 64;

    /// A non-negative integer of at most kMaxIndexDigits digits.
    std::size_t readIndex()
    {
        skipSpace();
        std::size_t begin = pos_;
        std::size_t value = 0;
        while (pos_ < json_.size() && std::isdigit(static_cast<unsigned char>(json_[pos_]))) {
            if (pos_ - begin == kMaxIndexDigits) {
                fail("integer too large");
            }
            value = value * 10 + static_cast<std::size_t>(json_[pos_] - '0');
            pos_++;
        }
        if (pos_ == begin) {
            fail("expected a non-negative integer");
        }
        return value;
    }

    /// Skip any value (object, array, string, number, literal).
    void skipValue(int depth = 0)
    {
        if (depth >= kMaxDepth) {
            fail("nesting deeper than " + std::to_string(kMaxDepth));
        }
        char c = peek();
        if (c == '"') {
            readString();
        } else if (c == '{') {
            pos_++;
            if (consume('}')) {
                return;
            }
            do {
                readString();
                expect(':');
                skipValue(depth + 1);
            } while (consume(','));
            expect('}');
        } else if (c == '[') {
            pos_++;
            if (consume(']')) {
                return;
            }
            do {
                skipValue(depth + 1);
            } while (consume(','));
            expect(']');
        } else {
            std::size_t begin = pos_;
            while (pos_ < json_.size()
                   && (std::isalnum(static_cast<unsigned char>(json_[pos_]))
                       || json_[pos_] == '-' || json_[pos_] == '+' || json_[pos_] == '.')) {
                pos_++;
            }
            if (pos_ == begin) {
                fail(std::string("unexpected character '") + c + "'");
            }
        }
    }

    void fail(const std::string &what) const
    {
        throw util::CapabilityUnavailableError("malformed NER response at offset "
                                               + std::to_string(pos_) + ": " + what);
    }

private:
    const std::string &json_;
    std::size_t pos_;
};

inline bool mapLabel(const std::string &label, detection::NerLabel &out)
{
    if (label == "PERSON") {
        out = detection::NerLabel::PERSON;
        return true;
    }
    if (label == "GPE" || label == "LOC" || label == "LOCATION") {
        out = detection::NerLabel::LOCATION;
        return true;
    }
    return false;
}

inline void readEntity(JsonCursor &cur, std::vector<detection::NerSpan> &out)
{
    bool hasStart = false;
    bool hasEnd = false;
    std::string label;
    detection::NerSpan span;

    cur.expect('{');
    if (!cur.consume('}')) {
        do {
            std::string key = cur.readString();
            cur.expect(':');
            if (key == "start") {
                span.start = cur.readIndex();
                hasStart = true;
            } else if (key == "end") {
                span.end = cur.readIndex();
                hasEnd = true;
            } else if (key == "label") {
                label = cur.readString();
            } else {
                cur.skipValue(2);
            }
        } while (cur.consume(','));
        cur.expect('}');
    }

    if (!hasStart || !hasEnd || label.empty()) {
        cur.fail("entity without start/end/label");
    }
    if (mapLabel(label, span.label)) {
        out.push_back(span);
    } else {
        util::logger::debug("NerResponseParser: ignoring label " + label);
    }
}

} // namespace detail

/**
 * @brief Parse the "entities" array of a NER response.
 * @throw util::CapabilityUnavailableError if the body is malformed or has no
 *        "entities" array.
 */
inline std::vector<detection::NerSpan> parseNerResponse(const std::string &body)
{
    std::vector<detection::NerSpan> spans;
    bool sawEntities = false;

    detail::JsonCursor cur(body);
    cur.expect('{');
    if (!cur.consume('}')) {
        do {
            std::string key = cur.readString();
            cur.expect(':');
            if (key == "entities") {
                sawEntities = true;
                cur.expect('[');
                if (!cur.consume(']')) {
                    do {
                        detail::readEntity(cur, spans);
                    } while (cur.consume(','));
                    cur.expect(']');
                }
            } else {
                cur.skipValue(1);
            }
        } while (cur.consume(','));
        cur.expect('}');
    }
    if (!cur.atEnd()) {
        cur.fail("trailing characters");
    }
    if (!sawEntities) {
        cur.fail("missing \"entities\" array");
    }
    return spans;
}

/**
 * @brief The "model" field of a health or NER response, or "unknown".
 *        A malformed body also yields "unknown".
 */
inline std::string parseModelName(const std::string &body)
{
    try {
        detail::JsonCursor cur(body);
        cur.expect('{');
        if (cur.consume('}')) {
            return "unknown";
        }
        do {
            std::string key = cur.readString();
            cur.expect(':');
            if (key == "model" && cur.peek() == '"') {
                return cur.readString();
            }
            cur.skipValue(1);
        } while (cur.consume(','));
    }
    catch (const util::CapabilityUnavailableError &ex) {
        util::logger::debug(std::string("NerResponseParser: no model name: ") + ex.what());
    }
    return "unknown";
}

} // namespace connectors
} // namespace phiscrub

#endif // PHISCRUB_CONNECTORS_NER_RESPONSE_PARSER_HPP
