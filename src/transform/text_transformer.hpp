#ifndef PHISCRUB_TRANSFORM_TEXT_TRANSFORMER_HPP
#define PHISCRUB_TRANSFORM_TEXT_TRANSFORMER_HPP

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

#include "core/entity.hpp"
#include "util/errors.hpp"
#include "util/hashing.hpp"
#include "util/utf8.hpp"

/**
 * @file text_transformer.hpp
 * @brief Rewrites a text from a disjoint entity set.
 *
 * DESIGN GOALS:
 *   - Entities are applied in descending order of start. Each splice only
 *     touches text to the right of every entity still pending, so the stored
 *     offsets of pending entities stay valid without adjustment.
 *   - The input text is never modified; a new string is returned.
 *   - Offsets are codepoints; they are mapped to bytes once per call.
 *
 * Per-action replacement:
 *   REDACT    "[REDACTED]"
 *   MASK      first codepoint + '*' x (n-2) + last codepoint; n <= 2 gives n '*'
 *   HASH      first 16 hex chars of SHA-256 over the span's UTF-8 bytes
 *   TOKENIZE  "[<ENTITY_TYPE>]"
 *   KEEP      "" (the span is removed)
 *
 * A zero-length span, a span past the end of the text, two overlapping spans
 * or an action outside the enumeration raise TransformError.
 */

namespace phiscrub {
namespace transform {

static const char* const kRedactionMarker = "[REDACTED]";
static const std::size_t kHashHexChars = 16;

class TextTransformer
{
public:
    /**
     * @brief The replacement for one entity of @p text.
     * @throw util::TransformError for an action outside the enumeration.
     */
    static std::string replacementFor(const std::string &text,
                                      const util::utf8::CodepointIndex &index,
                                      const core::Entity &entity)
    {
        switch (entity.action) {
        case core::Action::REDACT:
            return kRedactionMarker;
        case core::Action::MASK:
            return mask(util::utf8::substr(text, index, entity.start, entity.end));
        case core::Action::HASH:
            return util::hashing::sha256HexPrefix(
                util::utf8::substr(text, index, entity.start, entity.end), kHashHexChars);
        case core::Action::TOKENIZE:
            return std::string("[") + core::toString(entity.type) + "]";
        case core::Action::KEEP:
            // Removes the span, it does not leave it in place. See DESIGN.md.
            return std::string();
        }
        throw util::TransformError("entity " + entity.id + " carries unknown action value "
                                   + std::to_string(static_cast<int>(entity.action)));
    }

    /**
     * @brief Rewrite @p text. @p reversible is accepted for forward
     *        compatibility and has no effect.
     * @throw util::TransformError if an entity is invalid (see file comment).
     */
    static std::string transform(const std::string &text,
                                 const std::vector<core::Entity> &entities,
                                 bool reversible = false)
    {
        std::vector<core::Entity> copy(entities);
        return apply(text, copy, reversible);
    }

    /**
     * @brief Like transform(), and also records each entity's replacement in
     *        its `replacement` field.
     */
    static std::string apply(const std::string &text,
                             std::vector<core::Entity> &entities,
                             bool reversible = false)
    {
        (void)reversible;
        if (entities.empty()) {
            return text;
        }

        const util::utf8::CodepointIndex index(text);

        std::vector<core::Entity*> order;
        order.reserve(entities.size());
        for (auto &entity : entities) {
            validateSpan(entity, index.size());
            order.push_back(&entity);
        }
        std::sort(order.begin(), order.end(),
                  [](const core::Entity *a, const core::Entity *b) { return a->start > b->start; });
        for (std::size_t i = 1; i < order.size(); ++i) {
            if (order[i]->end > order[i - 1]->start) {
                throw util::TransformError("entities " + order[i]->id + " and "
                                           + order[i - 1]->id + " overlap");
            }
        }

        std::string result(text);
        for (core::Entity *entity : order) {
            entity->replacement = replacementFor(text, index, *entity);
            const std::size_t b0 = index.toByte(entity->start);
            const std::size_t b1 = index.toByte(entity->end);
            result.replace(b0, b1 - b0, entity->replacement);
        }
        return result;
    }

private:
    static void validateSpan(const core::Entity &entity, std::size_t textLength)
    {
        if (entity.start >= entity.end) {
            throw util::TransformError("entity " + entity.id + " has an empty span at "
                                       + std::to_string(entity.start));
        }
        if (entity.end > textLength) {
            throw util::TransformError("entity " + entity.id + " ends at "
                                       + std::to_string(entity.end) + " past text length "
                                       + std::to_string(textLength));
        }
    }

    static std::string mask(const std::string &value)
    {
        const std::vector<std::string> cps = util::utf8::codepoints(value);
        if (cps.size() <= 2) {
            return std::string(cps.size(), '*');
        }
        return cps.front() + std::string(cps.size() - 2, '*') + cps.back();
    }
};

} // namespace transform
} // namespace phiscrub

#endif // PHISCRUB_TRANSFORM_TEXT_TRANSFORMER_HPP
