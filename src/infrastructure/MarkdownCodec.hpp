/**
 * @file MarkdownCodec.hpp
 * @brief Canonical markdown encoding of a ScratchpadDocument.
 */

#pragma once
#include <string>
#include "domain/ScratchpadDocument.hpp"

namespace scratchpad::infrastructure {

/**
 * @class MarkdownCodec
 * @brief Static utility converting between ScratchpadDocument and its on-disk markdown.
 *
 * Parse(Serialize(doc)) == doc for every document. Statistics are rendered from live
 * counts and ignored on parse.
 */
class MarkdownCodec {
public:
    static std::string Serialize(const domain::ScratchpadDocument& doc);

    /**
     * @brief Parses scratchpad markdown.
     * @throws domain::ScratchpadError InvalidFormat when a section is missing, a row is
     *         malformed or the format version is newer than this build understands.
     */
    static domain::ScratchpadDocument Parse(const std::string& markdown);

    /** @brief Backslash-escapes `\`, `|`, `_` and encodes CR/LF so text fits in one table cell. */
    static std::string EscapeText(const std::string& text);

    /** @brief Inverse of EscapeText. */
    static std::string UnescapeText(const std::string& text);
};

} // namespace scratchpad::infrastructure
