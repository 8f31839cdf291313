/**
 * @file Scanner.hpp
 * @brief Key locator and value-span scanner for JSONC text
 *
 * Both algorithms work on raw document bytes and never build a tree, so
 * comments and formatting outside the scanned span are never touched.
 *
 * Lexical rules shared by every scan in this module:
 * - A '"' opens a string; inside it a backslash escapes exactly the next
 *   character, so \" never closes the string and \\ never leaves escape
 *   state stuck on.
 * - Outside strings, "//" starts a comment running to the end of the line
 *   and "/ *" (without the space) starts a comment running to the next "* /".
 * - Brackets inside strings or comments are never structural.
 */

#ifndef JPATCH_SCANNER_HPP
#define JPATCH_SCANNER_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Half-open byte interval [start, end) over a document
 */
struct ByteRange {
    std::size_t start = 0;
    std::size_t end = 0;

    std::size_t size() const noexcept { return end - start; }
    bool empty() const noexcept { return end == start; }
};

/**
 * @brief Kind of JSON value, dispatched on its first character
 */
enum class ValueKind {
    Array,
    Object,
    String,
    Bare // number, boolean, null or another unquoted token
};

/**
 * @brief Transient automaton state for one bracketed-value scan
 */
struct ScanState {
    bool in_string = false;
    bool escape_next = false;
    int depth = 0;
    char open_char = '[';
    char close_char = ']';
};

/**
 * @brief Where a key declaration sits in a document
 *
 * key_start is the offset of the opening quote of the key name,
 * value_start the offset of the first significant character after the
 * colon (whitespace and comments skipped).
 */
struct KeyLocation {
    std::size_t key_start = 0;
    std::size_t value_start = 0;
};

/**
 * @brief Classify a value by its first character
 * @return The kind, or nullopt if @p first cannot start a value
 *         (',', ':', '}', ']', whitespace, '/').
 */
std::optional<ValueKind> classify_value(char first);

/**
 * @brief Skip whitespace and comments starting at @p pos
 * @return Offset of the next significant character, or doc.size()
 */
std::size_t skip_insignificant(const std::string& doc, std::size_t pos);

/**
 * @brief Skip one string literal
 * @param pos Offset of the opening quote
 * @return Offset one past the closing quote, or nullopt if unterminated
 */
std::optional<std::size_t> skip_string(const std::string& doc, std::size_t pos);

/**
 * @brief Find where the value starting at @p value_start ends
 *
 * - '[' / '{': counts depth of the same bracket pair only, ignoring
 *   brackets inside strings and comments; returns the offset after the
 *   bracket that brings depth back to zero.
 * - '"': returns the offset after the closing unescaped quote.
 * - anything else: a bare token ending at ',', '}', ']', a line break or
 *   a comment, with trailing blanks excluded.
 *
 * @return End offset (always greater than @p value_start), or nullopt for
 *         an unterminated string or bracket, or when no value starts at
 *         @p value_start.
 */
std::optional<std::size_t> scan_value_end(const std::string& doc,
                                          std::size_t value_start);

/**
 * @brief Locate every declaration of @p key among the root object's members
 *
 * Only members of the top-level object are considered; a matching string
 * in value position, inside a comment or in a nested object never counts.
 * Keys are compared after decoding JSON escapes in the document text.
 */
std::vector<KeyLocation> locate_all_keys(const std::string& doc,
                                         const std::string& key);

/**
 * @brief Locate the first declaration of @p key in the root object
 * @return The location, or nullopt if the key is absent
 */
std::optional<KeyLocation> locate_key(const std::string& doc,
                                      const std::string& key);

/**
 * @brief Number of root-level declarations of @p key
 */
std::size_t count_key_occurrences(const std::string& doc,
                                  const std::string& key);

/**
 * @brief Span of the root object, from '{' to one past its '}'
 * @return nullopt if the document does not start with an object or the
 *         object is never closed
 */
std::optional<ByteRange> root_object_range(const std::string& doc);

/**
 * @brief Offset of the last significant character before @p limit
 *
 * Scans forward from the start of the document so that characters inside
 * comments are never reported.
 * @return The offset, or nullopt if only whitespace and comments precede
 *         @p limit
 */
std::optional<std::size_t> last_significant_before(const std::string& doc,
                                                   std::size_t limit);

} // namespace jpatch

#endif // JPATCH_SCANNER_HPP
