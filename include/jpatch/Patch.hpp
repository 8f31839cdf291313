/**
 * @file Patch.hpp
 * @brief Text-level document transformations
 *
 * Every function takes a document and returns a new one; text outside the
 * edited region is copied byte-for-byte.
 */

#ifndef JPATCH_PATCH_HPP
#define JPATCH_PATCH_HPP

#include "jpatch/Scanner.hpp"
#include <string>

namespace jpatch {

/**
 * @brief Replace the value at @p value_range with @p rendered
 */
std::string apply_replace(const std::string& doc,
                          const ByteRange& value_range,
                          const std::string& rendered);

/**
 * @brief Insert a new member as the last entry of the root object
 *
 * A comma is added after the current last member unless the object is
 * empty or already ends with one. The member goes on its own line before
 * the closing brace. A document without a closed root object is replaced
 * by a minimal object holding only the new member.
 *
 * @param doc Document text
 * @param key Key name (escaped on output)
 * @param rendered Value text, rendered for indentation @p indent
 * @param indent Indentation of the new member line
 * @param newline Line break to use
 */
std::string apply_insert(const std::string& doc,
                         const std::string& key,
                         const std::string& rendered,
                         const std::string& indent,
                         const std::string& newline = "\n");

/**
 * @brief Remove a member and tidy the surrounding punctuation
 *
 * The removal span is widened over the member's own trailing comma, and
 * over the whole line when the member sits alone on it. Comments between
 * the value and its comma, and a line comment after it, stay in place. A
 * comma left dangling before the closing bracket is stripped.
 *
 * @param key_range From the key's opening quote to the value start
 * @param value_range Span of the value
 */
std::string apply_remove(const std::string& doc,
                         const ByteRange& key_range,
                         const ByteRange& value_range);

/**
 * @brief A fresh document holding a single member
 */
std::string synthesize_document(const std::string& key,
                                const std::string& rendered,
                                const std::string& indent,
                                const std::string& newline = "\n");

} // namespace jpatch

#endif // JPATCH_PATCH_HPP
