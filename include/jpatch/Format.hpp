/**
 * @file Format.hpp
 * @brief Rendering of replacement values in the document's own style
 *
 * Style is inferred from the document rather than configured:
 * - indent unit: the leading whitespace of the first indented,
 *   non-blank line (four spaces if there is none)
 * - newline: "\r\n" if the first line break is CRLF, "\n" otherwise
 */

#ifndef JPATCH_FORMAT_HPP
#define JPATCH_FORMAT_HPP

#include "jpatch/Value.hpp"
#include <string>
#include <vector>

namespace jpatch {

/// Indent unit used when a document has no indented line.
inline const std::string kDefaultIndentUnit = "    ";

/**
 * @brief One element of an environment-variable array
 *
 * Rendered as {"name": ..., "value": ...}.
 */
struct EnvEntry {
    std::string name;
    std::string value;

    bool operator==(const EnvEntry& other) const {
        return name == other.name && value == other.value;
    }
};

/**
 * @brief Indentation and line-ending style of a document
 */
struct FormatStyle {
    std::string unit = kDefaultIndentUnit;
    std::string newline = "\n";
};

/**
 * @brief Infer the indent unit from the first indented, non-blank line
 */
std::string detect_indent_unit(const std::string& doc);

/**
 * @brief Infer the full rendering style of a document
 */
FormatStyle detect_style(const std::string& doc);

/**
 * @brief Leading blanks of the line containing @p pos
 *
 * Returns an empty string when anything other than spaces or tabs precedes
 * @p pos on its line.
 */
std::string line_indent_at(const std::string& doc, std::size_t pos);

/**
 * @brief Quote and escape a string as a JSON string literal
 *
 * Quotes, backslashes and control characters are escaped; invalid UTF-8
 * is replaced with U+FFFD rather than rejected.
 */
std::string escape_json_string(const std::string& s);

/**
 * @brief Render an environment-variable array
 *
 * An empty list renders as "[]". Otherwise one element per line, each
 * indented one unit deeper than @p indent, the closing bracket at
 * @p indent:
 * ```
 * [
 *     { "name": "A", "value": "1" },
 *     { "name": "B", "value": "2" }
 * ]
 * ```
 *
 * @param entries Name/value pairs in output order
 * @param indent Indentation of the line the value starts on
 * @param style Unit and newline to render with
 */
std::string format_value(const std::vector<EnvEntry>& entries,
                         const std::string& indent,
                         const FormatStyle& style = FormatStyle{});

/**
 * @brief Render an arbitrary JSON value in the same pretty style
 *
 * Scalars render as compact JSON, empty containers as "[]" / "{}", other
 * containers one member per line.
 */
std::string format_json(const Value& value,
                        const std::string& indent,
                        const FormatStyle& style = FormatStyle{});

} // namespace jpatch

#endif // JPATCH_FORMAT_HPP
