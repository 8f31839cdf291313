/**
 * @file Scanner.cpp
 * @brief Implementation of the key locator and value-span scanner
 */

#include "jpatch/Scanner.hpp"
#include "jpatch/Value.hpp"

#include <algorithm>

namespace jpatch {

namespace {
    bool is_space(char c) {
        return c == ' ' || c == '\t' || c == '\r' || c == '\n';
    }

    /**
     * @brief Whether the string token [begin, end) spells @p key
     *
     * Tokens without escapes compare raw; others are decoded first.
     */
    bool key_matches(const std::string& doc, std::size_t begin,
                     std::size_t end, const std::string& key) {
        const std::size_t length = end - begin - 2;
        if (doc.find('\\', begin + 1) >= end - 1) {
            return doc.compare(begin + 1, length, key) == 0;
        }
        try {
            const Value decoded = Value::parse(doc.substr(begin, end - begin));
            return decoded.is_string() && decoded.get_ref<const std::string&>() == key;
        } catch (const Value::parse_error&) {
            return false;
        }
    }

    /**
     * @brief Offset where the document content starts (after a UTF-8 BOM)
     */
    std::size_t document_start(const std::string& doc) {
        if (doc.size() >= 3 && doc.compare(0, 3, "\xEF\xBB\xBF") == 0) {
            return 3;
        }
        return 0;
    }

    /**
     * @brief If a comment starts at @p pos, return where it ends
     *
     * A line comment ends at (not after) its terminating newline, a block
     * comment one past its closing "*" "/". Unterminated comments run to
     * the end of the document.
     */
    std::optional<std::size_t> comment_end(const std::string& doc, std::size_t pos) {
        if (doc[pos] != '/' || pos + 1 >= doc.size()) {
            return std::nullopt;
        }
        if (doc[pos + 1] == '/') {
            auto nl = doc.find('\n', pos + 2);
            return nl == std::string::npos ? doc.size() : nl;
        }
        if (doc[pos + 1] == '*') {
            auto close = doc.find("*/", pos + 2);
            return close == std::string::npos ? doc.size() : close + 2;
        }
        return std::nullopt;
    }

    std::optional<std::size_t> scan_bracketed(const std::string& doc,
                                              std::size_t value_start,
                                              ValueKind kind) {
        ScanState st;
        st.open_char = doc[value_start];
        st.close_char = kind == ValueKind::Array ? ']' : '}';

        for (std::size_t i = value_start; i < doc.size(); ++i) {
            const char c = doc[i];
            if (st.escape_next) {
                st.escape_next = false;
                continue;
            }
            if (st.in_string) {
                if (c == '\\') {
                    st.escape_next = true;
                } else if (c == '"') {
                    st.in_string = false;
                }
                continue;
            }
            if (auto end = comment_end(doc, i)) {
                i = *end - 1;
                continue;
            }
            if (c == '"') {
                st.in_string = true;
            } else if (c == st.open_char) {
                ++st.depth;
            } else if (c == st.close_char) {
                if (--st.depth == 0) {
                    return i + 1;
                }
            }
        }
        return std::nullopt;
    }

    std::size_t scan_bare(const std::string& doc, std::size_t value_start) {
        std::size_t i = value_start;
        while (i < doc.size()) {
            const char c = doc[i];
            if (c == ',' || c == '}' || c == ']' || c == '\n' || c == '\r') {
                break;
            }
            if (c == '/' && i + 1 < doc.size() &&
                (doc[i + 1] == '/' || doc[i + 1] == '*')) {
                break;
            }
            ++i;
        }
        // The first character is never blank, so this stops above value_start
        while (i > value_start && (doc[i - 1] == ' ' || doc[i - 1] == '\t')) {
            --i;
        }
        return i;
    }
}

std::optional<ValueKind> classify_value(char first) {
    switch (first) {
        case '[': return ValueKind::Array;
        case '{': return ValueKind::Object;
        case '"': return ValueKind::String;
        case ',': case ':': case '}': case ']': case '/':
        case ' ': case '\t': case '\r': case '\n':
            return std::nullopt;
        default:
            return ValueKind::Bare;
    }
}

std::size_t skip_insignificant(const std::string& doc, std::size_t pos) {
    while (pos < doc.size()) {
        if (is_space(doc[pos])) {
            ++pos;
            continue;
        }
        auto end = comment_end(doc, pos);
        if (!end) {
            break;
        }
        pos = *end;
    }
    return std::min(pos, doc.size());
}

std::optional<std::size_t> skip_string(const std::string& doc, std::size_t pos) {
    bool escape_next = false;
    for (std::size_t i = pos + 1; i < doc.size(); ++i) {
        const char c = doc[i];
        if (escape_next) {
            escape_next = false;
        } else if (c == '\\') {
            escape_next = true;
        } else if (c == '"') {
            return i + 1;
        }
    }
    return std::nullopt;
}

std::optional<std::size_t> scan_value_end(const std::string& doc,
                                          std::size_t value_start) {
    if (value_start >= doc.size()) {
        return std::nullopt;
    }
    const auto kind = classify_value(doc[value_start]);
    if (!kind) {
        return std::nullopt;
    }

    switch (*kind) {
        case ValueKind::Array:
        case ValueKind::Object:
            return scan_bracketed(doc, value_start, *kind);
        case ValueKind::String:
            return skip_string(doc, value_start);
        case ValueKind::Bare:
            return scan_bare(doc, value_start);
    }
    return std::nullopt;
}

std::vector<KeyLocation> locate_all_keys(const std::string& doc,
                                         const std::string& key) {
    std::vector<KeyLocation> found;

    const std::size_t root = skip_insignificant(doc, document_start(doc));
    if (root >= doc.size() || doc[root] != '{') {
        return found;
    }

    // Depth 1 means "directly inside the root object"
    int depth = 0;
    std::size_t i = root;
    while (i < doc.size()) {
        if (auto end = comment_end(doc, i)) {
            i = *end;
            continue;
        }

        const char c = doc[i];
        if (c == '"') {
            auto end = skip_string(doc, i);
            if (!end) {
                break;
            }
            if (depth == 1) {
                const std::size_t after = skip_insignificant(doc, *end);
                if (after < doc.size() && doc[after] == ':' &&
                    key_matches(doc, i, *end, key)) {
                    found.push_back({i, skip_insignificant(doc, after + 1)});
                }
            }
            i = *end;
            continue;
        }

        if (c == '{' || c == '[') {
            ++depth;
        } else if (c == '}' || c == ']') {
            if (--depth == 0) {
                break;
            }
        }
        ++i;
    }
    return found;
}

std::optional<KeyLocation> locate_key(const std::string& doc,
                                      const std::string& key) {
    auto all = locate_all_keys(doc, key);
    if (all.empty()) {
        return std::nullopt;
    }
    return all.front();
}

std::size_t count_key_occurrences(const std::string& doc,
                                  const std::string& key) {
    return locate_all_keys(doc, key).size();
}

std::optional<ByteRange> root_object_range(const std::string& doc) {
    const std::size_t start = skip_insignificant(doc, document_start(doc));
    if (start >= doc.size() || doc[start] != '{') {
        return std::nullopt;
    }
    auto end = scan_value_end(doc, start);
    if (!end) {
        return std::nullopt;
    }
    return ByteRange{start, *end};
}

std::optional<std::size_t> last_significant_before(const std::string& doc,
                                                   std::size_t limit) {
    limit = std::min(limit, doc.size());
    std::optional<std::size_t> last;

    std::size_t i = document_start(doc);
    while (i < limit) {
        if (auto end = comment_end(doc, i)) {
            i = *end;
            continue;
        }
        const char c = doc[i];
        if (c == '"') {
            auto end = skip_string(doc, i);
            const std::size_t stop = end ? std::min(*end, limit) : limit;
            last = stop - 1;
            i = stop;
            continue;
        }
        if (!is_space(c)) {
            last = i;
        }
        ++i;
    }
    return last;
}

} // namespace jpatch
