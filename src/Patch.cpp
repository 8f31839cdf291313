/**
 * @file Patch.cpp
 * @brief Implementation of replace / insert / remove
 */

#include "jpatch/Patch.hpp"
#include "jpatch/Format.hpp"

namespace jpatch {

namespace {
    bool is_blank(char c) {
        return c == ' ' || c == '\t';
    }

    std::string render_member(const std::string& key, const std::string& rendered) {
        return escape_json_string(key) + ": " + rendered;
    }

    /**
     * @brief Offset of the line break ending the line at @p pos, if only
     *        blanks lie in between
     */
    std::optional<std::size_t> line_break_after(const std::string& doc,
                                                std::size_t pos) {
        while (pos < doc.size() && is_blank(doc[pos])) {
            ++pos;
        }
        if (pos >= doc.size() || doc[pos] == '\n' ||
            (doc[pos] == '\r' && pos + 1 < doc.size() && doc[pos + 1] == '\n')) {
            return pos;
        }
        return std::nullopt;
    }

    bool is_line_break_at(const std::string& doc, std::size_t pos) {
        return pos >= doc.size() || doc[pos] == '\n' || doc[pos] == '\r';
    }

    /**
     * @brief Strip a comma left between the last member and a closing bracket
     * @param pos Where the removed text used to be
     */
    void strip_dangling_comma(std::string& doc, std::size_t pos) {
        const std::size_t next = skip_insignificant(doc, pos);
        if (next >= doc.size() || (doc[next] != '}' && doc[next] != ']')) {
            return;
        }
        const auto prev = last_significant_before(doc, pos);
        if (!prev || doc[*prev] != ',') {
            return;
        }
        std::size_t stop = *prev + 1;
        while (stop < pos && is_blank(doc[stop])) {
            ++stop;
        }
        if (stop != pos) {
            stop = *prev + 1;
        }
        doc.erase(*prev, stop - *prev);
    }
}

std::string apply_replace(const std::string& doc,
                          const ByteRange& value_range,
                          const std::string& rendered) {
    std::string out;
    out.reserve(doc.size() - value_range.size() + rendered.size());
    out.append(doc, 0, value_range.start);
    out += rendered;
    out.append(doc, value_range.end, std::string::npos);
    return out;
}

std::string synthesize_document(const std::string& key,
                                const std::string& rendered,
                                const std::string& indent,
                                const std::string& newline) {
    return "{" + newline + indent + render_member(key, rendered) + newline +
           "}" + newline;
}

std::string apply_insert(const std::string& doc,
                         const std::string& key,
                         const std::string& rendered,
                         const std::string& indent,
                         const std::string& newline) {
    const auto root = root_object_range(doc);
    if (!root) {
        return synthesize_document(key, rendered, indent, newline);
    }

    const std::size_t close = root->end - 1;
    // The root's own '{' is significant, so an anchor always exists
    const std::size_t anchor = last_significant_before(doc, close).value_or(root->start);
    const bool needs_comma = doc[anchor] != '{' && doc[anchor] != ',';

    std::size_t line_start = close;
    while (line_start > anchor + 1 && is_blank(doc[line_start - 1])) {
        --line_start;
    }
    const bool brace_on_own_line = line_start > anchor + 1 && doc[line_start - 1] == '\n';

    const std::string member = indent + render_member(key, rendered);

    std::string out;
    out.reserve(doc.size() + member.size() + 2 * newline.size() + 1);
    out.append(doc, 0, anchor + 1);
    if (needs_comma) {
        out += ',';
    }
    if (brace_on_own_line) {
        out.append(doc, anchor + 1, line_start - anchor - 1);
        out += member;
        out += newline;
        out.append(doc, line_start, std::string::npos);
    } else {
        std::size_t gap_end = close;
        while (gap_end > anchor + 1 && is_blank(doc[gap_end - 1])) {
            --gap_end;
        }
        out.append(doc, anchor + 1, gap_end - anchor - 1);
        out += newline;
        out += member;
        out += newline;
        out.append(doc, close, std::string::npos);
    }
    return out;
}

std::string apply_remove(const std::string& doc,
                         const ByteRange& key_range,
                         const ByteRange& value_range) {
    const std::size_t key_start = key_range.start;
    const std::size_t value_end = value_range.end;

    // Own trailing comma, possibly behind comments. Comments between the
    // value and the comma are kept; the comma itself goes.
    std::string kept;
    bool kept_spans_lines = false;
    std::size_t tail = value_end;
    const std::size_t comma = skip_insignificant(doc, value_end);
    if (comma < doc.size() && doc[comma] == ',') {
        kept = doc.substr(value_end, comma - value_end);
        kept_spans_lines = kept.find('\n') != std::string::npos;
        const auto first = kept.find_first_not_of(" \t\r\n");
        if (first == std::string::npos) {
            kept.clear();
        } else {
            const auto last = kept.find_last_not_of(" \t\r\n");
            kept = kept.substr(first, last - first + 1);
        }
        tail = comma + 1;
    }

    std::size_t line_start = key_start;
    while (line_start > 0 && is_blank(doc[line_start - 1])) {
        --line_start;
    }
    const bool owns_line = line_start == 0 || doc[line_start - 1] == '\n';

    std::size_t rest = tail;
    while (rest < doc.size() && is_blank(doc[rest])) {
        ++rest;
    }

    std::size_t start = key_start;
    std::size_t end = rest;
    if (owns_line && kept.empty()) {
        if (auto brk = line_break_after(doc, tail)) {
            // The whole line goes, including its line break
            start = line_start;
            end = *brk;
            if (end < doc.size()) {
                end += doc[end] == '\r' ? 2 : 1;
            }
        } else if (rest < doc.size() && (doc[rest] == '}' || doc[rest] == ']')) {
            start = line_start;
        }
    }

    std::string out;
    out.reserve(doc.size() + 1);
    out.append(doc, 0, start);
    out += kept;
    if (!kept.empty() && !is_line_break_at(doc, end)) {
        // A line comment in the kept text must not swallow what follows
        if (kept_spans_lines) {
            out += doc.find("\r\n", value_end) < comma ? "\r\n" : "\n";
            out.append(doc, line_start, key_start - line_start);
        } else {
            out += ' ';
        }
    }
    out.append(doc, end, std::string::npos);
    strip_dangling_comma(out, start);
    return out;
}

} // namespace jpatch
