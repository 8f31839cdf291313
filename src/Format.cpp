/**
 * @file Format.cpp
 * @brief Implementation of value rendering and style detection
 */

#include "jpatch/Format.hpp"

#include <sstream>

namespace jpatch {

namespace {
    bool is_blank(char c) {
        return c == ' ' || c == '\t';
    }
}

std::string detect_indent_unit(const std::string& doc) {
    std::istringstream iss(doc);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos || first == 0) {
            continue;
        }
        return line.substr(0, first);
    }
    return kDefaultIndentUnit;
}

FormatStyle detect_style(const std::string& doc) {
    FormatStyle style;
    style.unit = detect_indent_unit(doc);
    const auto nl = doc.find('\n');
    if (nl != std::string::npos && nl > 0 && doc[nl - 1] == '\r') {
        style.newline = "\r\n";
    }
    return style;
}

std::string line_indent_at(const std::string& doc, std::size_t pos) {
    std::size_t begin = pos;
    while (begin > 0 && is_blank(doc[begin - 1])) {
        --begin;
    }
    if (begin > 0 && doc[begin - 1] != '\n') {
        return "";
    }
    return doc.substr(begin, pos - begin);
}

std::string escape_json_string(const std::string& s) {
    return Value(s).dump(-1, ' ', false, Value::error_handler_t::replace);
}

std::string format_value(const std::vector<EnvEntry>& entries,
                         const std::string& indent,
                         const FormatStyle& style) {
    if (entries.empty()) {
        return "[]";
    }

    const std::string inner = indent + style.unit;
    std::ostringstream oss;
    oss << '[' << style.newline;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        oss << inner
            << "{ \"name\": " << escape_json_string(entries[i].name)
            << ", \"value\": " << escape_json_string(entries[i].value) << " }";
        if (i + 1 < entries.size()) oss << ',';
        oss << style.newline;
    }
    oss << indent << ']';
    return oss.str();
}

std::string format_json(const Value& value,
                        const std::string& indent,
                        const FormatStyle& style) {
    if (value.is_array()) {
        if (value.empty()) return "[]";
        const std::string inner = indent + style.unit;
        std::string out = "[" + style.newline;
        for (std::size_t i = 0; i < value.size(); ++i) {
            out += inner + format_json(value[i], inner, style);
            if (i + 1 < value.size()) out += ",";
            out += style.newline;
        }
        return out + indent + "]";
    }

    if (value.is_object()) {
        if (value.empty()) return "{}";
        const std::string inner = indent + style.unit;
        std::string out = "{" + style.newline;
        std::size_t i = 0;
        for (auto it = value.begin(); it != value.end(); ++it, ++i) {
            out += inner + escape_json_string(it.key()) + ": " +
                   format_json(it.value(), inner, style);
            if (i + 1 < value.size()) out += ",";
            out += style.newline;
        }
        return out + indent + "}";
    }

    return value.dump(-1, ' ', false, Value::error_handler_t::replace);
}

} // namespace jpatch
