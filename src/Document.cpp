/**
 * @file Document.cpp
 * @brief Implementation of sync / clear / structured reads
 */

#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/Scanner.hpp"

#include <functional>

namespace jpatch {

namespace {
    /**
     * @brief A located key together with its scanned value span
     */
    struct Target {
        KeyLocation location;
        ByteRange value;
    };

    using Renderer = std::function<std::string(const std::string& indent,
                                               const FormatStyle& style)>;

    std::optional<Target> find_target(const std::string& doc,
                                      const SyncOptions& options) {
        const auto all = locate_all_keys(doc, options.key);
        if (all.empty()) {
            return std::nullopt;
        }
        if (all.size() > 1 && options.on_duplicate == DuplicatePolicy::Reject) {
            throw DuplicateKeyError(options.key, all.size());
        }

        const KeyLocation& loc = all.front();
        const auto end = scan_value_end(doc, loc.value_start);
        if (!end) {
            throw MalformedValueError(options.key, loc.value_start);
        }
        return Target{loc, ByteRange{loc.value_start, *end}};
    }

    PatchResult write_rendered(const std::string& doc,
                               const SyncOptions& options,
                               const Renderer& render) {
        const FormatStyle style = detect_style(doc);

        if (const auto target = find_target(doc, options)) {
            const std::string indent = line_indent_at(doc, target->location.key_start);
            const std::string rendered = render(indent, style);
            if (doc.compare(target->value.start, target->value.size(), rendered) == 0) {
                return {doc, PatchAction::Unchanged};
            }
            return {apply_replace(doc, target->value, rendered), PatchAction::Replaced};
        }

        const std::string rendered = render(style.unit, style);
        const PatchAction action = root_object_range(doc) ? PatchAction::Inserted
                                                          : PatchAction::Created;
        return {apply_insert(doc, options.key, rendered, style.unit, style.newline), action};
    }
}

std::string action_name(PatchAction action) {
    switch (action) {
        case PatchAction::Replaced: return "replaced";
        case PatchAction::Inserted: return "inserted";
        case PatchAction::Created: return "created";
        case PatchAction::Removed: return "removed";
        case PatchAction::Unchanged: return "unchanged";
    }
    return "unknown";
}

PatchResult sync(const std::string& doc,
                 const std::vector<EnvEntry>& entries,
                 const SyncOptions& options) {
    return write_rendered(doc, options,
        [&entries](const std::string& indent, const FormatStyle& style) {
            return format_value(entries, indent, style);
        });
}

PatchResult sync_value(const std::string& doc,
                       const Value& value,
                       const SyncOptions& options) {
    return write_rendered(doc, options,
        [&value](const std::string& indent, const FormatStyle& style) {
            return format_json(value, indent, style);
        });
}

PatchResult clear(const std::string& doc, const SyncOptions& options) {
    const auto target = find_target(doc, options);
    if (!target) {
        return {doc, PatchAction::Unchanged};
    }
    const ByteRange key_range{target->location.key_start, target->location.value_start};
    return {apply_remove(doc, key_range, target->value), PatchAction::Removed};
}

ParsedDocument read_structured(const std::string& doc) {
    if (skip_insignificant(doc, 0) >= doc.size()) {
        return Structured{Value::object()};
    }
    try {
        return Structured{Value::parse(doc, nullptr, true, true)};
    } catch (const Value::parse_error& e) {
        return RawText{doc, e.what()};
    }
}

std::optional<Value> read_key(const std::string& doc, const SyncOptions& options) {
    const auto target = find_target(doc, options);
    if (!target) {
        return std::nullopt;
    }
    const std::string text = doc.substr(target->value.start, target->value.size());
    try {
        return Value::parse(text, nullptr, true, true);
    } catch (const Value::parse_error&) {
        throw MalformedValueError(options.key, target->value.start);
    }
}

} // namespace jpatch
