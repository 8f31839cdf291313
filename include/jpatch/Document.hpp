/**
 * @file Document.hpp
 * @brief Orchestration of locate / scan / format / patch
 *
 * sync() writes a value at a root-level key, clear() removes it. Both are
 * pure functions over in-memory text: file access belongs to FileIO.hpp.
 *
 * Decision table for sync():
 * - key present, value scans      -> replace the value span
 * - key present, value malformed  -> MalformedValueError, nothing changed
 * - key absent, root object found -> insert as last member
 * - no closed root object         -> fresh document with only this key
 */

#ifndef JPATCH_DOCUMENT_HPP
#define JPATCH_DOCUMENT_HPP

#include "jpatch/Format.hpp"
#include "jpatch/Value.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace jpatch {

/// Key holding the VS Code Claude extension's environment variables.
inline const std::string kDefaultKey = "claudeCode.environmentVariables";

/**
 * @brief What to do when the target key is declared more than once
 */
enum class DuplicatePolicy {
    FirstMatch, // act on the first declaration, leave the others
    Reject      // throw DuplicateKeyError
};

/**
 * @brief Options for sync() and clear()
 */
struct SyncOptions {
    std::string key = kDefaultKey;
    DuplicatePolicy on_duplicate = DuplicatePolicy::FirstMatch;
};

/**
 * @brief How a document was changed
 */
enum class PatchAction {
    Replaced,  // existing value rewritten
    Inserted,  // new member appended to the root object
    Created,   // document had no usable root object and was rebuilt
    Removed,   // member deleted
    Unchanged  // output is byte-identical to input
};

/**
 * @brief Output of sync() / clear()
 */
struct PatchResult {
    std::string text;
    PatchAction action = PatchAction::Unchanged;

    bool changed() const noexcept { return action != PatchAction::Unchanged; }
};

/**
 * @brief Human-readable name of a PatchAction
 */
std::string action_name(PatchAction action);

/**
 * @brief Write an environment-variable array at options.key
 * @throws MalformedValueError if the existing value never closes
 * @throws DuplicateKeyError under DuplicatePolicy::Reject
 */
PatchResult sync(const std::string& doc,
                 const std::vector<EnvEntry>& entries,
                 const SyncOptions& options = SyncOptions{});

/**
 * @brief Write an arbitrary JSON value at options.key
 * @throws MalformedValueError if the existing value never closes
 * @throws DuplicateKeyError under DuplicatePolicy::Reject
 */
PatchResult sync_value(const std::string& doc,
                       const Value& value,
                       const SyncOptions& options = SyncOptions{});

/**
 * @brief Remove options.key; returns the document unchanged if absent
 * @throws MalformedValueError if the existing value never closes
 * @throws DuplicateKeyError under DuplicatePolicy::Reject
 */
PatchResult clear(const std::string& doc,
                  const SyncOptions& options = SyncOptions{});

/**
 * @brief Document that parsed (comments ignored)
 */
struct Structured {
    Value value;
};

/**
 * @brief Document that did not parse, kept verbatim
 */
struct RawText {
    std::string text;
    std::string error;
};

using ParsedDocument = std::variant<Structured, RawText>;

/**
 * @brief Parse a JSONC document for reading
 *
 * Comments are ignored. A blank document reads as an empty object. Text
 * that still fails to parse is returned as RawText with the parser
 * message; it is never replaced by a default.
 */
ParsedDocument read_structured(const std::string& doc);

/**
 * @brief Read the value of options.key without parsing the whole document
 * @return The parsed value, or nullopt if the key is absent
 * @throws MalformedValueError if the value does not scan or parse
 */
std::optional<Value> read_key(const std::string& doc,
                              const SyncOptions& options = SyncOptions{});

} // namespace jpatch

#endif // JPATCH_DOCUMENT_HPP
