/**
 * @file EnvArray.hpp
 * @brief Sources of environment-variable entries
 *
 * Turns a flat {"NAME": "VALUE"} object, the process environment or
 * NAME=VALUE assignments into the EnvEntry list that sync() renders.
 * Every function returns entries sorted by name with unique names.
 */

#ifndef JPATCH_ENVARRAY_HPP
#define JPATCH_ENVARRAY_HPP

#include "jpatch/Format.hpp"
#include "jpatch/Value.hpp"

#include <string>
#include <vector>

namespace jpatch {

/**
 * @brief Convert a flat object into entries
 *
 * String values are taken as-is, null becomes "", other scalars and
 * containers become their compact JSON text. Non-object input yields an
 * empty list.
 *
 * Example:
 * ```cpp
 * env_to_entries({{"B", "2"}, {"A", 1}});
 * // -> [{A, "1"}, {B, "2"}]
 * ```
 */
std::vector<EnvEntry> env_to_entries(const Value& env);

/**
 * @brief Parse JSONC text holding a flat object into entries
 * @throws InvalidEnvError if the text does not parse to an object
 */
std::vector<EnvEntry> env_from_text(const std::string& text);

/**
 * @brief Parse a NAME=VALUE assignment
 *
 * Splits at the first '='; the value may be empty or contain '='.
 * @throws InvalidEnvError if there is no '=' or the name is blank
 */
EnvEntry parse_assignment(const std::string& assignment);

/**
 * @brief Collect process environment variables whose name starts with
 *        @p prefix (case-insensitive)
 *
 * Names are kept whole, prefix included. An empty prefix is rejected so
 * that the whole environment is never copied by accident.
 * @throws InvalidEnvError if @p prefix is empty
 */
std::vector<EnvEntry> collect_env_vars(const std::string& prefix);

/**
 * @brief Merge entry lists; later lists win on equal names
 */
std::vector<EnvEntry> merge_entries(const std::vector<std::vector<EnvEntry>>& sources);

} // namespace jpatch

#endif // JPATCH_ENVARRAY_HPP
