#ifndef JPATCH_UTIL_HPP
#define JPATCH_UTIL_HPP

#include <string>
#include <utility>
#include <vector>

namespace jpatch {

// Helpers
std::string to_lower(std::string s);
std::string trim(const std::string& s);

// Case-insensitive prefix test.
bool starts_with_icase(const std::string& text, const std::string& prefix);

// Environment iteration: returns pairs (NAME, VALUE)
std::vector<std::pair<std::string, std::string>> enumerate_environment();

} // namespace jpatch

#endif // JPATCH_UTIL_HPP
