/**
 * @file FileIO.hpp
 * @brief Reading and crash-safe replacement of the settings file
 */

#ifndef JPATCH_FILEIO_HPP
#define JPATCH_FILEIO_HPP

#include <optional>
#include <string>

namespace jpatch {

/**
 * @brief Read a whole file as bytes
 * @return File contents, or nullopt if the file does not exist
 * @throws FileReadError if the path exists but cannot be read
 */
std::optional<std::string> read_text_file(const std::string& path);

/**
 * @brief Replace a file's contents atomically
 *
 * Parent directories are created. The text goes to a sibling temporary
 * file which is then renamed over @p path, so readers see either the old
 * or the new contents, never a partial write.
 *
 * @throws FileWriteError on any failure; the temporary file is removed
 */
void atomic_write_file(const std::string& path, const std::string& text);

} // namespace jpatch

#endif // JPATCH_FILEIO_HPP
