/**
 * @file Errors.hpp
 * @brief Exception types for jsonc-patch
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - MalformedValueError: Target key exists but its value never closes
 * - DuplicateKeyError: Target key declared more than once (Reject policy)
 * - FileNotFoundError: Settings file not found
 * - FileReadError / FileWriteError: I/O failures in the file layer
 * - PathResolutionError: Default settings location cannot be derived
 * - InvalidEnvError: Environment source is not a flat object
 *
 * The text-level core never throws for malformed input; it returns
 * std::optional failure indicators which the orchestration layer turns
 * into these exceptions.
 */

#ifndef JPATCH_ERRORS_HPP
#define JPATCH_ERRORS_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace jpatch {

/**
 * @brief Base class for all jsonc-patch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The value of an existing key is not syntactically closed
 *
 * Raised for unterminated strings, arrays or objects. The document is
 * left untouched.
 */
class MalformedValueError : public PatchError {
public:
    /**
     * @brief Construct with key name and value offset
     * @param key Key whose value could not be scanned
     * @param offset Byte offset of the value's first character
     */
    MalformedValueError(std::string key, std::size_t offset)
        : PatchError("Malformed value for key '" + key + "' at offset " +
                     std::to_string(offset))
        , key_(std::move(key))
        , offset_(offset)
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    std::size_t offset() const noexcept {
        return offset_;
    }

private:
    std::string key_;
    std::size_t offset_;
};

/**
 * @brief The target key is declared more than once at the document root
 */
class DuplicateKeyError : public PatchError {
public:
    DuplicateKeyError(std::string key, std::size_t count)
        : PatchError("Key '" + key + "' is declared " + std::to_string(count) +
                     " times")
        , key_(std::move(key))
        , count_(count)
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    std::size_t count() const noexcept {
        return count_;
    }

private:
    std::string key_;
    std::size_t count_;
};

/**
 * @brief Settings file not found
 */
class FileNotFoundError : public PatchError {
public:
    explicit FileNotFoundError(std::string path)
        : PatchError("Settings file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Settings file could not be read
 */
class FileReadError : public PatchError {
public:
    FileReadError(std::string path, std::string details)
        : PatchError("Cannot read '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief Settings file could not be written or replaced
 */
class FileWriteError : public PatchError {
public:
    FileWriteError(std::string path, std::string details)
        : PatchError("Cannot write '" + path + "': " + details)
        , path_(std::move(path))
        , details_(std::move(details))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string path_;
    std::string details_;
};

/**
 * @brief No override given and the platform default cannot be derived
 */
class PathResolutionError : public PatchError {
public:
    using PatchError::PatchError;
};

/**
 * @brief Environment source is not a flat JSON object
 */
class InvalidEnvError : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace jpatch

#endif // JPATCH_ERRORS_HPP
