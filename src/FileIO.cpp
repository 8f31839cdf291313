/**
 * @file FileIO.cpp
 * @brief Implementation of file reading and atomic replacement
 */

#include "jpatch/FileIO.hpp"
#include "jpatch/Errors.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace jpatch {

std::optional<std::string> read_text_file(const std::string& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) {
            throw FileReadError(path, ec.message());
        }
        return std::nullopt;
    }
    if (!fs::is_regular_file(path, ec)) {
        throw FileReadError(path, "not a regular file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileReadError(path, "cannot open file");
    }
    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        throw FileReadError(path, "read failed");
    }
    return buffer.str();
}

void atomic_write_file(const std::string& path, const std::string& text) {
    const fs::path target(path);
    std::error_code ec;

    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw FileWriteError(path, "cannot create parent directory: " + ec.message());
        }
    }

    fs::path tmp = target;
    tmp += ".jsonc-patch.tmp";

    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw FileWriteError(path, "cannot open temporary file " + tmp.string());
        }
        out.write(text.data(), static_cast<std::streamsize>(text.size()));
        out.flush();
        if (!out) {
            out.close();
            fs::remove(tmp, ec);
            throw FileWriteError(path, "write to temporary file failed");
        }
    }

    fs::rename(tmp, target, ec);
    if (ec) {
        const std::string details = ec.message();
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw FileWriteError(path, "rename failed: " + details);
    }
}

} // namespace jpatch
