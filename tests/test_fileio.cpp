/**
 * @file test_fileio.cpp
 * @brief Tests for settings path resolution and file replacement (GoogleTest)
 */

#include <gtest/gtest.h>
#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/FileIO.hpp"
#include "jpatch/Paths.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using namespace jpatch;

// ============================================================================
// Test Utilities
// ============================================================================

/**
 * @brief RAII helper for creating temporary directories.
 */
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() /
                      ("jpatch_test_dir_" + std::to_string(std::rand()))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    fs::path path() const { return path_; }

    std::string create_file(const std::string& name, const std::string& content) {
        fs::path file_path = path_ / name;
        std::ofstream out(file_path, std::ios::binary);
        out << content;
        return file_path.string();
    }

private:
    fs::path path_;
};

/**
 * @brief RAII wrapper for environment variable
 */
class EnvGuard {
public:
    EnvGuard(const std::string& name, const std::string& value)
        : name_(name), had_value_(false) {
        const char* old = std::getenv(name.c_str());
        if (old) {
            old_value_ = old;
            had_value_ = true;
        }
#ifdef _WIN32
        _putenv_s(name.c_str(), value.c_str());
#else
        setenv(name.c_str(), value.c_str(), 1);
#endif
    }

    ~EnvGuard() {
#ifdef _WIN32
        _putenv_s(name_.c_str(), had_value_ ? old_value_.c_str() : "");
#else
        if (had_value_) {
            setenv(name_.c_str(), old_value_.c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
#endif
    }

private:
    std::string name_;
    std::string old_value_;
    bool had_value_;
};

// ============================================================================
// read_text_file
// ============================================================================

TEST(ReadTextFile, MissingFileIsNullopt) {
    TempDir dir;
    EXPECT_FALSE(read_text_file((dir.path() / "absent.json").string()).has_value());
}

TEST(ReadTextFile, ReadsBytesVerbatim) {
    TempDir dir;
    const std::string content = "{\r\n  // c\r\n  \"a\": \"caf\xC3\xA9\"\r\n}";
    auto path = dir.create_file("settings.json", content);
    auto read = read_text_file(path);
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(*read, content);
}

TEST(ReadTextFile, DirectoryIsAnError) {
    TempDir dir;
    EXPECT_THROW(read_text_file(dir.path().string()), FileReadError);
}

// ============================================================================
// atomic_write_file
// ============================================================================

TEST(AtomicWriteFile, CreatesParentDirectories) {
    TempDir dir;
    const auto path = (dir.path() / "Code" / "User" / "settings.json").string();
    atomic_write_file(path, "{}\n");
    EXPECT_EQ(read_text_file(path).value_or(""), "{}\n");
}

TEST(AtomicWriteFile, ReplacesAndLeavesNoTemporary) {
    TempDir dir;
    auto path = dir.create_file("settings.json", "old contents");
    atomic_write_file(path, "new");
    EXPECT_EQ(read_text_file(path).value_or(""), "new");

    std::size_t files = 0;
    for (const auto& entry : fs::directory_iterator(dir.path())) {
        (void)entry;
        ++files;
    }
    EXPECT_EQ(files, 1u);
}

TEST(AtomicWriteFile, SyncRoundTripThroughFile) {
    TempDir dir;
    auto path = dir.create_file("settings.json", "{\n  // keep me\n  \"a\": 1\n}\n");

    auto doc = read_text_file(path);
    ASSERT_TRUE(doc.has_value());
    auto result = sync(*doc, {{"A", "1"}});
    atomic_write_file(path, result.text);

    auto written = read_text_file(path);
    ASSERT_TRUE(written.has_value());
    EXPECT_NE(written->find("// keep me"), std::string::npos);
    EXPECT_EQ(clear(*written).text, *doc);
}

// ============================================================================
// Path resolution
// ============================================================================

TEST(ResolveSettingsPath, OverrideIsTrimmed) {
    SettingsLocation loc;
    loc.override_path = "  /tmp/custom/settings.json \n";
    EXPECT_EQ(resolve_settings_path(loc), "/tmp/custom/settings.json");
}

#ifndef _WIN32
TEST(ResolveSettingsPath, OverrideExpandsHome) {
    EnvGuard home("HOME", "/home/tester");
    SettingsLocation loc;
    loc.override_path = "~/vscode/settings.json";
    EXPECT_EQ(resolve_settings_path(loc), "/home/tester/vscode/settings.json");
}

TEST(ResolveSettingsPath, BlankOverrideFallsBackToDefault) {
    EnvGuard home("HOME", "/home/tester");
    SettingsLocation loc;
    loc.override_path = "   ";
    EXPECT_EQ(resolve_settings_path(loc), default_settings_path());
}

TEST(DefaultSettingsPath, UnderHome) {
    EnvGuard home("HOME", "/home/tester");
#ifdef __APPLE__
    EXPECT_EQ(default_settings_path(),
              "/home/tester/Library/Application Support/Code/User/settings.json");
#else
    EXPECT_EQ(default_settings_path(), "/home/tester/.config/Code/User/settings.json");
#endif
}

TEST(DefaultSettingsPath, MissingHomeThrows) {
    EnvGuard home("HOME", "");
    EXPECT_THROW(default_settings_path(), PathResolutionError);
}
#endif

TEST(ExpandHome, LeavesOtherPathsAlone) {
    EXPECT_EQ(expand_home("/abs/path"), "/abs/path");
    EXPECT_EQ(expand_home("relative/path"), "relative/path");
    EXPECT_EQ(expand_home("~user/x"), "~user/x");
}
