/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, file fixtures).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <QCoreApplication>

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    /**
     * @brief Set or unset an environment variable for the guard lifetime.
     * @param key Environment variable name.
     * @param value New value; unset when std::nullopt.
     */
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    /**
     * @brief Restore the original environment variable state.
     */
    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            setenv(key_.c_str(), value->c_str(), 1);
        } else {
            unsetenv(key_.c_str());
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    /**
     * @brief Create a unique temporary directory.
     */
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("ordne-test-")) {
        std::filesystem::create_directories(path_);
    }

    /**
     * @brief Remove the temporary directory and its contents.
     */
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    /**
     * @brief Return the temporary directory path.
     * @return Reference to the directory path.
     */
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

/**
 * @brief Write a file (creating parent directories) with the given content.
 */
inline void write_file(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/**
 * @brief Read a whole file into a string; empty when it cannot be opened.
 */
inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Ensures a QCoreApplication exists for code that drives QProcess.
 */
class QtAppContext {
public:
    QtAppContext() {
        if (!QCoreApplication::instance()) {
            static int argc = 1;
            static char arg0[] = "tests";
            static char* argv[] = {arg0, nullptr};
            static QCoreApplication* app = new QCoreApplication(argc, argv);
            Q_UNUSED(app);
        }
    }
};
