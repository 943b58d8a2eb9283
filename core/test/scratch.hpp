#pragma once

// Helpers shared by the tests: a throwaway directory and a log recorder.

#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include "fv/core/util/Logging.hpp"

namespace fv_test {

// Fresh directory under the system temp dir, removed with its contents
class ScratchDir
{
public:
    ScratchDir()
    {
        static std::atomic<int> counter{0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = std::filesystem::temp_directory_path() /
                ("fv_test_" + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter++));
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }
    std::filesystem::path operator/(const std::string& name) const { return path_ / name; }

private:
    std::filesystem::path path_;
};

// Records warnings (and worse) logged while it lives
class LogCapture
{
public:
    LogCapture()
    {
        id_ = AddLogSink([this](SimpleLogger::Level level, const std::string& msg) {
            if (level < SimpleLogger::Level::Warn) return;
            std::lock_guard<std::mutex> lock(mutex_);
            messages_.push_back(msg);
        });
    }

    ~LogCapture() { RemoveLogSink(id_); }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::size_t count()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_.size();
    }

    bool contains(const std::string& needle)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& m : messages_) {
            if (m.find(needle) != std::string::npos) return true;
        }
        return false;
    }

private:
    int id_ = 0;
    std::mutex mutex_;
    std::vector<std::string> messages_;
};

} // namespace fv_test
