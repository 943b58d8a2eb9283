#pragma once

#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

// Minimal logger with "{}" placeholders, stderr output, file and callback sinks
class SimpleLogger {
public:
    enum class Level {
        Trace,
        Debug,
        Info,
        Warn,
        Error,
        Critical
    };

    using Sink = std::function<void(Level, const std::string&)>;

    SimpleLogger();
    ~SimpleLogger();

    void setLevel(Level level) { currentLevel_ = level; }
    [[nodiscard]] Level level() const { return currentLevel_; }
    void addFile(const std::filesystem::path& path);

    // Returns an id usable with removeSink()
    int addSink(Sink sink);
    void removeSink(int id);

    template<typename... Args>
    void trace(const std::string& fmt, Args&&... args) {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void debug(const std::string& fmt, Args&&... args) {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(const std::string& fmt, Args&&... args) {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(const std::string& fmt, Args&&... args) {
        log(Level::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(const std::string& fmt, Args&&... args) {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void critical(const std::string& fmt, Args&&... args) {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }

private:
    template<typename... Args>
    void log(Level level, const std::string& fmt, Args&&... args) {
        if (level < currentLevel_) return;

        std::string msg = fmt;
        if constexpr (sizeof...(args) > 0) {
            std::size_t pos = 0;
            (substitute(msg, pos, std::forward<Args>(args)), ...);
        }
        write(level, msg);
    }

    template<typename T>
    static void substitute(std::string& msg, std::size_t& pos, T&& val) {
        pos = msg.find("{}", pos);
        if (pos == std::string::npos) return;
        std::ostringstream oss;
        oss << std::forward<T>(val);
        auto text = oss.str();
        msg.replace(pos, 2, text);
        pos += text.size();
    }

    void write(Level level, const std::string& msg);
    static std::string levelPrefix(Level level);

    Level currentLevel_ = Level::Info;
    std::mutex mutex_;
    std::vector<std::ofstream> files_;
    std::vector<std::pair<int, Sink>> sinks_;
    int nextSinkId_ = 0;
};

void AddLogFile(const std::filesystem::path& path);
int AddLogSink(SimpleLogger::Sink sink);
void RemoveLogSink(int id);
void SetLogLevel(const std::string& s);
std::shared_ptr<SimpleLogger> Logger();
