#pragma once

#include "battle_error.hpp"

#include <iosfwd>
#include <string>
#include <vector>

// Write-only destination for human-readable battle lines.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const std::string& line) = 0;
};

// Keeps every line; used by tests, determinism checks and --log exports.
class MemoryLog : public LogSink {
public:
    void write(const std::string& line) override { lines_.push_back(line); }

    const std::vector<std::string>& lines() const { return lines_; }
    void clear() { lines_.clear(); }

    // Lines joined with '\n' (trailing newline included when non-empty).
    std::string exportText() const;
    bool exportToFile(const std::string& path, BattleError* err = nullptr) const;

private:
    std::vector<std::string> lines_;
};

// Forwards every line to a stream as it is written.
class StreamLog : public LogSink {
public:
    explicit StreamLog(std::ostream& out) : out_(out) {}
    void write(const std::string& line) override;

private:
    std::ostream& out_;
};

// Null-safe helper used by the engine and the combat primitives.
inline void logLine(LogSink* sink, const std::string& line) {
    if (sink) sink->write(line);
}

// "==========================================" (42 '=')
std::string logRule();
