#pragma once
#include <cstdint>
#include <iostream>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
//---------------------------------------------------------------------------
// RepoBlob - Range-Aware Artifact Delivery
// RepoBlob Authors, 2026
//
// This Source Code Form is subject to the terms of the Mozilla Public License, v. 2.0.
// If a copy of the MPL was not distributed with this file, You can obtain one at http://mozilla.org/MPL/2.0/.
// SPDX-License-Identifier: MPL-2.0
//---------------------------------------------------------------------------
namespace repoblob::utils {
//---------------------------------------------------------------------------
/// The logging interface handed to services and the server
class Logger {
    public:
    /// The severity, lower is more severe
    enum class Level : uint8_t {
        Error,
        Warning,
        Info,
        Debug
    };

    protected:
    /// The maximum level that is written
    Level _level;

    /// Write one line
    virtual void write(Level level, std::string_view message) = 0;

    public:
    /// The constructor
    explicit Logger(Level level = Level::Info) : _level(level) {}
    /// The destructor
    virtual ~Logger() noexcept = default;

    /// Get the level name
    static constexpr auto getLevelName(const Level& level) noexcept {
        switch (level) {
            case Level::Error: return "error";
            case Level::Warning: return "warning";
            case Level::Info: return "info";
            case Level::Debug: return "debug";
            default: return "unknown";
        }
    }
    /// Parse a level name, throws on unknown names
    [[nodiscard]] static Level parseLevel(std::string_view name);

    /// Set the maximum level
    void setLevel(Level level) { _level = level; }
    /// Get the maximum level
    [[nodiscard]] Level getLevel() const { return _level; }
    /// Is the level written
    [[nodiscard]] bool enabled(Level level) const { return level <= _level; }

    /// Log a message with the level
    void log(Level level, std::string_view message) {
        if (enabled(level))
            write(level, message);
    }
    /// Log an error
    void error(std::string_view message) { log(Level::Error, message); }
    /// Log a warning
    void warning(std::string_view message) { log(Level::Warning, message); }
    /// Log an info
    void info(std::string_view message) { log(Level::Info, message); }
    /// Log a debug message
    void debug(std::string_view message) { log(Level::Debug, message); }
};
//---------------------------------------------------------------------------
/// Writes "[level] message" lines to an ostream
class StreamLogger : public Logger {
    /// The outstream
    std::ostream* _outStream;
    /// Serializes lines of concurrent writers
    std::mutex _mutex;

    protected:
    /// Write one line
    void write(Level level, std::string_view message) override;

    public:
    /// The constructor
    explicit StreamLogger(std::ostream* outStream = &std::cerr, Level level = Level::Info) : Logger(level), _outStream(outStream) {}
};
//---------------------------------------------------------------------------
/// Keeps the lines in memory
class MemoryLogger : public Logger {
    /// The lines
    std::vector<std::string> _lines;
    /// Guards the lines
    mutable std::mutex _mutex;

    protected:
    /// Write one line
    void write(Level level, std::string_view message) override;

    public:
    /// The constructor
    explicit MemoryLogger(Level level = Level::Debug) : Logger(level) {}

    /// Get a copy of the lines
    [[nodiscard]] std::vector<std::string> getLines() const;
    /// Does any line contain the needle
    [[nodiscard]] bool contains(std::string_view needle) const;
};
//---------------------------------------------------------------------------
} // namespace repoblob::utils
