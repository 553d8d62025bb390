#pragma once
#include <functional>
#include <string>

namespace mcptool::logging
{

enum class Level
{
    Debug,
    Info,
    Warning,
    Error,
    Off
};

/// Receives one fully formatted line (no trailing newline).
using Sink = std::function<void(const std::string&)>;

const char* to_string(Level level);

/// Accepts DEBUG/INFO/WARN/WARNING/ERROR/OFF in any case; unknown names map to Info.
Level level_from_string(const std::string& name);

void set_level(Level level);
Level level();
bool enabled(Level level);

/// Replace the output sink. An empty sink restores the default (stderr).
void set_sink(Sink sink);

/// Append log lines to a file, creating parent directories as needed.
/// Throws mcptool::Error if the file cannot be opened.
void log_to_file(const std::string& path);

/// Formats "<timestamp> <LEVEL> [mcptool] <component>: <message>" and hands it
/// to the sink. Never writes to stdout.
void log(Level level, const std::string& component, const std::string& message);

inline void debug(const std::string& component, const std::string& message)
{
    log(Level::Debug, component, message);
}
inline void info(const std::string& component, const std::string& message)
{
    log(Level::Info, component, message);
}
inline void warn(const std::string& component, const std::string& message)
{
    log(Level::Warning, component, message);
}
inline void error(const std::string& component, const std::string& message)
{
    log(Level::Error, component, message);
}

} // namespace mcptool::logging
