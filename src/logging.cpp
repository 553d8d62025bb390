#include "mcptool/logging.hpp"

#include "mcptool/exceptions.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>

namespace mcptool::logging
{

namespace
{
std::atomic<Level> g_level{Level::Info};
std::mutex g_mutex;
Sink g_sink;

std::string to_iso8601_now()
{
    using clock = std::chrono::system_clock;
    auto now = clock::now();
    std::time_t t = clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::tm tm;
    gmtime_r(&t, &tm);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
        << ms.count() << 'Z';
    return oss.str();
}
} // namespace

const char* to_string(Level level)
{
    switch (level)
    {
    case Level::Debug:
        return "DEBUG";
    case Level::Info:
        return "INFO";
    case Level::Warning:
        return "WARN";
    case Level::Error:
        return "ERROR";
    case Level::Off:
        return "OFF";
    }
    return "INFO";
}

Level level_from_string(const std::string& name)
{
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG" || upper == "TRACE")
        return Level::Debug;
    if (upper == "WARN" || upper == "WARNING")
        return Level::Warning;
    if (upper == "ERROR")
        return Level::Error;
    if (upper == "OFF" || upper == "NONE")
        return Level::Off;
    return Level::Info;
}

void set_level(Level level)
{
    g_level = level;
}

Level level()
{
    return g_level.load();
}

bool enabled(Level level)
{
    return level != Level::Off && level >= g_level.load();
}

void set_sink(Sink sink)
{
    std::lock_guard<std::mutex> lock(g_mutex);
    g_sink = std::move(sink);
}

void log_to_file(const std::string& path)
{
    std::filesystem::path p(path);
    if (p.has_parent_path())
    {
        std::error_code ec;
        std::filesystem::create_directories(p.parent_path(), ec);
        if (ec)
            throw Error("Failed to create log directory " + p.parent_path().string() + ": " +
                        ec.message());
    }

    auto out = std::make_shared<std::ofstream>(path, std::ios::app);
    if (!*out)
        throw Error("Failed to open log file: " + path);

    set_sink(
        [out](const std::string& line)
        {
            *out << line << '\n';
            out->flush();
        });
}

void log(Level level, const std::string& component, const std::string& message)
{
    if (!enabled(level))
        return;

    std::string line = to_iso8601_now() + " " + to_string(level) + " [mcptool] " + component +
                       ": " + message;

    std::lock_guard<std::mutex> lock(g_mutex);
    if (g_sink)
        g_sink(line);
    else
        std::cerr << line << std::endl;
}

} // namespace mcptool::logging
