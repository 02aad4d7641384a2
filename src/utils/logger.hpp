#pragma once

#include <cstdio>
#include <memory>
#include <stdexcept>
#include <string>
#include "config_types.hpp"

namespace xvh {

// printf-style formatting for the LOG_* macros
template<typename ... Args>
std::string format_string( const std::string& format, Args ... args )
{
    int size_s = std::snprintf( nullptr, 0, format.c_str(), args ... ) + 1;
    if( size_s <= 0 ){ throw std::runtime_error( "Error during formatting." ); }
    auto size = static_cast<size_t>( size_s );
    std::unique_ptr<char[]> buf( new char[ size ] );
    std::snprintf( buf.get(), size, format.c_str(), args ... );
    return std::string( buf.get(), buf.get() + size - 1 );
}

inline std::string format_string( const std::string& format )
{
    return format;
}

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

LogLevel parse_log_level(const std::string& level);

class Logger {
public:
    static void init(const LoggingConfig& config, LogLevel app_log_level);
    static void shutdown();
    static void log(LogLevel level, const std::string& message);
    static void info(const std::string& message);
    static void error(const std::string& message);
};

#define LOG_INFO(...) xvh::Logger::log(xvh::LogLevel::INFO, xvh::format_string(__VA_ARGS__))
#define LOG_ERROR(...) xvh::Logger::log(xvh::LogLevel::ERROR, xvh::format_string(__VA_ARGS__))
#define LOG_WARNING(...) xvh::Logger::log(xvh::LogLevel::WARNING, xvh::format_string(__VA_ARGS__))
#define LOG_DEBUG(...) xvh::Logger::log(xvh::LogLevel::DEBUG, xvh::format_string(__VA_ARGS__))
#define LOG_CRITICAL(...) xvh::Logger::log(xvh::LogLevel::CRITICAL, xvh::format_string(__VA_ARGS__))

} // namespace xvh
