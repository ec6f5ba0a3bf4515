#pragma once

#include <ctime>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace wakecap {
namespace detail {

// Один мьютекс на процесс: строки из аудио-потока и HTTP-потока не перемешиваются
inline std::mutex& LogMutex() {
    static std::mutex mutex;
    return mutex;
}

inline std::string LogTimestamp() {
    std::time_t now = std::time(nullptr);
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%F %T", &local);
    return buffer;
}

} // namespace detail
} // namespace wakecap

#define WAKECAP_LOG_AT(stream, level, x)                                          \
    do {                                                                          \
        std::ostringstream wakecap_log_line_;                                     \
        wakecap_log_line_ << x;                                                   \
        std::lock_guard<std::mutex> wakecap_log_lock_(::wakecap::detail::LogMutex()); \
        stream << "[" << ::wakecap::detail::LogTimestamp() << "] [" level "] "    \
               << wakecap_log_line_.str() << std::endl;                           \
    } while (0)

#define WAKECAP_LOG_INFO(x) WAKECAP_LOG_AT(std::cout, "INFO", x)
#define WAKECAP_LOG_WARN(x) WAKECAP_LOG_AT(std::cerr, "WARN", x)
#define WAKECAP_LOG_ERROR(x) WAKECAP_LOG_AT(std::cerr, "ERROR", x)

#ifndef NDEBUG
    #define WAKECAP_DEBUG_LOG(x) WAKECAP_LOG_AT(std::cout, "DEBUG", x)
#else
    #define WAKECAP_DEBUG_LOG(x) ((void)0)
#endif
