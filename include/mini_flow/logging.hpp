#pragma once

#include <functional>
#include <iostream>
#include <string>

namespace miniflow {

// ==========================================
// Observability: Logger
// ==========================================
enum class LogLevel { kDebug, kInfo, kWarn, kError };

using LogFn = std::function<void(LogLevel, const std::string&)>;

inline LogFn StderrLogger(LogLevel min = LogLevel::kInfo) {
  return [min](LogLevel level, const std::string& msg) {
    if (level < min) return;
    static const char* tags[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    std::cerr << "[" << tags[static_cast<int>(level)] << "] " << msg << "\n";
  };
}

inline LogFn SilentLogger() {
  return [](LogLevel, const std::string&) {};
}

}  // namespace miniflow
