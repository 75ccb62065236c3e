#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace clipper_log {

struct LogOptions {
    // trace | debug | info | warn | error | critical | off
    std::string level = "info";
    // Empty: log to the default console logger.
    std::string file;
};

// Installs the shared "clipper" logger. Safe to call more than once; the last call wins.
// Falls back to the default spdlog logger if the file sink cannot be opened.
void configure(const LogOptions& options);

// The shared "clipper" logger. Lazily created with default options on first use.
std::shared_ptr<spdlog::logger> logger();

} // namespace clipper_log
