#pragma once

#include <clipper_log/log.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <istream>
#include <optional>
#include <string>
#include <vector>

namespace render_service {

// Common DejaVu / Liberation locations.
std::vector<std::string> default_font_paths();

struct ServiceConfig {
    std::size_t cache_budget_bytes = 64u * 1024u * 1024u;
    // 0: std::thread::hardware_concurrency().
    unsigned worker_threads = 0;
    std::chrono::milliseconds layout_timeout{ 5000 };
    std::chrono::milliseconds render_timeout{ 10000 };
    std::int64_t layout_iteration_budget = 200000;
    std::vector<std::string> font_paths = default_font_paths();
    clipper_log::LogOptions log;
};

// {"cache_budget_bytes", "worker_threads", "layout_timeout_ms", "render_timeout_ms",
//  "layout_iteration_budget", "font_paths", "log_level", "log_file"}.
// Missing keys keep defaults; returns nullopt (logged) on malformed values.
std::optional<ServiceConfig> load_service_config_from_json(std::istream& in);
std::optional<ServiceConfig> load_service_config_from_json_file(const std::string& path);
std::optional<ServiceConfig> load_service_config_from_json_string(const std::string& text);

} // namespace render_service
