#include <render_service/config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <cstdint>
#include <fstream>
#include <sstream>

namespace render_service {

namespace {

// Longer timeouts would overflow steady_clock deadlines long before they mattered.
constexpr std::uint64_t kMaxTimeoutMs = 24ull * 60 * 60 * 1000;

bool millis_field(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return true;
    // Positive integers parse as unsigned; anything else is zero, negative or fractional.
    if (!j[key].is_number_unsigned()) return false;
    const auto v = j[key].get<std::uint64_t>();
    if (v == 0 || v > kMaxTimeoutMs) return false;
    out = std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(v));
    return true;
}

bool log_level_field(const nlohmann::json& j, std::string& out) {
    if (!j.contains("log_level")) return true;
    if (!j["log_level"].is_string()) return false;
    const auto v = j["log_level"].get<std::string>();
    // from_str maps unknown names to "off"; only accept "off" when spelled out.
    if (spdlog::level::from_str(v) == spdlog::level::off && v != "off") return false;
    out = v;
    return true;
}

std::optional<ServiceConfig> parse_config_json(const nlohmann::json& j) {
    auto log = clipper_log::logger();
    if (!j.is_object()) {
        log->error("service config: top level is not an object");
        return std::nullopt;
    }

    ServiceConfig c;
    if (j.contains("cache_budget_bytes")) {
        if (!j["cache_budget_bytes"].is_number_unsigned()) {
            log->error("service config: invalid 'cache_budget_bytes'");
            return std::nullopt;
        }
        c.cache_budget_bytes = j["cache_budget_bytes"].get<std::size_t>();
    }
    if (j.contains("worker_threads")) {
        if (!j["worker_threads"].is_number_unsigned() || j["worker_threads"].get<unsigned long long>() > 1024) {
            log->error("service config: invalid 'worker_threads'");
            return std::nullopt;
        }
        c.worker_threads = j["worker_threads"].get<unsigned>();
    }
    if (j.contains("layout_iteration_budget")) {
        if (!j["layout_iteration_budget"].is_number_integer() || j["layout_iteration_budget"].get<long long>() <= 0) {
            log->error("service config: invalid 'layout_iteration_budget'");
            return std::nullopt;
        }
        c.layout_iteration_budget = j["layout_iteration_budget"].get<std::int64_t>();
    }
    if (j.contains("font_paths")) {
        const auto& fp = j["font_paths"];
        if (!fp.is_array()) {
            log->error("service config: 'font_paths' must be an array");
            return std::nullopt;
        }
        c.font_paths.clear();
        for (const auto& p : fp) {
            if (!p.is_string()) {
                log->error("service config: 'font_paths' entries must be strings");
                return std::nullopt;
            }
            c.font_paths.push_back(p.get<std::string>());
        }
    }
    if (j.contains("log_file")) {
        if (!j["log_file"].is_string()) {
            log->error("service config: invalid 'log_file'");
            return std::nullopt;
        }
        c.log.file = j["log_file"].get<std::string>();
    }

    struct Check {
        const char* key;
        bool ok;
    };
    const Check checks[] = {
        { "layout_timeout_ms", millis_field(j, "layout_timeout_ms", c.layout_timeout) },
        { "render_timeout_ms", millis_field(j, "render_timeout_ms", c.render_timeout) },
        { "log_level", log_level_field(j, c.log.level) },
    };
    for (const auto& check : checks) {
        if (!check.ok) {
            log->error("service config: invalid '{}'", check.key);
            return std::nullopt;
        }
    }
    return c;
}

} // namespace

std::vector<std::string> default_font_paths() {
    return {
        "/usr/share/fonts/truetype/dejavu/DejaVuSans.ttf",
        "/usr/share/fonts/truetype/liberation/LiberationSans-Regular.ttf",
        "/usr/share/fonts/TTF/DejaVuSans.ttf",
        "/usr/share/fonts/dejavu/DejaVuSans.ttf",
    };
}

std::optional<ServiceConfig> load_service_config_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& ex) {
        clipper_log::logger()->error("service config: {}", ex.what());
        return std::nullopt;
    }
    return parse_config_json(j);
}

std::optional<ServiceConfig> load_service_config_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        clipper_log::logger()->error("service config: cannot open {}", path);
        return std::nullopt;
    }
    return load_service_config_from_json(f);
}

std::optional<ServiceConfig> load_service_config_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_service_config_from_json(in);
}

} // namespace render_service
