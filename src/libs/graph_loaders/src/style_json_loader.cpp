#include <graph_loaders/json_loader.hpp>
#include <clipper_log/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace graph_loaders {

namespace {

template <typename Enum, typename Parse>
bool enum_field(const nlohmann::json& j, const char* key, Parse parse, Enum& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    auto v = parse(j[key].get<std::string>());
    if (!v) return false;
    out = *v;
    return true;
}

bool positive_number_field(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number()) return false;
    const double v = j[key].get<double>();
    if (!(v > 0)) return false;
    out = v;
    return true;
}

bool non_negative_number_field(const nlohmann::json& j, const char* key, double& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number()) return false;
    const double v = j[key].get<double>();
    if (v < 0) return false;
    out = v;
    return true;
}

bool positive_int_field(const nlohmann::json& j, const char* key, int& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_number_integer()) return false;
    const auto v = j[key].get<long long>();
    if (v <= 0 || v > 1000000) return false;
    out = static_cast<int>(v);
    return true;
}

std::optional<graph_model::Style> parse_style_json(const nlohmann::json& j) {
    auto log = clipper_log::logger();
    graph_model::Style s;
    if (!j.is_object()) {
        log->error("style options: top level is not an object");
        return std::nullopt;
    }

    if (j.contains("background")) {
        auto c = j["background"].is_string()
            ? graph_model::parse_color(j["background"].get<std::string>())
            : std::nullopt;
        if (!c) {
            log->error("style options: invalid 'background'");
            return std::nullopt;
        }
        s.background = *c;
    }
    if (j.contains("font_family")) {
        if (!j["font_family"].is_string() || j["font_family"].get<std::string>().empty()) {
            log->error("style options: invalid 'font_family'");
            return std::nullopt;
        }
        s.font_family = j["font_family"].get<std::string>();
    }

    struct Check {
        const char* key;
        bool ok;
    };
    const Check checks[] = {
        { "font_size", positive_number_field(j, "font_size", s.font_size) },
        { "edge_routing", enum_field(j, "edge_routing", graph_model::edge_routing_from_string, s.edge_routing) },
        { "dpi", positive_int_field(j, "dpi", s.dpi) },
        { "layout", enum_field(j, "layout", graph_model::layout_algorithm_from_string, s.layout) },
        { "rank_direction", enum_field(j, "rank_direction", graph_model::rank_direction_from_string, s.rank_direction) },
        { "format", enum_field(j, "format", graph_model::image_format_from_string, s.format) },
        { "node_spacing", non_negative_number_field(j, "node_spacing", s.node_spacing) },
        { "rank_spacing", non_negative_number_field(j, "rank_spacing", s.rank_spacing) },
        { "margin", non_negative_number_field(j, "margin", s.margin) },
        { "force_iterations", positive_int_field(j, "force_iterations", s.force_iterations) },
    };
    for (const auto& c : checks) {
        if (!c.ok) {
            log->error("style options: invalid '{}'", c.key);
            return std::nullopt;
        }
    }
    return s;
}

} // namespace

std::optional<graph_model::Style> load_style_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& ex) {
        clipper_log::logger()->error("style options: {}", ex.what());
        return std::nullopt;
    }
    return parse_style_json(j);
}

std::optional<graph_model::Style> load_style_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        clipper_log::logger()->error("style options: cannot open {}", path);
        return std::nullopt;
    }
    return load_style_from_json(f);
}

std::optional<graph_model::Style> load_style_from_json_string(const std::string& text) {
    std::istringstream in(text);
    return load_style_from_json(in);
}

} // namespace graph_loaders
