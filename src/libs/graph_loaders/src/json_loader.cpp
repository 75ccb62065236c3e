#include <graph_loaders/json_loader.hpp>
#include <clipper_log/log.hpp>
#include <nlohmann/json.hpp>
#include <fstream>

namespace graph_loaders {

namespace {

std::string string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    return j.contains(key) && j[key].is_string() ? j[key].get<std::string>() : fallback;
}

double number_or(const nlohmann::json& j, const char* key, double fallback) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>() : fallback;
}

bool color_field(const nlohmann::json& j, const char* key, graph_model::Color& out) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string()) return false;
    auto c = graph_model::parse_color(j[key].get<std::string>());
    if (!c) return false;
    out = *c;
    return true;
}

bool parse_node_style(const nlohmann::json& s, graph_model::NodeStyle& style) {
    if (!s.is_object()) return false;
    if (!color_field(s, "fill", style.fill)) return false;
    if (!color_field(s, "border", style.border)) return false;
    if (!color_field(s, "text", style.text)) return false;
    style.border_width = number_or(s, "border_width", style.border_width);
    return style.border_width >= 0;
}

bool parse_edge_style(const nlohmann::json& s, graph_model::EdgeStyle& style) {
    if (!s.is_object()) return false;
    if (!color_field(s, "color", style.color)) return false;
    style.width = number_or(s, "width", style.width);
    if (s.contains("dash")) {
        if (!s["dash"].is_string()) return false;
        auto dash = graph_model::dash_from_string(s["dash"].get<std::string>());
        if (!dash) return false;
        style.dash = *dash;
    }
    if (s.contains("arrow")) {
        if (!s["arrow"].is_string()) return false;
        auto arrow = graph_model::arrow_from_string(s["arrow"].get<std::string>());
        if (!arrow) return false;
        style.arrow = *arrow;
    }
    return style.width >= 0;
}

std::optional<graph_model::GraphDescription> parse_json(const nlohmann::json& j) {
    auto log = clipper_log::logger();
    graph_model::GraphDescription d;
    if (!j.is_object()) {
        log->error("graph description: top level is not an object");
        return std::nullopt;
    }
    if (!j.contains("nodes") || !j["nodes"].is_array()) {
        log->error("graph description: missing 'nodes' array");
        return std::nullopt;
    }
    if (j.contains("edges") && !j["edges"].is_array()) {
        log->error("graph description: 'edges' is not an array");
        return std::nullopt;
    }

    for (const auto& n : j["nodes"]) {
        graph_model::NodeRecord node;
        if (!n.is_object() || !n.contains("id") || !n["id"].is_string()) {
            log->error("graph description: node #{} has no string 'id'", d.nodes.size());
            return std::nullopt;
        }
        node.id = n["id"].get<std::string>();
        node.attrs.label = string_or(n, "label", node.id);
        node.attrs.width = number_or(n, "width", 0);
        node.attrs.height = number_or(n, "height", 0);
        if (node.attrs.width < 0 || node.attrs.height < 0) {
            log->error("graph description: node '{}' has a negative size", node.id);
            return std::nullopt;
        }
        if (n.contains("shape")) {
            auto shape = n["shape"].is_string()
                ? graph_model::shape_from_string(n["shape"].get<std::string>())
                : std::nullopt;
            if (!shape) {
                log->error("graph description: node '{}' has an unknown shape", node.id);
                return std::nullopt;
            }
            node.attrs.shape = *shape;
        }
        if (n.contains("style") && !parse_node_style(n["style"], node.attrs.style)) {
            log->error("graph description: node '{}' has an invalid style", node.id);
            return std::nullopt;
        }
        d.nodes.push_back(std::move(node));
    }

    if (j.contains("edges")) {
        for (const auto& e : j["edges"]) {
            graph_model::EdgeRecord edge;
            if (!e.is_object() || !e.contains("source") || !e["source"].is_string()
                || !e.contains("target") || !e["target"].is_string())
            {
                log->error("graph description: edge #{} needs string 'source' and 'target'", d.edges.size());
                return std::nullopt;
            }
            edge.source = e["source"].get<std::string>();
            edge.target = e["target"].get<std::string>();
            edge.attrs.label = string_or(e, "label", "");
            if (e.contains("directed")) {
                if (!e["directed"].is_boolean()) {
                    log->error("graph description: edge #{} 'directed' is not a boolean", d.edges.size());
                    return std::nullopt;
                }
                edge.attrs.directed = e["directed"].get<bool>();
            }
            if (e.contains("style") && !parse_edge_style(e["style"], edge.attrs.style)) {
                log->error("graph description: edge #{} has an invalid style", d.edges.size());
                return std::nullopt;
            }
            d.edges.push_back(std::move(edge));
        }
    }

    d.name = string_or(j, "name", "");
    return d;
}

} // namespace

std::optional<graph_model::GraphDescription> load_graph_description_from_json(std::istream& in) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& ex) {
        clipper_log::logger()->error("graph description: {}", ex.what());
        return std::nullopt;
    }
    return parse_json(j);
}

std::optional<graph_model::GraphDescription> load_graph_description_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) {
        clipper_log::logger()->error("graph description: cannot open {}", path);
        return std::nullopt;
    }
    return load_graph_description_from_json(f);
}

} // namespace graph_loaders
