#pragma once

#include <graph_model/description.hpp>
#include <graph_model/style.hpp>
#include <optional>
#include <istream>
#include <string>

namespace graph_loaders {

// {"name": ..., "nodes": [{id, label, shape, width, height, style}], "edges": [{source, target, directed, label, style}]}
// Returns nullopt (and logs the reason) on malformed input. Referential checks happen later in build_graph().
std::optional<graph_model::GraphDescription> load_graph_description_from_json(std::istream& in);
std::optional<graph_model::GraphDescription> load_graph_description_from_json_file(const std::string& path);

// Style options object; missing keys keep their defaults, unknown keys are ignored.
std::optional<graph_model::Style> load_style_from_json(std::istream& in);
std::optional<graph_model::Style> load_style_from_json_file(const std::string& path);
std::optional<graph_model::Style> load_style_from_json_string(const std::string& text);

} // namespace graph_loaders
