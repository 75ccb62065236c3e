#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace graph_model {

struct Color {
    std::uint8_t r = 0;
    std::uint8_t g = 0;
    std::uint8_t b = 0;
    std::uint8_t a = 255;

    friend bool operator==(const Color&, const Color&) = default;
};

// Accepts #rgb, #rrggbb, #rrggbbaa and a handful of CSS color names.
std::optional<Color> parse_color(std::string_view text);
// #rrggbb, or #rrggbbaa when not opaque.
std::string to_hex(const Color& color);

enum class ShapeKind { Rectangle, RoundedRectangle, Ellipse, Diamond };
enum class ArrowKind { None, Normal, Open, Diamond };
enum class DashPattern { Solid, Dashed, Dotted };

std::optional<ShapeKind> shape_from_string(std::string_view s);
std::optional<ArrowKind> arrow_from_string(std::string_view s);
std::optional<DashPattern> dash_from_string(std::string_view s);
const char* to_string(ShapeKind shape);
const char* to_string(ArrowKind arrow);
const char* to_string(DashPattern dash);

struct NodeStyle {
    Color fill{ 236, 240, 247, 255 };
    Color border{ 70, 84, 110, 255 };
    double border_width = 1.5;
    Color text{ 30, 30, 30, 255 };
};

// Width/height of 0 mean "size from label".
struct NodeAttributes {
    std::string label;
    ShapeKind shape = ShapeKind::Rectangle;
    double width = 0;
    double height = 0;
    NodeStyle style;
};

struct Node {
    std::string id;
    std::string label;
    ShapeKind shape = ShapeKind::Rectangle;
    double width = 0;
    double height = 0;
    NodeStyle style;
};

struct EdgeStyle {
    Color color{ 90, 90, 90, 255 };
    double width = 1.5;
    DashPattern dash = DashPattern::Solid;
    ArrowKind arrow = ArrowKind::Normal;
};

struct EdgeAttributes {
    bool directed = true;
    EdgeStyle style;
    std::string label;
};

struct Edge {
    std::string source_node_id;
    std::string target_node_id;
    bool directed = true;
    EdgeStyle style;
    std::string label;

    bool is_self_loop() const { return source_node_id == target_node_id; }
};

} // namespace graph_model
