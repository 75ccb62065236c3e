#include <graph_model/types.hpp>
#include <array>
#include <cstdio>

namespace graph_model {

namespace {

struct NamedColor {
    const char* name;
    Color color;
};

const std::array<NamedColor, 12> named_colors = { {
    { "black", { 0, 0, 0, 255 } },
    { "white", { 255, 255, 255, 255 } },
    { "red", { 255, 0, 0, 255 } },
    { "green", { 0, 128, 0, 255 } },
    { "blue", { 0, 0, 255, 255 } },
    { "yellow", { 255, 255, 0, 255 } },
    { "orange", { 255, 165, 0, 255 } },
    { "purple", { 128, 0, 128, 255 } },
    { "gray", { 128, 128, 128, 255 } },
    { "grey", { 128, 128, 128, 255 } },
    { "lightgray", { 211, 211, 211, 255 } },
    { "transparent", { 0, 0, 0, 0 } },
} };

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool read_byte(std::string_view s, std::size_t pos, std::uint8_t& out) {
    const int hi = hex_digit(s[pos]);
    const int lo = hex_digit(s[pos + 1]);
    if (hi < 0 || lo < 0) return false;
    out = static_cast<std::uint8_t>(hi * 16 + lo);
    return true;
}

} // namespace

std::optional<Color> parse_color(std::string_view text) {
    if (text.empty()) return std::nullopt;
    if (text[0] != '#') {
        for (const auto& nc : named_colors)
            if (text == nc.name) return nc.color;
        return std::nullopt;
    }

    const std::string_view hex = text.substr(1);
    Color c;
    if (hex.size() == 3) {
        const int r = hex_digit(hex[0]);
        const int g = hex_digit(hex[1]);
        const int b = hex_digit(hex[2]);
        if (r < 0 || g < 0 || b < 0) return std::nullopt;
        c.r = static_cast<std::uint8_t>(r * 17);
        c.g = static_cast<std::uint8_t>(g * 17);
        c.b = static_cast<std::uint8_t>(b * 17);
        return c;
    }
    if (hex.size() != 6 && hex.size() != 8) return std::nullopt;
    if (!read_byte(hex, 0, c.r) || !read_byte(hex, 2, c.g) || !read_byte(hex, 4, c.b))
        return std::nullopt;
    if (hex.size() == 8 && !read_byte(hex, 6, c.a))
        return std::nullopt;
    return c;
}

std::string to_hex(const Color& color) {
    char buf[10];
    if (color.a == 255)
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", color.r, color.g, color.b);
    else
        std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", color.r, color.g, color.b, color.a);
    return buf;
}

std::optional<ShapeKind> shape_from_string(std::string_view s) {
    if (s == "rectangle" || s == "box") return ShapeKind::Rectangle;
    if (s == "rounded") return ShapeKind::RoundedRectangle;
    if (s == "ellipse" || s == "oval") return ShapeKind::Ellipse;
    if (s == "diamond") return ShapeKind::Diamond;
    return std::nullopt;
}

std::optional<ArrowKind> arrow_from_string(std::string_view s) {
    if (s == "none") return ArrowKind::None;
    if (s == "normal") return ArrowKind::Normal;
    if (s == "open") return ArrowKind::Open;
    if (s == "diamond") return ArrowKind::Diamond;
    return std::nullopt;
}

std::optional<DashPattern> dash_from_string(std::string_view s) {
    if (s == "solid") return DashPattern::Solid;
    if (s == "dashed") return DashPattern::Dashed;
    if (s == "dotted") return DashPattern::Dotted;
    return std::nullopt;
}

const char* to_string(ShapeKind shape) {
    switch (shape) {
    case ShapeKind::Rectangle: return "rectangle";
    case ShapeKind::RoundedRectangle: return "rounded";
    case ShapeKind::Ellipse: return "ellipse";
    case ShapeKind::Diamond: return "diamond";
    }
    return "rectangle";
}

const char* to_string(ArrowKind arrow) {
    switch (arrow) {
    case ArrowKind::None: return "none";
    case ArrowKind::Normal: return "normal";
    case ArrowKind::Open: return "open";
    case ArrowKind::Diamond: return "diamond";
    }
    return "normal";
}

const char* to_string(DashPattern dash) {
    switch (dash) {
    case DashPattern::Solid: return "solid";
    case DashPattern::Dashed: return "dashed";
    case DashPattern::Dotted: return "dotted";
    }
    return "solid";
}

} // namespace graph_model
