#pragma once

#include <graph_model/fingerprint.hpp>
#include <graph_model/style.hpp>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace render_cache {

// Immutable encoded image, shared by the cache and every caller that asked for it.
struct RenderArtifact {
    std::vector<std::uint8_t> bytes;
    std::string content_type;
    graph_model::ImageFormat format = graph_model::ImageFormat::Svg;
    int width = 0;
    int height = 0;
    graph_model::Fingerprint fingerprint;

    std::size_t size_bytes() const { return bytes.size(); }
};

using ArtifactPtr = std::shared_ptr<const RenderArtifact>;

} // namespace render_cache
