#pragma once

#include <render_surface/surface.hpp>
#include <memory>

namespace render_surface {

// ARGB raster target backed by plutovg, scaled by dpi / 96, encoded as PNG.
// Throws SurfaceError if the size is not finite, exceeds 16384 px per side
// after dpi scaling, or the pixel buffer cannot be allocated.
std::unique_ptr<Surface> make_raster_surface(double width, double height, const SurfaceOptions& options);

} // namespace render_surface
