#pragma once

#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace graph_model {

// SHA-256 over the canonical serialization of a (Graph, Style) pair.
struct Fingerprint {
    std::array<std::uint8_t, 32> digest{};

    std::string hex() const;
    // Layout seed: first 8 digest bytes, big-endian.
    std::uint64_t seed() const;

    friend bool operator==(const Fingerprint&, const Fingerprint&) = default;
};

struct FingerprintHash {
    std::size_t operator()(const Fingerprint& fp) const;
};

// Throws std::runtime_error if the digest backend fails.
Fingerprint compute_fingerprint(const Graph& graph, const Style& style);

// Accepts 64 hex digits (either case).
std::optional<Fingerprint> parse_fingerprint(std::string_view hex);

} // namespace graph_model
