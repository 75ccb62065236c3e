#include <graph_model/fingerprint.hpp>
#include <mbedtls/sha256.h>
#include <bit>
#include <cstring>
#include <stdexcept>
#include <string>

namespace graph_model {

namespace {

const char* const canonical_version = "clipper-fingerprint/1";

// Streams length-prefixed fields into SHA-256 so that field boundaries are unambiguous.
class CanonicalHasher {
public:
    CanonicalHasher() {
        mbedtls_sha256_init(&ctx_);
        check(mbedtls_sha256_starts(&ctx_, 0), "starts");
    }

    ~CanonicalHasher() {
        mbedtls_sha256_free(&ctx_);
    }

    CanonicalHasher(const CanonicalHasher&) = delete;
    CanonicalHasher& operator=(const CanonicalHasher&) = delete;

    void tag(char t) {
        const unsigned char b = static_cast<unsigned char>(t);
        update(&b, 1);
    }

    void u64(std::uint64_t v) {
        unsigned char buf[8];
        for (int i = 0; i < 8; ++i)
            buf[i] = static_cast<unsigned char>((v >> (8 * i)) & 0xffu);
        update(buf, sizeof(buf));
    }

    void i64(std::int64_t v) { u64(static_cast<std::uint64_t>(v)); }

    void f64(double v) {
        if (v == 0.0) v = 0.0; // fold -0.0
        u64(std::bit_cast<std::uint64_t>(v));
    }

    void boolean(bool v) { tag(v ? 1 : 0); }

    void str(std::string_view s) {
        u64(s.size());
        update(reinterpret_cast<const unsigned char*>(s.data()), s.size());
    }

    void color(const Color& c) {
        const unsigned char buf[4] = { c.r, c.g, c.b, c.a };
        update(buf, sizeof(buf));
    }

    Fingerprint finish() {
        Fingerprint fp;
        check(mbedtls_sha256_finish(&ctx_, fp.digest.data()), "finish");
        return fp;
    }

private:
    void update(const unsigned char* data, std::size_t len) {
        if (len == 0) return;
        check(mbedtls_sha256_update(&ctx_, data, len), "update");
    }

    static void check(int rc, const char* step) {
        if (rc != 0)
            throw std::runtime_error(std::string("sha256 ") + step + " failed, rc=" + std::to_string(rc));
    }

    mbedtls_sha256_context ctx_;
};

void hash_node(CanonicalHasher& h, const Node& n) {
    h.tag('N');
    h.str(n.id);
    h.str(n.label);
    h.tag(static_cast<char>(n.shape));
    h.f64(n.width);
    h.f64(n.height);
    h.color(n.style.fill);
    h.color(n.style.border);
    h.f64(n.style.border_width);
    h.color(n.style.text);
}

void hash_edge(CanonicalHasher& h, const Edge& e) {
    h.tag('E');
    h.str(e.source_node_id);
    h.str(e.target_node_id);
    h.boolean(e.directed);
    h.color(e.style.color);
    h.f64(e.style.width);
    h.tag(static_cast<char>(e.style.dash));
    h.tag(static_cast<char>(e.style.arrow));
    h.str(e.label);
}

void hash_style(CanonicalHasher& h, const Style& s) {
    h.tag('S');
    h.color(s.background);
    h.str(s.font_family);
    h.f64(s.font_size);
    h.tag(static_cast<char>(s.edge_routing));
    h.i64(s.dpi);
    h.tag(static_cast<char>(s.layout));
    h.tag(static_cast<char>(s.rank_direction));
    h.tag(static_cast<char>(s.format));
    h.f64(s.node_spacing);
    h.f64(s.rank_spacing);
    h.f64(s.margin);
    h.i64(s.force_iterations);
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string Fingerprint::hex() const {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(digest.size() * 2);
    for (std::uint8_t b : digest) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0f]);
    }
    return out;
}

std::uint64_t Fingerprint::seed() const {
    std::uint64_t v = 0;
    for (std::size_t i = 0; i < 8; ++i)
        v = (v << 8) | digest[i];
    return v;
}

std::size_t FingerprintHash::operator()(const Fingerprint& fp) const {
    std::size_t v = 0;
    std::memcpy(&v, fp.digest.data() + 8, sizeof(v));
    return v;
}

Fingerprint compute_fingerprint(const Graph& graph, const Style& style) {
    CanonicalHasher h;
    h.str(canonical_version);
    h.u64(graph.node_count());
    for (const auto& n : graph.nodes())
        hash_node(h, n);
    h.u64(graph.edge_count());
    for (const auto& e : graph.edges())
        hash_edge(h, e);
    hash_style(h, style);
    return h.finish();
}

std::optional<Fingerprint> parse_fingerprint(std::string_view hex) {
    Fingerprint fp;
    if (hex.size() != fp.digest.size() * 2) return std::nullopt;
    for (std::size_t i = 0; i < fp.digest.size(); ++i) {
        const int hi = hex_value(hex[2 * i]);
        const int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        fp.digest[i] = static_cast<std::uint8_t>(hi * 16 + lo);
    }
    return fp;
}

} // namespace graph_model
