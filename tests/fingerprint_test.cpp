#include <gtest/gtest.h>
#include <graph_model/fingerprint.hpp>
#include <graph_model/graph.hpp>
#include <graph_model/style.hpp>
#include <cctype>
#include <set>
#include <string>

using namespace graph_model;

namespace {

Graph make_chain(const char* second_label = "B") {
    GraphBuilder b;
    NodeAttributes a;
    a.label = "A";
    NodeAttributes bb;
    bb.label = second_label;
    b.add_node("a", a).add_node("b", bb);
    b.add_edge("a", "b");
    return b.finalize();
}

} // namespace

TEST(FingerprintTest, EqualInputsGiveEqualFingerprints) {
    const Style style;
    const auto fp1 = compute_fingerprint(make_chain(), style);
    const auto fp2 = compute_fingerprint(make_chain(), style);
    EXPECT_EQ(fp1, fp2);
    EXPECT_EQ(fp1.hex(), fp2.hex());
    EXPECT_EQ(fp1.hex().size(), 64u);
}

TEST(FingerprintTest, EveryStyleFieldMatters) {
    const Graph g = make_chain();
    std::set<std::string> seen;
    auto add = [&](const Style& s) { return seen.insert(compute_fingerprint(g, s).hex()).second; };

    Style base;
    ASSERT_TRUE(add(base));

    Style s = base; s.background = Color{ 0, 0, 0, 255 }; EXPECT_TRUE(add(s));
    s = base; s.font_family = "serif"; EXPECT_TRUE(add(s));
    s = base; s.font_size = 15.0; EXPECT_TRUE(add(s));
    s = base; s.edge_routing = EdgeRouting::Curved; EXPECT_TRUE(add(s));
    s = base; s.dpi = 192; EXPECT_TRUE(add(s));
    s = base; s.layout = LayoutAlgorithm::ForceDirected; EXPECT_TRUE(add(s));
    s = base; s.rank_direction = RankDirection::LeftToRight; EXPECT_TRUE(add(s));
    s = base; s.format = ImageFormat::Png; EXPECT_TRUE(add(s));
    s = base; s.node_spacing = 41.0; EXPECT_TRUE(add(s));
    s = base; s.rank_spacing = 61.0; EXPECT_TRUE(add(s));
    s = base; s.margin = 0.0; EXPECT_TRUE(add(s));
    s = base; s.force_iterations = 301; EXPECT_TRUE(add(s));
}

TEST(FingerprintTest, GraphContentMatters) {
    const Style style;
    EXPECT_NE(compute_fingerprint(make_chain("B"), style), compute_fingerprint(make_chain("C"), style));

    GraphBuilder b1;
    b1.add_node("a").add_node("b");
    GraphBuilder b2;
    b2.add_node("b").add_node("a");
    EXPECT_NE(compute_fingerprint(b1.finalize(), style), compute_fingerprint(b2.finalize(), style));
}

TEST(FingerprintTest, FieldBoundariesAreUnambiguous) {
    const Style style;
    NodeAttributes x;
    x.label = "ab";
    GraphBuilder b1;
    b1.add_node("a", x);
    NodeAttributes z;
    z.label = "b";
    GraphBuilder b2;
    b2.add_node("aa", z);
    EXPECT_NE(compute_fingerprint(b1.finalize(), style), compute_fingerprint(b2.finalize(), style));
}

TEST(FingerprintTest, SeedIsLeadingDigestBytes) {
    Fingerprint fp;
    for (std::size_t i = 0; i < fp.digest.size(); ++i) fp.digest[i] = static_cast<std::uint8_t>(i + 1);
    EXPECT_EQ(fp.seed(), 0x0102030405060708ull);
}

TEST(FingerprintTest, ParseAcceptsHexOfEitherCase) {
    const auto fp = compute_fingerprint(make_chain(), Style{});
    const std::string hex = fp.hex();
    EXPECT_EQ(parse_fingerprint(hex), fp);

    std::string upper = hex;
    for (auto& c : upper) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    EXPECT_EQ(parse_fingerprint(upper), fp);

    EXPECT_FALSE(parse_fingerprint(hex.substr(1)).has_value());
    EXPECT_FALSE(parse_fingerprint(std::string(64, 'g')).has_value());
    EXPECT_FALSE(parse_fingerprint("").has_value());
}
