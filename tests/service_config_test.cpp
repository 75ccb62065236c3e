#include <gtest/gtest.h>
#include <render_service/config.hpp>
#include <chrono>

using namespace render_service;

TEST(ServiceConfigTest, EmptyObjectKeepsDefaults) {
    const auto c = load_service_config_from_json_string("{}");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->cache_budget_bytes, 64u * 1024u * 1024u);
    EXPECT_EQ(c->worker_threads, 0u);
    EXPECT_EQ(c->layout_timeout, std::chrono::milliseconds(5000));
    EXPECT_EQ(c->render_timeout, std::chrono::milliseconds(10000));
    EXPECT_EQ(c->font_paths, default_font_paths());
    EXPECT_EQ(c->log.level, "info");
}

TEST(ServiceConfigTest, ReadsEveryKey) {
    const auto c = load_service_config_from_json_string(R"({
        "cache_budget_bytes": 1024,
        "worker_threads": 3,
        "layout_timeout_ms": 250,
        "render_timeout_ms": 500,
        "layout_iteration_budget": 1000,
        "font_paths": ["/a.ttf", "/b.ttf"],
        "log_level": "debug",
        "log_file": "clipper.log"
    })");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->cache_budget_bytes, 1024u);
    EXPECT_EQ(c->worker_threads, 3u);
    EXPECT_EQ(c->layout_timeout, std::chrono::milliseconds(250));
    EXPECT_EQ(c->render_timeout, std::chrono::milliseconds(500));
    EXPECT_EQ(c->layout_iteration_budget, 1000);
    EXPECT_EQ(c->font_paths, (std::vector<std::string>{ "/a.ttf", "/b.ttf" }));
    EXPECT_EQ(c->log.level, "debug");
    EXPECT_EQ(c->log.file, "clipper.log");
}

TEST(ServiceConfigTest, RejectsBadValues) {
    EXPECT_FALSE(load_service_config_from_json_string("nope").has_value());
    EXPECT_FALSE(load_service_config_from_json_string("[]").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"cache_budget_bytes": -1})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"worker_threads": 5000})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"layout_timeout_ms": 0})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"render_timeout_ms": 1.5})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"layout_iteration_budget": 0})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"font_paths": "/a.ttf"})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"font_paths": [1]})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"log_level": "chatty"})").has_value());
}

TEST(ServiceConfigTest, TimeoutsAreCappedAtOneDay) {
    const auto day = load_service_config_from_json_string(R"({"layout_timeout_ms": 86400000})");
    ASSERT_TRUE(day.has_value());
    EXPECT_EQ(day->layout_timeout, std::chrono::hours(24));

    EXPECT_FALSE(load_service_config_from_json_string(R"({"layout_timeout_ms": 86400001})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"render_timeout_ms": 9300000000000})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"render_timeout_ms": 18446744073709551615})").has_value());
    EXPECT_FALSE(load_service_config_from_json_string(R"({"render_timeout_ms": -5})").has_value());
}

TEST(ServiceConfigTest, OffIsAValidLevel) {
    const auto c = load_service_config_from_json_string(R"({"log_level": "off"})");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->log.level, "off");
}

TEST(ServiceConfigTest, LoadsBundledConfig) {
    const auto c = load_service_config_from_json_file("data/config.json");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->worker_threads, 4u);
    EXPECT_FALSE(load_service_config_from_json_file("data/missing.json").has_value());
}
