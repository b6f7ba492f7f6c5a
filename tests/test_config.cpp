#include <gtest/gtest.h>
#include <core/config.hpp>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "prettify_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    fs::path write_config(const std::string& content) {
        auto path = test_dir / "config.yaml";
        std::ofstream(path) << content;
        return path;
    }
};

TEST_F(ConfigTest, LoadsFullFile) {
    auto path = write_config(R"(
prettifier:
  enabled: false
  respect_alternate_screen: false
detection:
  scope: command_output
  confidence_threshold: 0.75
  max_scan_lines: 200
  debounce_ms: 250
  blank_line_threshold: 3
cache:
  max_entries: 16
max_active_blocks: 32
claude_code:
  auto_detect: false
  show_format_badges: false
renderers:
  json:
    enabled: true
    priority: 70
  diff:
    enabled: false
log_path: /tmp/prettify.log
)");

    auto result = Config::load(path);
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& pc = result.value.prettifier();

    EXPECT_FALSE(pc.enabled);
    EXPECT_FALSE(pc.respect_alternate_screen);
    EXPECT_EQ(pc.detection_scope, DetectionScope::CommandOutput);
    EXPECT_FLOAT_EQ(pc.confidence_threshold, 0.75f);
    EXPECT_EQ(pc.max_scan_lines, 200u);
    EXPECT_EQ(pc.debounce_ms, 250u);
    EXPECT_EQ(pc.blank_line_threshold, 3u);
    EXPECT_EQ(pc.cache_max_entries, 16u);
    EXPECT_EQ(pc.max_active_blocks, 32u);
    EXPECT_FALSE(pc.claude_code.auto_detect);
    EXPECT_FALSE(pc.claude_code.show_format_badges);
    EXPECT_TRUE(pc.claude_code.auto_render_on_expand);
    EXPECT_EQ(pc.formats.json.priority, 70);
    EXPECT_FALSE(pc.formats.diff.enabled);
    EXPECT_EQ(pc.formats.diff.priority, 60);
    EXPECT_EQ(result.value.log_path(), std::optional<std::string>("/tmp/prettify.log"));

    BoundaryConfig bc = pc.boundary();
    EXPECT_EQ(bc.scope, DetectionScope::CommandOutput);
    EXPECT_EQ(bc.debounce_ms, 250u);
}

TEST_F(ConfigTest, EmptyDocumentGivesDefaults) {
    auto result = Config::parse("");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& pc = result.value.prettifier();

    EXPECT_TRUE(pc.enabled);
    EXPECT_EQ(pc.detection_scope, DetectionScope::All);
    EXPECT_FLOAT_EQ(pc.confidence_threshold, 0.6f);
    EXPECT_EQ(pc.max_scan_lines, DEFAULT_MAX_SCAN_LINES);
    EXPECT_EQ(pc.cache_max_entries, DEFAULT_CACHE_SIZE);
    EXPECT_EQ(pc.max_active_blocks, MAX_ACTIVE_BLOCKS);
    EXPECT_FALSE(result.value.log_path().has_value());
}

TEST_F(ConfigTest, PartialSectionsKeepDefaults) {
    auto result = Config::parse("detection:\n  debounce_ms: 40\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.prettifier().debounce_ms, 40u);
    EXPECT_EQ(result.value.prettifier().blank_line_threshold, DEFAULT_BLANK_THRESHOLD);
}

TEST_F(ConfigTest, RendererShorthand) {
    auto result = Config::parse("renderers:\n  json: false\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_FALSE(result.value.prettifier().formats.json.enabled);
    EXPECT_EQ(result.value.prettifier().formats.json.priority, 50);
    EXPECT_TRUE(result.value.prettifier().formats.diff.enabled);
}

TEST_F(ConfigTest, RejectsInvalidValues) {
    auto scope = Config::parse("detection:\n  scope: sometimes\n");
    ASSERT_TRUE(scope.is_err());
    EXPECT_NE(scope.error.find("sometimes"), std::string::npos);

    EXPECT_TRUE(Config::parse("detection:\n  confidence_threshold: 1.5\n").is_err());
    EXPECT_TRUE(Config::parse("detection:\n  max_scan_lines: 0\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST_F(ConfigTest, MalformedYaml) {
    auto path = write_config("prettifier: [unclosed\n");
    auto result = Config::load(path);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find(path.string()), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = Config::load(test_dir / "nope.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("not found"), std::string::npos);
}

TEST_F(ConfigTest, ScopeNamesRoundTrip) {
    for (auto scope : {DetectionScope::All, DetectionScope::CommandOutput, DetectionScope::ManualOnly}) {
        EXPECT_EQ(parse_detection_scope(detection_scope_name(scope)), scope);
    }
    EXPECT_FALSE(parse_detection_scope("ALL").has_value());
}

TEST_F(ConfigTest, DefaultGlobalConfigIsCreatedOnce) {
    const char* old_home = std::getenv("HOME");
    std::string saved = old_home ? old_home : "";
    setenv("HOME", test_dir.c_str(), 1);

    EXPECT_FALSE(global_config_exists());
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_TRUE(global_config_exists());
    EXPECT_EQ(get_global_config_path(), test_dir / ".prettify" / "config.yaml");

    auto loaded = Config::load_global();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    EXPECT_EQ(loaded.value.prettifier().formats.diff.priority, 60);

    // Existing file is left alone.
    std::ofstream(get_global_config_path()) << "max_active_blocks: 7\n";
    ASSERT_TRUE(create_default_global_config().is_ok());
    EXPECT_EQ(Config::load_global().value.prettifier().max_active_blocks, 7u);

    if (old_home) setenv("HOME", saved.c_str(), 1);
    else unsetenv("HOME");
}
