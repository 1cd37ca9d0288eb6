#include <gtest/gtest.h>
#include <core/config.hpp>
#include <core/constants.hpp>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST(Config, ParsesNamespaces) {
    auto result = Config::parse(R"(
marker: cronwrap
log_file: /var/log/lifeline.log
namespaces:
  nightly:
    description: Nightly export
    command: ./export.sh --full
    prereqs: [setup:run, warm:run]
    directory: /srv/app
  setup:
    command: ./prepare.sh
    prereqs: env
)");
    ASSERT_TRUE(result.is_ok()) << result.error;
    const Config& c = result.value;

    EXPECT_EQ(c.marker(), "cronwrap");
    EXPECT_EQ(c.log_file(), "/var/log/lifeline.log");
    ASSERT_EQ(c.namespaces().size(), 2u);

    const auto& nightly = c.namespaces()[0];
    EXPECT_EQ(nightly.name, "nightly");
    EXPECT_EQ(nightly.description, "Nightly export");
    EXPECT_EQ(nightly.command, "./export.sh --full");
    EXPECT_EQ(nightly.prereqs, (std::vector<std::string>{"setup:run", "warm:run"}));
    EXPECT_EQ(nightly.directory, "/srv/app");

    const auto* setup = c.find_namespace("setup");
    ASSERT_NE(setup, nullptr);
    EXPECT_EQ(setup->prereqs, std::vector<std::string>{"env"});
    EXPECT_TRUE(setup->directory.empty());
    EXPECT_EQ(c.find_namespace("missing"), nullptr);
}

TEST(Config, Defaults) {
    auto result = Config::parse("namespaces:\n  job:\n    command: true\n");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.marker(), DEFAULT_RUNTIME_MARKER);
    EXPECT_TRUE(result.value.log_file().empty());
    EXPECT_TRUE(result.value.namespaces()[0].prereqs.empty());
}

TEST(Config, RejectsBadYaml) {
    auto result = Config::parse("namespaces: [unclosed\n", "broken.yaml");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("broken.yaml"), std::string::npos);
}

TEST(Config, RejectsMissingNamespaces) {
    EXPECT_TRUE(Config::parse("marker: lifeline\n").is_err());
    EXPECT_TRUE(Config::parse("namespaces: [a, b]\n").is_err());
    EXPECT_TRUE(Config::parse("namespaces: {}\n").is_err());
    EXPECT_TRUE(Config::parse("- just\n- a list\n").is_err());
}

TEST(Config, RejectsNamespaceWithoutCommand) {
    auto result = Config::parse("namespaces:\n  job:\n    description: nothing to run\n");
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("job"), std::string::npos);
}

TEST(Config, RejectsNamespaceWithWhitespace) {
    EXPECT_TRUE(Config::parse("namespaces:\n  \"two words\":\n    command: true\n").is_err());
}

class ConfigFileTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        test_dir = fs::temp_directory_path() / "lifeline_config_test";
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }
};

TEST_F(ConfigFileTest, LoadProject) {
    std::ofstream(test_dir / "lifeline.yaml") << "namespaces:\n  job:\n    command: echo hi\n";

    EXPECT_TRUE(project_config_exists(test_dir));
    auto result = Config::load_project(test_dir);
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.path(), test_dir / "lifeline.yaml");
    EXPECT_EQ(result.value.namespaces()[0].command, "echo hi");
}

TEST_F(ConfigFileTest, MissingProjectFile) {
    EXPECT_FALSE(project_config_exists(test_dir));
    auto result = Config::load_project(test_dir);
    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error.find("lifeline.yaml"), std::string::npos);
}

TEST_F(ConfigFileTest, LoadExplicitFile) {
    std::ofstream(test_dir / "other.yml") << "namespaces:\n  other:\n    command: 'true'\n";
    auto result = Config::load_file(test_dir / "other.yml");
    ASSERT_TRUE(result.is_ok()) << result.error;
    EXPECT_EQ(result.value.namespaces()[0].name, "other");

    EXPECT_TRUE(Config::load_file(test_dir / "nope.yml").is_err());
}
