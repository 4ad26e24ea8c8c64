#include <gtest/gtest.h>
#include "../src/config.hpp"
#include "../src/exception.hpp"
#include "support/test_env.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    fs::path test_dir;
    fs::path config_path;

    void SetUp() override {
        init_test_localization();
        unsetenv("DSFETCH_TEST_KEY");
        test_dir = fs::absolute("tmp_config_test");
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
        config_path = test_dir / "nested" / "dsfetch.conf";
    }

    void TearDown() override {
        unsetenv("DSFETCH_TEST_KEY");
        if (fs::exists(test_dir)) fs::remove_all(test_dir);
    }
};

TEST_F(ConfigTest, MissingFileHasNoValues) {
    Config config(config_path);
    EXPECT_FALSE(config.get("DSFETCH_TEST_KEY").has_value());
    EXPECT_EQ(config.get("DSFETCH_TEST_KEY", "fallback"), "fallback");
}

TEST_F(ConfigTest, SetPersistsAndCreatesDirectory) {
    Config config(config_path);
    config.set("DSFETCH_TEST_KEY", "/data/sets");

    EXPECT_TRUE(fs::exists(config_path));
    EXPECT_FALSE(fs::exists(config_path.string() + ".tmp"));
    EXPECT_EQ(Config(config_path).get("DSFETCH_TEST_KEY"), "/data/sets");
}

TEST_F(ConfigTest, SetReplacesAndUnsetRemoves) {
    Config config(config_path);
    config.set("DSFETCH_TEST_KEY", "one");
    config.set("OTHER_KEY", "kept");
    config.set("DSFETCH_TEST_KEY", "two");
    EXPECT_EQ(config.get("DSFETCH_TEST_KEY"), "two");

    config.set("DSFETCH_TEST_KEY", std::nullopt);
    EXPECT_FALSE(config.get("DSFETCH_TEST_KEY").has_value());
    EXPECT_EQ(config.get("OTHER_KEY"), "kept");
}

TEST_F(ConfigTest, EnvironmentTakesPrecedence) {
    Config config(config_path);
    config.set("DSFETCH_TEST_KEY", "from_file");
    setenv("DSFETCH_TEST_KEY", "from_env", 1);
    EXPECT_EQ(config.get("DSFETCH_TEST_KEY"), "from_env");
}

TEST_F(ConfigTest, ParsesCommentsAndWhitespace) {
    fs::create_directories(config_path.parent_path());
    std::ofstream f(config_path);
    f << "# data location\n";
    f << "  DSFETCH_TEST_KEY = /srv/data  \n";
    f << "garbage line\n";
    f.close();

    EXPECT_EQ(Config(config_path).get("DSFETCH_TEST_KEY"), "/srv/data");
}

TEST_F(ConfigTest, RequireExplainsMissingKey) {
    Config config(config_path);
    try {
        config.require("DSFETCH_TEST_KEY");
        FAIL() << "Expected DsfetchException";
    } catch (const DsfetchException& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("DSFETCH_TEST_KEY"), std::string::npos);
        EXPECT_NE(msg.find(config_path.string()), std::string::npos);
    }
}

TEST_F(ConfigTest, RejectsMalformedKeys) {
    Config config(config_path);
    EXPECT_THROW(config.set("", "x"), InvalidRequestError);
    EXPECT_THROW(config.set("A=B", "x"), InvalidRequestError);
}

TEST_F(ConfigTest, KnownKeys) {
    EXPECT_TRUE(is_known_config_key(DATA_DIR_KEY));
    EXPECT_TRUE(is_known_config_key(CHUNK_SIZE_KEY));
    EXPECT_FALSE(is_known_config_key("DSFETCH_TEST_KEY"));
}

TEST_F(ConfigTest, DefaultPathFollowsHome) {
    const char* old_home = std::getenv("HOME");
    std::string saved = old_home ? old_home : "";
    setenv("HOME", test_dir.c_str(), 1);
    EXPECT_EQ(default_config_path(), test_dir / ".dsfetch" / "dsfetch.conf");
    if (old_home) {
        setenv("HOME", saved.c_str(), 1);
    } else {
        unsetenv("HOME");
    }
}
