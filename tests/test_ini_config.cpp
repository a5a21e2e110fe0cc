#include <gtest/gtest.h>

#include "trophdiv/config/IniConfig.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace trophdiv;

TEST(IniConfig, TypedGettersAndDefaults) {
    const IniConfig cfg = IniConfig::from_string(
        "# trophic run\n"
        "[input]\n"
        "abundance = \"data/ab.csv\"\n"
        "separator = tab\n"
        "missing = NA, -\n"
        "; comment\n"
        "[run]\n"
        "threads = 4\n"
        "profile = off\n");

    EXPECT_TRUE(cfg.has_section("input"));
    EXPECT_FALSE(cfg.has_section("output"));
    EXPECT_TRUE(cfg.has_key("run", "threads"));
    EXPECT_EQ(cfg.get_string("input", "abundance"), "data/ab.csv");
    EXPECT_EQ(cfg.get_char("input", "separator"), '\t');
    EXPECT_EQ(cfg.get_list("input", "missing"), (std::vector<std::string>{"NA", "-"}));
    EXPECT_EQ(cfg.get_int64("run", "threads"), 4);
    EXPECT_FALSE(cfg.get_bool("run", "profile"));
    EXPECT_EQ(cfg.get_string("output", "dir", std::optional<std::string>("./out")), "./out");
    EXPECT_EQ(cfg.get_char("output", "separator", std::optional<char>(',')), ',');
}

TEST(IniConfig, Errors) {
    const IniConfig cfg = IniConfig::from_string("[run]\nthreads = many\nprofile = maybe\nsep = ab\n");
    EXPECT_THROW(cfg.get_string("input", "abundance"), std::runtime_error);
    EXPECT_THROW(cfg.get_int64("run", "threads"), std::runtime_error);
    EXPECT_THROW(cfg.get_bool("run", "profile"), std::runtime_error);
    EXPECT_THROW(cfg.get_char("run", "sep"), std::runtime_error);

    EXPECT_THROW(IniConfig::from_string("key = value\n"), std::runtime_error);
    EXPECT_THROW(IniConfig::from_string("[]\n"), std::runtime_error);
    EXPECT_THROW(IniConfig::from_string("[a]\nno equals sign\n"), std::runtime_error);
    EXPECT_THROW(IniConfig("/nonexistent/trophdiv.ini"), std::runtime_error);
}
