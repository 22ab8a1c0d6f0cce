#include <gtest/gtest.h>
#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>
#include <string>

/**
 * @brief Infrastructure tests verify build system, dependencies, and basic features work.
 * These are not feature tests - they validate the foundation the codebase depends on.
 */

TEST(InfrastructureTest, JsonParsingWorks) {
    // nlohmann/json carries every HTTP response body
    const char *json_str = R"({"key":"value","number":42,"flag":true})";

    auto parsed = nlohmann::json::parse(json_str);
    EXPECT_EQ(parsed["key"], "value");
    EXPECT_EQ(parsed["number"], 42);
    EXPECT_TRUE(parsed["flag"]);
}

TEST(InfrastructureTest, OrderedJsonKeepsInsertionOrder) {
    // Tool output keys are reported in document order
    nlohmann::ordered_json obj = nlohmann::ordered_json::object();
    obj["zeta"] = 1;
    obj["alpha"] = 2;
    EXPECT_EQ(obj.dump(), R"({"zeta":1,"alpha":2})");
}

TEST(InfrastructureTest, YamlParsingWorks) {
    // yaml-cpp parses both config files and tool output
    YAML::Node node = YAML::Load("a: 1\nlist: [x, y]\n");
    ASSERT_TRUE(node.IsMap());
    EXPECT_EQ(node["a"].as<int>(), 1);
    ASSERT_TRUE(node["list"].IsSequence());
    EXPECT_EQ(node["list"].size(), 2u);
}

TEST(InfrastructureTest, YamlReportsQuotedScalarsWithNonSpecificTag) {
    // The output decoder relies on "!" marking quoted scalars and "?" plain ones
    YAML::Node node = YAML::Load("quoted: \"1\"\nplain: 1\n");
    EXPECT_EQ(node["quoted"].Tag(), "!");
    EXPECT_EQ(node["plain"].Tag(), "?");
}
