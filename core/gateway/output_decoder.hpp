#pragma once

#include <yaml-cpp/yaml.h>

#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace mup1gw {
namespace gateway {

/**
 * @brief Tool output that parsed as a single YAML (or JSON) document.
 */
struct StructuredOutput {
    nlohmann::ordered_json value;
};

/**
 * @brief Tool output returned verbatim because it did not parse.
 */
struct RawOutput {
    std::string text;
};

using DecodedOutput = std::variant<StructuredOutput, RawOutput>;

/**
 * @brief Two-stage decode: try YAML, otherwise keep the text.
 *
 * Never throws. Scalars follow the YAML 1.1 resolver (the same rules
 * PyYAML's safe loader applies), so `yes` becomes true and `0x1F` becomes 31.
 * Multi-document streams, unknown tags and collection keys yield RawOutput.
 *
 * @param text Already trimmed tool output
 */
DecodedOutput decode_output(const std::string &text);

/**
 * @brief Convert a parsed YAML node to JSON.
 *
 * @param node Node to convert
 * @param out Populated on success
 * @param error Reason when the node has no JSON rendering
 * @return true on success
 */
bool yaml_to_json(const YAML::Node &node, nlohmann::ordered_json &out, std::string &error);

}  // namespace gateway
}  // namespace mup1gw
