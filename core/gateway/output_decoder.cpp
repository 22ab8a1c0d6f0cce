#include "output_decoder.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <initializer_list>
#include <limits>
#include <vector>

#include "logging/logger.hpp"

namespace mup1gw {
namespace gateway {

namespace {
constexpr const char *kCoreTagPrefix = "tag:yaml.org,2002:";
constexpr int kMaxDepth = 256;

// YAML 1.1 implicit resolvers (sexagesimal and timestamp forms stay strings).
// Hand-written scanners: tool output may carry scalars of any length.
bool is_digit_in(char c, int base) {
    switch (base) {
        case 2:
            return c == '0' || c == '1';
        case 8:
            return c >= '0' && c <= '7';
        case 10:
            return c >= '0' && c <= '9';
        default:
            return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    }
}

// Scans digits of base (or '_') from pos; returns the index of the first other character
size_t scan_digits(const std::string &text, size_t pos, int base, bool allow_underscore) {
    while (pos < text.size() && (is_digit_in(text[pos], base) || (allow_underscore && text[pos] == '_'))) {
        ++pos;
    }
    return pos;
}

size_t skip_sign(const std::string &text) {
    return !text.empty() && (text[0] == '-' || text[0] == '+') ? 1 : 0;
}

bool is_null_text(const std::string &text) {
    return text.empty() || text == "~" || text == "null" || text == "Null" || text == "NULL";
}

bool is_bool_text(const std::string &text) {
    static const char *const kForms[] = {"yes",  "Yes",  "YES",   "no",    "No",    "NO",
                                         "true", "True", "TRUE",  "false", "False", "FALSE",
                                         "on",   "On",   "ON",    "off",   "Off",   "OFF"};
    for (const char *form : kForms) {
        if (text == form) {
            return true;
        }
    }
    return false;
}

// [-+]? (0b[01_]+ | 0[0-7_]+ | 0 | [1-9][0-9_]* | 0x[0-9a-fA-F_]+)
bool is_int_text(const std::string &text) {
    const size_t start = skip_sign(text);
    const size_t n = text.size();
    if (start >= n) {
        return false;
    }
    if (text[start] != '0') {
        return text[start] >= '1' && text[start] <= '9' && scan_digits(text, start + 1, 10, true) == n;
    }
    if (start + 1 == n) {
        return true;
    }
    const char marker = text[start + 1];
    if (marker == 'b' || marker == 'x') {
        const size_t digits = start + 2;
        return digits < n && scan_digits(text, digits, marker == 'b' ? 2 : 16, true) == n;
    }
    return scan_digits(text, start + 1, 8, true) == n;
}

// [-+]? [0-9][0-9_]* . [0-9_]* ([eE][-+][0-9]+)?
// [-+]? . [0-9_]+ ([eE][-+][0-9]+)?
// [-+]? .inf | .nan (three spellings each)
bool is_float_text(const std::string &text) {
    if (text == ".nan" || text == ".NaN" || text == ".NAN") {
        return true;
    }

    size_t pos = skip_sign(text);
    const size_t n = text.size();
    for (const char *inf : {".inf", ".Inf", ".INF"}) {
        if (text.compare(pos, std::string::npos, inf) == 0) {
            return true;
        }
    }
    if (pos >= n) {
        return false;
    }

    if (is_digit_in(text[pos], 10)) {
        pos = scan_digits(text, pos + 1, 10, true);
        if (pos >= n || text[pos] != '.') {
            return false;
        }
        pos = scan_digits(text, pos + 1, 10, true);
    } else if (text[pos] == '.') {
        const size_t fraction = pos + 1;
        pos = scan_digits(text, fraction, 10, true);
        if (pos == fraction) {
            return false;
        }
    } else {
        return false;
    }

    if (pos == n) {
        return true;
    }
    if ((text[pos] != 'e' && text[pos] != 'E') || pos + 1 >= n || (text[pos + 1] != '-' && text[pos + 1] != '+')) {
        return false;
    }
    const size_t exponent = pos + 2;
    pos = scan_digits(text, exponent, 10, false);
    return pos > exponent && pos == n;
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

int digit_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    return std::tolower(static_cast<unsigned char>(c)) - 'a' + 10;
}

bool resolve_bool(const std::string &text, nlohmann::ordered_json &out) {
    const std::string lowered = to_lower(text);
    if (lowered == "yes" || lowered == "true" || lowered == "on") {
        out = true;
        return true;
    }
    if (lowered == "no" || lowered == "false" || lowered == "off") {
        out = false;
        return true;
    }
    return false;
}

bool resolve_int(std::string text, nlohmann::ordered_json &out) {
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());

    bool negative = false;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        negative = text[0] == '-';
        text.erase(0, 1);
    }

    int base = 10;
    if (text.rfind("0b", 0) == 0) {
        base = 2;
        text.erase(0, 2);
    } else if (text.rfind("0x", 0) == 0) {
        base = 16;
        text.erase(0, 2);
    } else if (text.size() > 1 && text[0] == '0') {
        base = 8;
        text.erase(0, 1);
    }
    if (text.empty()) {
        return false;
    }

    errno = 0;
    char *end = nullptr;
    const unsigned long long magnitude = std::strtoull(text.c_str(), &end, base);
    if (end == nullptr || *end != '\0') {
        return false;
    }

    if (errno == ERANGE) {
        // Wider than 64 bits: keep the magnitude approximately
        double approx = 0.0;
        for (char c : text) {
            approx = approx * base + digit_value(c);
        }
        out = negative ? -approx : approx;
        return true;
    }

    constexpr auto kInt64Max = static_cast<unsigned long long>(std::numeric_limits<int64_t>::max());
    if (negative) {
        if (magnitude <= kInt64Max) {
            out = -static_cast<int64_t>(magnitude);
        } else if (magnitude == kInt64Max + 1) {
            out = std::numeric_limits<int64_t>::min();
        } else {
            out = -static_cast<double>(magnitude);
        }
    } else if (magnitude <= kInt64Max) {
        out = static_cast<int64_t>(magnitude);
    } else {
        out = static_cast<uint64_t>(magnitude);
    }
    return true;
}

bool resolve_float(std::string text, nlohmann::ordered_json &out) {
    text.erase(std::remove(text.begin(), text.end(), '_'), text.end());

    const std::string lowered = to_lower(text);
    if (lowered.size() >= 4 && lowered.compare(lowered.size() - 4, 4, ".inf") == 0) {
        out = lowered[0] == '-' ? -std::numeric_limits<double>::infinity() : std::numeric_limits<double>::infinity();
        return true;
    }
    if (lowered == ".nan") {
        out = std::numeric_limits<double>::quiet_NaN();
        return true;
    }

    char *end = nullptr;
    const double value = std::strtod(text.c_str(), &end);
    if (end == text.c_str() || *end != '\0') {
        return false;
    }
    out = value;
    return true;
}

bool resolve_plain(const std::string &text, nlohmann::ordered_json &out, std::string &error) {
    if (is_null_text(text)) {
        out = nullptr;
        return true;
    }
    if (is_bool_text(text)) {
        return resolve_bool(text, out);
    }
    if (is_int_text(text)) {
        if (!resolve_int(text, out)) {
            error = "Invalid integer: " + text;
            return false;
        }
        return true;
    }
    if (is_float_text(text)) {
        if (!resolve_float(text, out)) {
            error = "Invalid float: " + text;
            return false;
        }
        return true;
    }
    out = text;
    return true;
}

bool resolve_scalar(const std::string &tag, const std::string &text, nlohmann::ordered_json &out,
                    std::string &error) {
    if (tag == "!") {
        // Quoted scalar
        out = text;
        return true;
    }
    if (tag.empty() || tag == "?") {
        return resolve_plain(text, out, error);
    }

    const std::string prefix = kCoreTagPrefix;
    if (tag.compare(0, prefix.size(), prefix) != 0) {
        error = "Unsupported tag: " + tag;
        return false;
    }

    const std::string kind = tag.substr(prefix.size());
    if (kind == "str") {
        out = text;
        return true;
    }
    if (kind == "null") {
        out = nullptr;
        return true;
    }
    if (kind == "bool") {
        if (!resolve_bool(text, out)) {
            error = "Invalid bool: " + text;
            return false;
        }
        return true;
    }
    if (kind == "int") {
        if (!is_int_text(text) || !resolve_int(text, out)) {
            error = "Invalid integer: " + text;
            return false;
        }
        return true;
    }
    if (kind == "float") {
        if (is_float_text(text) && resolve_float(text, out)) {
            return true;
        }
        if (is_int_text(text) && resolve_int(text, out)) {
            out = out.get<double>();
            return true;
        }
        error = "Invalid float: " + text;
        return false;
    }

    error = "Unsupported tag: " + tag;
    return false;
}

bool collection_tag_ok(const std::string &tag, const char *kind) {
    return tag.empty() || tag == "?" || tag == "!" || tag == std::string(kCoreTagPrefix) + kind;
}

bool convert(const YAML::Node &node, nlohmann::ordered_json &out, std::string &error, int depth) {
    if (depth > kMaxDepth) {
        error = "Document nested deeper than " + std::to_string(kMaxDepth) + " levels";
        return false;
    }

    switch (node.Type()) {
        case YAML::NodeType::Null:
            if (node.Tag() == std::string(kCoreTagPrefix) + "str" || node.Tag() == "!") {
                out = "";
            } else {
                out = nullptr;
            }
            return true;

        case YAML::NodeType::Scalar:
            return resolve_scalar(node.Tag(), node.Scalar(), out, error);

        case YAML::NodeType::Sequence: {
            if (!collection_tag_ok(node.Tag(), "seq")) {
                error = "Unsupported tag: " + node.Tag();
                return false;
            }
            nlohmann::ordered_json array = nlohmann::ordered_json::array();
            for (const auto &item : node) {
                nlohmann::ordered_json value;
                if (!convert(item, value, error, depth + 1)) {
                    return false;
                }
                array.push_back(std::move(value));
            }
            out = std::move(array);
            return true;
        }

        case YAML::NodeType::Map: {
            if (!collection_tag_ok(node.Tag(), "map")) {
                error = "Unsupported tag: " + node.Tag();
                return false;
            }
            nlohmann::ordered_json object = nlohmann::ordered_json::object();
            for (const auto &entry : node) {
                const YAML::Node &key = entry.first;
                if (!key.IsScalar() && !key.IsNull()) {
                    error = "Mapping keys must be scalars";
                    return false;
                }

                nlohmann::ordered_json key_json;
                if (!convert(key, key_json, error, depth + 1)) {
                    return false;
                }
                // JSON object keys are strings; other scalars use their JSON text
                const std::string key_text = key_json.is_string() ? key_json.get<std::string>() : key_json.dump();

                nlohmann::ordered_json value;
                if (!convert(entry.second, value, error, depth + 1)) {
                    return false;
                }
                object[key_text] = std::move(value);
            }
            out = std::move(object);
            return true;
        }

        default:
            error = "Undefined YAML node";
            return false;
    }
}
}  // namespace

bool yaml_to_json(const YAML::Node &node, nlohmann::ordered_json &out, std::string &error) {
    return convert(node, out, error, 0);
}

DecodedOutput decode_output(const std::string &text) {
    std::vector<YAML::Node> documents;
    try {
        documents = YAML::LoadAll(text);
    } catch (const YAML::Exception &e) {
        LOG_DEBUG("[Decoder] Not YAML, returning raw output: " << e.what());
        return RawOutput{text};
    }

    if (documents.empty()) {
        return StructuredOutput{nullptr};
    }
    if (documents.size() > 1) {
        LOG_DEBUG("[Decoder] " << documents.size() << " YAML documents, returning raw output");
        return RawOutput{text};
    }

    nlohmann::ordered_json value;
    std::string error;
    try {
        if (!yaml_to_json(documents.front(), value, error)) {
            LOG_DEBUG("[Decoder] YAML has no JSON form (" << error << "), returning raw output");
            return RawOutput{text};
        }
    } catch (const std::exception &e) {
        LOG_DEBUG("[Decoder] YAML conversion failed (" << e.what() << "), returning raw output");
        return RawOutput{text};
    }

    return StructuredOutput{std::move(value)};
}

}  // namespace gateway
}  // namespace mup1gw
