#include "toolwire/schema.hpp"
#include "toolwire/error.hpp"
#include <cmath>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <stdexcept>
#include <unordered_map>

namespace toolwire::schema {

namespace {

using Json = nlohmann::json;

bool is_type(const Json& inst, const std::string& type) {
    if (type == "object") return inst.is_object();
    if (type == "array") return inst.is_array();
    if (type == "string") return inst.is_string();
    if (type == "number") return inst.is_number();
    if (type == "integer") {
        if (inst.is_number_integer()) return true;
        // 3.0 is an integer in JSON Schema
        if (inst.is_number_float()) {
            double d = inst.get<double>();
            return std::isfinite(d) && d == std::floor(d);
        }
        return false;
    }
    if (type == "boolean") return inst.is_boolean();
    if (type == "null") return inst.is_null();
    return true;
}

std::string escape_pointer_token(const std::string& token) {
    std::string out;
    for (char c : token) {
        if (c == '~') out += "~0";
        else if (c == '/') out += "~1";
        else out += c;
    }
    return out;
}

std::string display(const std::string& pointer) {
    return pointer.empty() ? "/" : pointer;
}

// Non-negative integer keyword such as minLength, if present.
std::optional<size_t> count_keyword(const Json& schema, const char* key) {
    if (!schema.contains(key)) return std::nullopt;
    const auto& v = schema.at(key);
    if (!v.is_number_integer() || v.get<long long>() < 0) return std::nullopt;
    return static_cast<size_t>(v.get<long long>());
}

// UTF-8 code points, which is what JSON Schema lengths count.
size_t utf8_length(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if ((c & 0xC0) != 0x80) ++n;
    }
    return n;
}

// Patterns come from registered schemas, so the cache is bounded by them.
// std::regex is safe to share for matching once constructed.
std::shared_ptr<const std::regex> cached_regex(const std::string& pattern) {
    static std::mutex mutex;
    static std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache;
    std::lock_guard<std::mutex> lock(mutex);
    auto it = cache.find(pattern);
    if (it != cache.end()) return it->second;
    auto re = std::make_shared<const std::regex>(pattern, std::regex::ECMAScript);
    cache.emplace(pattern, re);
    return re;
}

class Validator {
public:
    std::vector<std::string> errors;

    void run(const Json& schema, const Json& inst, const std::string& ptr) {
        if (schema.is_boolean()) {
            if (!schema.get<bool>()) fail(ptr, "no value is allowed here");
            return;
        }
        if (!schema.is_object()) return;

        if (!check_type(schema, inst, ptr)) return;

        if (schema.contains("enum") && schema.at("enum").is_array()) {
            bool found = false;
            for (const auto& candidate : schema.at("enum")) {
                if (candidate == inst) { found = true; break; }
            }
            if (!found) fail(ptr, "value is not one of " + schema.at("enum").dump());
        }
        if (schema.contains("const") && schema.at("const") != inst) {
            fail(ptr, "value must be " + schema.at("const").dump());
        }

        if (inst.is_number()) check_number(schema, inst, ptr);
        if (inst.is_string()) check_string(schema, inst, ptr);
        if (inst.is_array()) check_array(schema, inst, ptr);
        if (inst.is_object()) check_object(schema, inst, ptr);

        check_combinators(schema, inst, ptr);
    }

private:
    void fail(const std::string& ptr, const std::string& msg) {
        errors.push_back(display(ptr) + ": " + msg);
    }

    bool check_type(const Json& schema, const Json& inst, const std::string& ptr) {
        if (!schema.contains("type")) return true;
        const auto& t = schema.at("type");
        if (t.is_string()) {
            if (is_type(inst, t.get<std::string>())) return true;
            fail(ptr, "expected " + t.get<std::string>() + ", got " + inst.type_name());
            return false;
        }
        if (t.is_array()) {
            for (const auto& alt : t) {
                if (alt.is_string() && is_type(inst, alt.get<std::string>())) return true;
            }
            fail(ptr, "expected one of " + t.dump() + ", got " + inst.type_name());
            return false;
        }
        return true;
    }

    void check_number(const Json& schema, const Json& inst, const std::string& ptr) {
        double v = inst.get<double>();
        if (schema.contains("minimum") && schema.at("minimum").is_number()
            && v < schema.at("minimum").get<double>()) {
            fail(ptr, "must be >= " + schema.at("minimum").dump());
        }
        if (schema.contains("maximum") && schema.at("maximum").is_number()
            && v > schema.at("maximum").get<double>()) {
            fail(ptr, "must be <= " + schema.at("maximum").dump());
        }
        if (schema.contains("exclusiveMinimum") && schema.at("exclusiveMinimum").is_number()
            && v <= schema.at("exclusiveMinimum").get<double>()) {
            fail(ptr, "must be > " + schema.at("exclusiveMinimum").dump());
        }
        if (schema.contains("exclusiveMaximum") && schema.at("exclusiveMaximum").is_number()
            && v >= schema.at("exclusiveMaximum").get<double>()) {
            fail(ptr, "must be < " + schema.at("exclusiveMaximum").dump());
        }
    }

    void check_string(const Json& schema, const Json& inst, const std::string& ptr) {
        const auto& s = inst.get_ref<const std::string&>();
        size_t len = utf8_length(s);
        if (auto limit = count_keyword(schema, "minLength"); limit && len < *limit) {
            fail(ptr, "shorter than " + std::to_string(*limit) + " characters");
        }
        if (auto limit = count_keyword(schema, "maxLength"); limit && len > *limit) {
            fail(ptr, "longer than " + std::to_string(*limit) + " characters");
        }
        if (schema.contains("pattern") && schema.at("pattern").is_string()) {
            const auto& pattern = schema.at("pattern").get_ref<const std::string&>();
            // The regex engine recurses per input character.
            if (s.size() > MAX_PATTERN_INPUT_BYTES) {
                fail(ptr, "longer than " + std::to_string(MAX_PATTERN_INPUT_BYTES)
                              + " bytes, too long to match pattern " + pattern);
                return;
            }
            try {
                if (!std::regex_search(s, *cached_regex(pattern))) {
                    fail(ptr, "does not match pattern " + pattern);
                }
            } catch (const std::regex_error&) {
                fail(ptr, "schema pattern is not a valid regular expression: " + pattern);
            }
        }
    }

    void check_array(const Json& schema, const Json& inst, const std::string& ptr) {
        if (auto limit = count_keyword(schema, "minItems"); limit && inst.size() < *limit) {
            fail(ptr, "fewer than " + std::to_string(*limit) + " items");
        }
        if (auto limit = count_keyword(schema, "maxItems"); limit && inst.size() > *limit) {
            fail(ptr, "more than " + std::to_string(*limit) + " items");
        }
        if (schema.contains("items") && (schema.at("items").is_object() || schema.at("items").is_boolean())) {
            for (size_t i = 0; i < inst.size(); ++i) {
                run(schema.at("items"), inst.at(i), ptr + "/" + std::to_string(i));
            }
        }
    }

    void check_object(const Json& schema, const Json& inst, const std::string& ptr) {
        if (schema.contains("required") && schema.at("required").is_array()) {
            for (const auto& req : schema.at("required")) {
                if (!req.is_string()) continue;
                const auto& key = req.get_ref<const std::string&>();
                if (!inst.contains(key)) {
                    fail(ptr + "/" + escape_pointer_token(key), "required property is missing");
                }
            }
        }

        const Json* properties = nullptr;
        if (schema.contains("properties") && schema.at("properties").is_object()) {
            properties = &schema.at("properties");
        }

        for (const auto& [name, value] : inst.items()) {
            std::string child = ptr + "/" + escape_pointer_token(name);
            if (properties && properties->contains(name)) {
                run(properties->at(name), value, child);
            } else if (schema.contains("additionalProperties")) {
                const auto& extra = schema.at("additionalProperties");
                if (extra.is_boolean() && !extra.get<bool>()) {
                    fail(child, "additional property is not allowed");
                } else if (extra.is_object()) {
                    run(extra, value, child);
                }
            }
        }
    }

    void check_combinators(const Json& schema, const Json& inst, const std::string& ptr) {
        if (schema.contains("allOf") && schema.at("allOf").is_array()) {
            for (const auto& sub : schema.at("allOf")) run(sub, inst, ptr);
        }
        if (schema.contains("anyOf") && schema.at("anyOf").is_array()) {
            bool any = false;
            for (const auto& sub : schema.at("anyOf")) {
                if (collect_errors(sub, inst).empty()) { any = true; break; }
            }
            if (!any) fail(ptr, "does not match any schema in anyOf");
        }
        if (schema.contains("oneOf") && schema.at("oneOf").is_array()) {
            int matches = 0;
            for (const auto& sub : schema.at("oneOf")) {
                if (collect_errors(sub, inst).empty()) ++matches;
            }
            if (matches != 1) {
                fail(ptr, "must match exactly one schema in oneOf, matched " + std::to_string(matches));
            }
        }
    }
};

} // anonymous namespace

std::vector<std::string> collect_errors(const nlohmann::json& schema,
                                        const nlohmann::json& instance) {
    Validator v;
    v.run(schema, instance, "");
    return std::move(v.errors);
}

void validate(const nlohmann::json& schema, const nlohmann::json& instance) {
    auto errors = collect_errors(schema, instance);
    if (!errors.empty()) {
        std::string msg = "Invalid arguments: " + errors.front();
        if (errors.size() > 1) msg += " (and " + std::to_string(errors.size() - 1) + " more)";
        throw ValidationError(msg, std::move(errors));
    }
}

void check_schema(const nlohmann::json& schema) {
    if (!schema.is_object() && !schema.is_boolean()) {
        throw std::invalid_argument("schema must be an object or boolean");
    }
    if (!schema.is_object()) return;
    if (schema.contains("type")) {
        const auto& t = schema.at("type");
        if (!t.is_string() && !t.is_array()) {
            throw std::invalid_argument("schema 'type' must be a string or array");
        }
    }
    if (schema.contains("pattern") && schema.at("pattern").is_string()) {
        const auto& pattern = schema.at("pattern").get_ref<const std::string&>();
        try {
            (void)cached_regex(pattern);
        } catch (const std::regex_error& e) {
            throw std::invalid_argument("schema 'pattern' is not a valid regular expression: "
                                        + pattern + " (" + e.what() + ")");
        }
    }

    auto check_subschema = [](const Json& sub) {
        if (sub.is_object() || sub.is_boolean()) check_schema(sub);
    };
    if (schema.contains("properties") && schema.at("properties").is_object()) {
        for (const auto& sub : schema.at("properties")) check_schema(sub);
    }
    if (schema.contains("items")) check_subschema(schema.at("items"));
    if (schema.contains("additionalProperties")) check_subschema(schema.at("additionalProperties"));
    for (const char* key : {"allOf", "anyOf", "oneOf"}) {
        if (!schema.contains(key) || !schema.at(key).is_array()) continue;
        for (const auto& sub : schema.at(key)) check_schema(sub);
    }
}

} // namespace toolwire::schema
