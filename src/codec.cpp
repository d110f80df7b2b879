#include "toolwire/codec.hpp"
#include "toolwire/error.hpp"
#include "toolwire/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <cstdint>
#include <limits>
#include <string>

namespace toolwire {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            auto as_int = val.get_int64();
            if (as_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_int.value());
            }
            auto as_uint = val.get_uint64();
            if (as_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(as_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_json(std::string_view raw) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw ParseError(error::ParseError,
                         std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    try {
        // Scalar documents cannot be iterated as values; they are never messages.
        auto type = doc.type().value();
        if (type != simdjson::ondemand::json_type::object &&
            type != simdjson::ondemand::json_type::array) {
            throw ParseError(error::InvalidRequest, "Message must be a JSON object");
        }
        auto val = doc.get_value();
        if (val.error()) {
            throw ParseError(error::ParseError,
                             std::string("JSON parse error: ") + simdjson::error_message(val.error()));
        }
        nlohmann::json j = simdjson_to_nlohmann(val.value());
        // On-demand parsing is lazy: trailing content is only detected here.
        if (!doc.at_end()) {
            throw ParseError(error::ParseError, "JSON parse error: trailing content");
        }
        return j;
    } catch (const simdjson::simdjson_error& e) {
        throw ParseError(error::ParseError, std::string("JSON parse error: ") + e.what());
    }
}

// Unsigned values above INT64_MAX would wrap when stored in a RequestId.
bool id_out_of_range(const nlohmann::json& id) {
    return id.is_number_unsigned()
        && id.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
}

std::optional<RequestId> recover_id(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("id")) return std::nullopt;
    const auto& id = j.at("id");
    if (id_out_of_range(id)) return std::nullopt;
    if (id.is_number_integer()) return RequestId{id.get<int64_t>()};
    if (id.is_string()) return RequestId{id.get<std::string>()};
    return std::nullopt;
}

} // anonymous namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto id = recover_id(j);
    auto invalid = [&id](const std::string& why) {
        return ParseError(error::InvalidRequest, why, id);
    };

    if (!j.contains("jsonrpc") || !j.at("jsonrpc").is_string()) {
        throw invalid("Missing 'jsonrpc' field");
    }
    if (j.at("jsonrpc").get<std::string>() != JSONRPC_VERSION) {
        throw invalid("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    if (has_method && !j.at("method").is_string()) {
        throw invalid("'method' must be a string");
    }
    if (j.contains("params") && !j.at("params").is_object() && !j.at("params").is_array()) {
        throw invalid("'params' must be an object or array");
    }

    if (has_id && id_out_of_range(j.at("id"))) {
        throw invalid("Request id is outside the signed 64-bit integer range");
    }

    if (has_method && has_id) {
        if (!id) {
            throw invalid("Request id must be an integer or string");
        }
        JsonRpcRequest req;
        req.id = *id;
        req.method = j.at("method").get<std::string>();
        if (j.contains("params")) req.params = j.at("params");
        return req;
    } else if (has_method) {
        JsonRpcNotification notif;
        notif.method = j.at("method").get<std::string>();
        if (j.contains("params")) notif.params = j.at("params");
        return notif;
    } else if (has_id) {
        bool has_result = j.contains("result");
        bool has_error = j.contains("error");
        if (has_result == has_error) {
            throw invalid("Response must carry exactly one of 'result' or 'error'");
        }
        JsonRpcResponse resp;
        resp.id = id;
        if (has_result) resp.result = j.at("result");
        if (has_error) {
            try {
                resp.error = j.at("error").get<JsonRpcError>();
            } catch (const nlohmann::json::exception& e) {
                throw invalid(std::string("Malformed error object: ") + e.what());
            }
        }
        return resp;
    }
    throw invalid("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError(error::ParseError, "Empty input");
    }

    nlohmann::json j = parse_json(raw);

    if (j.is_array()) {
        throw ParseError(error::InvalidRequest, "Batch messages are not supported");
    }
    if (!j.is_object()) {
        throw ParseError(error::InvalidRequest, "Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    // Invalid UTF-8 from a handler must not corrupt the stream.
    return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace toolwire
