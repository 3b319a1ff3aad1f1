#include "capwire/codec.hpp"
#include "capwire/error.hpp"
#include "capwire/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace capwire {

namespace {

nlohmann::json to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(to_nlohmann(elem.value()));
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
        default:
            return nlohmann::json(nullptr);
    }
}

nlohmann::json parse_document(std::string_view raw) {
    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw FrameParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }
    try {
        auto val = doc.get_value();
        if (val.error()) {
            throw FrameParseError("Failed to get document value");
        }
        return to_nlohmann(val.value());
    } catch (const simdjson::simdjson_error& e) {
        throw FrameParseError(std::string("JSON conversion error: ") + e.what());
    }
}

} // namespace

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw FrameParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw FrameParseError("Invalid jsonrpc version, expected '2.0'");
    }

    bool has_id = j.contains("id");
    bool has_method = j.contains("method");

    try {
        if (has_method && !j.at("method").is_string()) {
            throw FrameParseError("'method' must be a string");
        }
        if (has_method && has_id) {
            if (j.at("id").is_null()) {
                throw FrameParseError("Request ID must not be null");
            }
            JsonRpcRequest req;
            from_json(j, req);
            return req;
        }
        if (has_method) {
            JsonRpcNotification notif;
            from_json(j, notif);
            return notif;
        }
        if (has_id) {
            if (j.at("id").is_null()) {
                throw FrameParseError("Response ID must not be null");
            }
            if (!j.contains("result") && !j.contains("error")) {
                throw FrameParseError("Response must carry 'result' or 'error'");
            }
            JsonRpcResponse resp;
            from_json(j, resp);
            return resp;
        }
    } catch (const nlohmann::json::exception& e) {
        throw FrameParseError(std::string("Invalid envelope: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw FrameParseError(e.what());
    }
    throw FrameParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    if (raw.empty()) {
        throw FrameParseError("Empty input");
    }
    nlohmann::json j = parse_document(raw);
    if (!j.is_object()) {
        throw FrameParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

std::optional<RequestId> Codec::recover_id(std::string_view raw) noexcept {
    auto j = nlohmann::json::parse(raw.begin(), raw.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object() || !j.contains("method")) return std::nullopt;
    auto it = j.find("id");
    if (it == j.end()) return std::nullopt;
    if (it->is_number_integer()) return RequestId{it->get<int64_t>()};
    if (it->is_string()) return RequestId{it->get<std::string>()};
    return std::nullopt;
}

} // namespace capwire
