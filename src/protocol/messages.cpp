#include "dxfer/protocol/messages.hpp"

#include <nlohmann/json.hpp>

#include <initializer_list>

namespace dxfer::protocol {

using json = nlohmann::json;

namespace {

Bytes to_bytes(const json& j) {
    const std::string text = j.dump();
    return Bytes(text.begin(), text.end());
}

Result<json> parse_object(const Bytes& payload, const char* what) {
    auto parsed = json::parse(payload.begin(), payload.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return Err<json>(ErrorKind::ProtocolViolation, std::string("malformed ") + what + " payload");
    }
    if (!parsed.is_object()) {
        return Err<json>(ErrorKind::ProtocolViolation, std::string(what) + " payload is not an object");
    }
    return Ok(std::move(parsed));
}

// Returns the first key of obj that is not listed in allowed, if any
std::optional<std::string> unknown_key(const json& obj, std::initializer_list<const char*> allowed) {
    for (const auto& item : obj.items()) {
        bool known = false;
        for (const char* key : allowed) {
            if (item.key() == key) {
                known = true;
                break;
            }
        }
        if (!known) {
            return item.key();
        }
    }
    return std::nullopt;
}

Result<std::string> require_string(const json& obj, const char* key, const char* what) {
    const auto it = obj.find(key);
    if (it == obj.end()) {
        return Err<std::string>(ErrorKind::ProtocolViolation,
            std::string(what) + " is missing '" + key + "'");
    }
    if (!it->is_string()) {
        return Err<std::string>(ErrorKind::ProtocolViolation,
            std::string(what) + " field '" + key + "' is not a string: " + it->dump());
    }
    return Ok(it->get<std::string>());
}

} // namespace

Bytes encode_header(const Header& header) {
    json j;
    j["type"] = header.type;
    j["name"] = header.name;
    j["size"] = header.size;
    if (header.compression) {
        j["compression"] = *header.compression;
    }
    return to_bytes(j);
}

Bytes encode_ack(const Ack& ack) {
    return to_bytes(json{{"ack", ack.ack}, {"sha256", ack.sha256}});
}

Bytes encode_control(const ControlMessage& message) {
    switch (message.kind) {
        case ControlKind::Done:
            return to_bytes(json{{"done", kDone}});
    }
    return to_bytes(json::object());
}

Result<Header> decode_header(const Bytes& payload) {
    auto parsed = parse_object(payload, "header");
    if (parsed.is_error()) {
        return Err<Header>(parsed.error());
    }
    const json& obj = parsed.value();

    auto type = require_string(obj, "type", "header");
    if (type.is_error()) {
        return Err<Header>(type.error());
    }
    if (type.value() != kFileType) {
        return Err<Header>(ErrorKind::ProtocolViolation,
            "unknown header.type '" + type.value() + "'");
    }

    if (const auto it = obj.find("compression"); it != obj.end()) {
        return Err<Header>(ErrorKind::ProtocolViolation,
            "unknown compression " + it->dump());
    }

    if (auto extra = unknown_key(obj, {"type", "name", "size"})) {
        return Err<Header>(ErrorKind::ProtocolViolation,
            "unexpected header field '" + *extra + "'");
    }

    auto name = require_string(obj, "name", "header");
    if (name.is_error()) {
        return Err<Header>(name.error());
    }

    const auto size_it = obj.find("size");
    if (size_it == obj.end()) {
        return Err<Header>(ErrorKind::ProtocolViolation, "header is missing 'size'");
    }
    // nlohmann stores every non-negative integer literal as unsigned
    if (!size_it->is_number_unsigned()) {
        return Err<Header>(ErrorKind::ProtocolViolation,
            "unknown size " + size_it->dump());
    }

    Header header;
    header.type = type.value();
    header.name = name.value();
    header.size = size_it->get<std::uint64_t>();
    return Ok(std::move(header));
}

Result<Ack> decode_ack(const Bytes& payload) {
    auto parsed = parse_object(payload, "ack");
    if (parsed.is_error()) {
        return Err<Ack>(parsed.error());
    }
    const json& obj = parsed.value();

    if (auto extra = unknown_key(obj, {"ack", "sha256"})) {
        return Err<Ack>(ErrorKind::ProtocolViolation, "unexpected ack field '" + *extra + "'");
    }

    auto value = require_string(obj, "ack", "ack");
    if (value.is_error()) {
        return Err<Ack>(value.error());
    }

    Ack ack;
    ack.ack = value.value();

    // A non-ok ack need not carry a digest
    if (obj.contains("sha256") || ack.ack == kAckOk) {
        auto digest = require_string(obj, "sha256", "ack");
        if (digest.is_error()) {
            return Err<Ack>(digest.error());
        }
        ack.sha256 = digest.value();
    }
    return Ok(std::move(ack));
}

Result<ControlMessage> decode_control(const Bytes& payload) {
    auto parsed = parse_object(payload, "control");
    if (parsed.is_error()) {
        return Err<ControlMessage>(parsed.error());
    }
    const json& obj = parsed.value();

    if (auto extra = unknown_key(obj, {"done"})) {
        return Err<ControlMessage>(ErrorKind::ProtocolViolation,
            "unknown control message field '" + *extra + "'");
    }

    auto done = require_string(obj, "done", "control message");
    if (done.is_error()) {
        return Err<ControlMessage>(done.error());
    }
    if (done.value() != kDone) {
        return Err<ControlMessage>(ErrorKind::ProtocolViolation,
            "unexpected done value '" + done.value() + "'");
    }
    return Ok(ControlMessage::done());
}

} // namespace dxfer::protocol
