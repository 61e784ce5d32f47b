// protocol.cpp
#include "protocol.hpp"
#include <chrono>

using json = nlohmann::json;

namespace {

// "claim requires 'channelId'" style errors for absent or non-string fields.
std::string require_string(const json& msg, const std::string& type, const char* field) {
    auto it = msg.find(field);
    if (it == msg.end()) {
        throw ProtocolError(ErrorKind::MissingField, type + " requires '" + field + "'");
    }
    if (!it->is_string()) {
        throw ProtocolError(ErrorKind::BadField, type + " requires string '" + field + "'");
    }
    return it->get<std::string>();
}

std::string require_body_field(const json& msg, const char* field) {
    auto it = msg.find(field);
    if (it == msg.end()) {
        throw ProtocolError(ErrorKind::MissingField, std::string("missing '") + field + "'");
    }
    if (!it->is_string()) {
        throw ProtocolError(ErrorKind::BadField, std::string("'") + field + "' must be a string");
    }
    return it->get<std::string>();
}

json optional_field(const json& msg, const char* field) {
    auto it = msg.find(field);
    return it == msg.end() ? json() : *it;
}

} // namespace

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MissingType:      return "missing_type";
        case ErrorKind::UnknownType:      return "unknown_type";
        case ErrorKind::MissingField:     return "missing_field";
        case ErrorKind::BadField:         return "bad_field";
        case ErrorKind::AlreadyBound:     return "already_bound";
        case ErrorKind::NotBound:         return "not_bound";
        case ErrorKind::AlreadyAllocated: return "already_allocated";
        case ErrorKind::NotClaimed:       return "not_claimed";
        case ErrorKind::BadFrame:         return "bad_frame";
    }
    return "unknown";
}

std::string command_type(const json& msg) {
    if (!msg.is_object()) {
        throw ProtocolError(ErrorKind::BadFrame, "invalid JSON");
    }
    auto it = msg.find("type");
    if (it == msg.end()) {
        throw ProtocolError(ErrorKind::MissingType, "missing 'type'");
    }
    if (!it->is_string()) {
        throw ProtocolError(ErrorKind::UnknownType, "Unknown type");
    }
    return it->get<std::string>();
}

bool command_requires_bind(const std::string& type) {
    return type != "ping" && type != "bind";
}

Command decode_command(const json& msg) {
    const std::string type = command_type(msg);

    if (type == "ping") {
        auto it = msg.find("ping");
        if (it == msg.end()) {
            throw ProtocolError(ErrorKind::MissingField, "ping requires 'ping'");
        }
        return PingCmd{*it};
    }
    if (type == "bind") {
        BindCmd cmd;
        cmd.app_id = require_string(msg, type, "appId");
        cmd.side = require_string(msg, type, "side");
        return cmd;
    }
    if (type == "list") {
        return ListCmd{};
    }
    if (type == "allocate") {
        return AllocateCmd{};
    }
    if (type == "claim") {
        return ClaimCmd{require_string(msg, type, "channelId")};
    }
    if (type == "watch") {
        return WatchCmd{require_string(msg, type, "channelId")};
    }
    if (type == "add") {
        AddCmd cmd;
        cmd.channel_id = require_string(msg, type, "channelId");
        cmd.phase = require_body_field(msg, "phase");
        cmd.body = require_body_field(msg, "body");
        // older clients only put their correlation id in "id"
        cmd.msg_id = msg.contains("msgId") ? msg["msgId"] : optional_field(msg, "id");
        return cmd;
    }
    if (type == "release") {
        ReleaseCmd cmd;
        cmd.channel_id = require_string(msg, type, "channelId");
        cmd.mood = optional_field(msg, "mood");
        return cmd;
    }

    throw ProtocolError(ErrorKind::UnknownType, "Unknown type");
}

double now_seconds() {
    using namespace std::chrono;
    auto since_epoch = system_clock::now().time_since_epoch();
    return duration_cast<duration<double>>(since_epoch).count();
}

json make_response(const std::string& type, json fields) {
    fields["type"] = type;
    fields["serverTx"] = now_seconds();
    return fields;
}
