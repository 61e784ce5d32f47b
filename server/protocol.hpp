// protocol.hpp
#pragma once
#include <stdexcept>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>

// Every way a client command can be rejected. None of them end the connection.
enum class ErrorKind {
    MissingType,
    UnknownType,
    MissingField,
    BadField,
    AlreadyBound,
    NotBound,
    AlreadyAllocated,
    NotClaimed,
    BadFrame
};

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(ErrorKind kind, const std::string& explain)
        : std::runtime_error(explain), kind_(kind) {}
    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

const char* error_kind_name(ErrorKind kind);

// Inbound commands, decoded once from the JSON frame.
struct PingCmd {
    nlohmann::json ping;
};

struct BindCmd {
    std::string app_id;
    std::string side;
};

struct ListCmd {};

struct AllocateCmd {};

struct ClaimCmd {
    std::string channel_id;
};

struct WatchCmd {
    std::string channel_id;
};

struct AddCmd {
    std::string channel_id;
    std::string phase;
    std::string body;       // hex text, opaque to the relay
    nlohmann::json msg_id;  // null when the client sent none
};

struct ReleaseCmd {
    std::string channel_id;
    nlohmann::json mood;    // logged, never interpreted
};

using Command = std::variant<PingCmd, BindCmd, ListCmd, AllocateCmd,
                             ClaimCmd, WatchCmd, AddCmd, ReleaseCmd>;

// Returns the "type" of an inbound frame; throws MissingType / BadFrame.
std::string command_type(const nlohmann::json& msg);

// ping and bind are the only commands accepted before bind.
bool command_requires_bind(const std::string& type);

// Throws ProtocolError for an unknown type or a missing/mistyped field.
// Unrecognized extra keys are ignored.
Command decode_command(const nlohmann::json& msg);

// Seconds since the epoch, fractional.
double now_seconds();

// Adds "type" and "serverTx" to an outbound object.
nlohmann::json make_response(const std::string& type, nlohmann::json fields = nlohmann::json::object());
