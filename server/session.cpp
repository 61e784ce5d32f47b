// session.cpp
#include "session.hpp"
#include "app_registry.hpp"
#include "directory.hpp"
#include "logger.hpp"
#include <cstdint>

using json = nlohmann::json;

static std::string preview_text(const std::string& s, size_t maxlen = 200) {
    if (s.size() <= maxlen) return s;
    return s.substr(0, maxlen) + "...";
}

// Routes each command alternative to its handler; a new alternative without
// a handler here does not compile.
struct Session::Dispatch {
    Session& session;
    double server_rx;

    void operator()(const PingCmd& cmd) const { session.handle_ping(cmd); }
    void operator()(const BindCmd& cmd) const { session.handle_bind(cmd); }
    void operator()(const ListCmd& cmd) const { session.handle_list(cmd); }
    void operator()(const AllocateCmd& cmd) const { session.handle_allocate(cmd); }
    void operator()(const ClaimCmd& cmd) const { session.handle_claim(cmd); }
    void operator()(const WatchCmd& cmd) const { session.handle_watch(cmd); }
    void operator()(const AddCmd& cmd) const { session.handle_add(cmd, server_rx); }
    void operator()(const ReleaseCmd& cmd) const { session.handle_release(cmd); }
};

Session::Session(AppRegistry& apps, std::shared_ptr<ResponseSink> sink, json welcome)
    : apps_(apps), welcome_(std::move(welcome)), sink_(std::move(sink)) {
    Logger::instance().debug("Session constructed");
}

void Session::start() {
    send("welcome", { {"welcome", welcome_} });
}

void Session::handle_text(const std::string& payload, double server_rx) {
    json msg;
    try {
        msg = json::parse(payload);
    } catch (const json::parse_error& ex) {
        Logger::instance().warn("Bad JSON frame", { {"what", ex.what()}, {"side", side_}, {"payload_preview", preview_text(payload)} });
        send("error", { {"error", "invalid JSON"}, {"orig", payload} });
        return;
    }
    handle_message(msg, server_rx);
}

void Session::handle_message(const json& msg, double server_rx) {
    if (closed_) return;
    try {
        const std::string type = command_type(msg);
        // acked before anything else, whatever the outcome
        if (msg.contains("id")) send("ack", { {"id", msg["id"]} });

        if (command_requires_bind(type) && !is_bound()) {
            throw ProtocolError(ErrorKind::NotBound, "Must bind first");
        }
        Logger::instance().debug("Processing command", { {"type", type}, {"app", app_id_}, {"side", side_} });
        std::visit(Dispatch{*this, server_rx}, decode_command(msg));
    } catch (const ProtocolError& ex) {
        Logger::instance().warn("Command rejected", { {"kind", error_kind_name(ex.kind())}, {"error", ex.what()}, {"app", app_id_}, {"side", side_} });
        send("error", { {"error", ex.what()}, {"orig", msg} });
    }
}

void Session::handle_ping(const PingCmd& cmd) {
    send("pong", { {"pong", cmd.ping} });
}

void Session::handle_bind(const BindCmd& cmd) {
    if (is_bound()) {
        throw ProtocolError(ErrorKind::AlreadyBound, "already bound");
    }
    app_ = apps_.get_app(cmd.app_id);
    app_id_ = cmd.app_id;
    side_ = cmd.side;
    Logger::instance().info("Session bound", { {"app", app_id_}, {"side", side_} });
}

void Session::handle_list(const ListCmd&) {
    send("nameplates", { {"nameplates", app_->list_waiting()} });
}

void Session::handle_allocate(const AllocateCmd&) {
    if (did_allocate_) {
        throw ProtocolError(ErrorKind::AlreadyAllocated, "You already allocated one channel, don't be greedy");
    }
    Allocation allocation = app_->allocate(side_);
    did_allocate_ = true;
    claimed_[allocation.channel_id] = allocation.mailbox;
    send("nameplate", { {"nameplate", allocation.channel_id} });
}

void Session::handle_claim(const ClaimCmd& cmd) {
    if (claimed_.count(cmd.channel_id)) return;
    claimed_.emplace(cmd.channel_id, app_->claim(cmd.channel_id, side_));
    Logger::instance().info("Channel claimed", { {"app", app_id_}, {"channel", cmd.channel_id}, {"side", side_} });
}

void Session::handle_watch(const WatchCmd& cmd) {
    auto mailbox = claimed_mailbox(cmd.channel_id, "watching");
    watched_[cmd.channel_id] = mailbox;
    mailbox->subscribe(shared_from_this());
}

void Session::handle_add(const AddCmd& cmd, double server_rx) {
    auto mailbox = claimed_mailbox(cmd.channel_id, "adding");
    MailboxMessage message;
    message.side = side_;
    message.phase = cmd.phase;
    message.body = cmd.body;
    message.server_rx = server_rx;
    message.msg_id = cmd.msg_id;
    mailbox->add_message(std::move(message));
}

void Session::handle_release(const ReleaseCmd& cmd) {
    auto it = claimed_.find(cmd.channel_id);
    if (it == claimed_.end()) {
        throw ProtocolError(ErrorKind::NotClaimed, "must claim channel before releasing");
    }
    ReleaseStatus status = app_->release(it->second, side_);
    claimed_.erase(it);
    Logger::instance().info("Channel released", { {"app", app_id_}, {"channel", cmd.channel_id}, {"side", side_}, {"mood", cmd.mood}, {"status", release_status_name(status)} });
    send("released", { {"status", release_status_name(status)} });
}

std::shared_ptr<Mailbox> Session::claimed_mailbox(const std::string& channel_id, const char* action) const {
    auto it = claimed_.find(channel_id);
    if (it == claimed_.end()) {
        throw ProtocolError(ErrorKind::NotClaimed, std::string("must claim channel before ") + action);
    }
    return it->second;
}

void Session::deliver(const std::string& channel_id, const MailboxMessage& message) {
    send("message", { {"channelId", channel_id}, {"message", message} });
}

void Session::mailbox_closed(const std::string& channel_id) {
    Logger::instance().info("Watched mailbox deleted, closing connection", { {"app", app_id_}, {"channel", channel_id}, {"side", side_} });
    std::lock_guard<std::mutex> lk(sink_mutex_);
    if (sink_) sink_->request_close();
}

void Session::close() {
    if (closed_.exchange(true)) return;
    {
        std::lock_guard<std::mutex> lk(sink_mutex_);
        sink_.reset();
    }
    for (auto& kv : watched_) {
        if (auto mailbox = kv.second.lock()) mailbox->unsubscribe(this);
    }
    watched_.clear();
    // claims stay until released explicitly, even past disconnect
    Logger::instance().info("Session closed", { {"app", app_id_}, {"side", side_}, {"claims_kept", static_cast<uint64_t>(claimed_.size())} });
}

std::vector<std::string> Session::claimed_channels() const {
    std::vector<std::string> out;
    out.reserve(claimed_.size());
    for (const auto& kv : claimed_) out.push_back(kv.first);
    return out;
}

void Session::send(const std::string& type, json fields) {
    json response = make_response(type, std::move(fields));
    std::lock_guard<std::mutex> lk(sink_mutex_);
    if (!sink_) return;
    sink_->send_text(response.dump(-1, ' ', false, json::error_handler_t::replace));
}
