// session.hpp
#pragma once
#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "mailbox.hpp"
#include "protocol.hpp"

class AppRegistry;
class Directory;

// Where a session's output goes: the transport adapter in the server, a
// recorder in tests. Both calls may come from any thread.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;
    virtual void send_text(std::string json_text) = 0;
    // close the connection once everything sent so far is written
    virtual void request_close() = 0;
};

// Protocol state of one connection: bind, claims, watches, allocation.
class Session : public MailboxSubscriber, public std::enable_shared_from_this<Session> {
public:
    Session(AppRegistry& apps, std::shared_ptr<ResponseSink> sink, nlohmann::json welcome);

    // Sends the welcome message.
    void start();

    // One inbound frame. Every failure is answered with an "error" response.
    void handle_text(const std::string& payload, double server_rx);
    void handle_message(const nlohmann::json& msg, double server_rx);

    // Disconnect: stops watching and drops the sink. Claims are kept.
    void close();

    void deliver(const std::string& channel_id, const MailboxMessage& message) override;
    void mailbox_closed(const std::string& channel_id) override;

    bool is_bound() const { return static_cast<bool>(app_); }
    bool is_closed() const { return closed_; }
    const std::string& app_id() const { return app_id_; }
    const std::string& side() const { return side_; }
    std::vector<std::string> claimed_channels() const;

private:
    struct Dispatch;

    void handle_ping(const PingCmd& cmd);
    void handle_bind(const BindCmd& cmd);
    void handle_list(const ListCmd& cmd);
    void handle_allocate(const AllocateCmd& cmd);
    void handle_claim(const ClaimCmd& cmd);
    void handle_watch(const WatchCmd& cmd);
    void handle_add(const AddCmd& cmd, double server_rx);
    void handle_release(const ReleaseCmd& cmd);

    std::shared_ptr<Mailbox> claimed_mailbox(const std::string& channel_id, const char* action) const;
    void send(const std::string& type, nlohmann::json fields = nlohmann::json::object());

    AppRegistry& apps_;
    const nlohmann::json welcome_;

    std::mutex sink_mutex_;
    std::shared_ptr<ResponseSink> sink_;
    std::atomic<bool> closed_{false};

    std::shared_ptr<Directory> app_;
    std::string app_id_;
    std::string side_;
    bool did_allocate_ = false; // one allocate per connection
    std::map<std::string, std::shared_ptr<Mailbox>> claimed_;
    std::map<std::string, std::weak_ptr<Mailbox>> watched_;
};
