// mailbox.hpp
#pragma once
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct MailboxMessage {
    std::string side;
    std::string phase;
    std::string body;       // hex text
    double server_rx = 0;   // epoch seconds
    nlohmann::json msg_id;  // echoed back to clients, null if absent
};

void to_json(nlohmann::json& j, const MailboxMessage& message);

// Something watching a mailbox. Both calls happen with the mailbox locked,
// so implementations must only queue output and never call back into it.
class MailboxSubscriber {
public:
    virtual ~MailboxSubscriber() = default;
    virtual void deliver(const std::string& channel_id, const MailboxMessage& message) = 0;
    virtual void mailbox_closed(const std::string& channel_id) = 0;
};

enum class ReleaseStatus { Waiting, Deleted };

const char* release_status_name(ReleaseStatus status);

// A claimed channel: the ordered message log, the claims held on it, and the
// sessions watching it. Deleted when the last claim is released.
class Mailbox {
public:
    explicit Mailbox(std::string channel_id);

    const std::string& channel_id() const { return channel_id_; }

    void add_claim(const std::string& side);

    // Drops one claim held by side. When none are left the mailbox closes:
    // subscribers get mailbox_closed() and the log is discarded.
    // Throws ProtocolError(NotClaimed) if side holds no claim.
    ReleaseStatus release(const std::string& side);

    // Replays the whole log to subscriber, then registers it for future
    // messages, in one critical section. Watching again re-registers and
    // replays again.
    void subscribe(const std::shared_ptr<MailboxSubscriber>& subscriber);
    void unsubscribe(const MailboxSubscriber* subscriber);

    // Appends and fans out to the subscribers registered at this moment.
    void add_message(MailboxMessage message);

    std::size_t claim_count() const;
    std::size_t distinct_sides() const;
    bool has_claim(const std::string& side) const;
    std::size_t message_count() const;
    std::size_t subscriber_count() const;
    std::vector<MailboxMessage> messages() const;
    bool closed() const;

private:
    void close_locked();

    mutable std::mutex mailbox_mutex_;
    const std::string channel_id_;
    std::multiset<std::string> claims_;
    std::vector<MailboxMessage> message_log_;
    std::map<const MailboxSubscriber*, std::weak_ptr<MailboxSubscriber>> subscribers_;
    bool closed_ = false;
};
