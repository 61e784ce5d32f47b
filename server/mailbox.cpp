// mailbox.cpp
#include "mailbox.hpp"
#include "logger.hpp"
#include "protocol.hpp"

void to_json(nlohmann::json& j, const MailboxMessage& message) {
    j = nlohmann::json{
        {"side", message.side},
        {"phase", message.phase},
        {"body", message.body},
        {"serverRx", message.server_rx},
        {"id", message.msg_id}
    };
}

const char* release_status_name(ReleaseStatus status) {
    return status == ReleaseStatus::Deleted ? "deleted" : "waiting";
}

Mailbox::Mailbox(std::string channel_id) : channel_id_(std::move(channel_id)) {}

void Mailbox::add_claim(const std::string& side) {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    claims_.insert(side);
    Logger::instance().debug("Mailbox claimed", { {"channel", channel_id_}, {"side", side}, {"claims", static_cast<uint64_t>(claims_.size())} });
}

ReleaseStatus Mailbox::release(const std::string& side) {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    auto it = claims_.find(side);
    if (it == claims_.end()) {
        throw ProtocolError(ErrorKind::NotClaimed, "must claim channel before releasing");
    }
    claims_.erase(it);
    if (!claims_.empty()) return ReleaseStatus::Waiting;

    close_locked();
    return ReleaseStatus::Deleted;
}

void Mailbox::close_locked() {
    closed_ = true;
    Logger::instance().info("Mailbox deleted", { {"channel", channel_id_}, {"messages", static_cast<uint64_t>(message_log_.size())}, {"subscribers", static_cast<uint64_t>(subscribers_.size())} });
    for (auto& kv : subscribers_) {
        if (auto subscriber = kv.second.lock()) subscriber->mailbox_closed(channel_id_);
    }
    subscribers_.clear();
    message_log_.clear();
    message_log_.shrink_to_fit();
}

void Mailbox::subscribe(const std::shared_ptr<MailboxSubscriber>& subscriber) {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    for (const auto& message : message_log_) subscriber->deliver(channel_id_, message);
    subscribers_[subscriber.get()] = subscriber;
    Logger::instance().debug("Mailbox watched", { {"channel", channel_id_}, {"replayed", static_cast<uint64_t>(message_log_.size())}, {"subscribers", static_cast<uint64_t>(subscribers_.size())} });
}

void Mailbox::unsubscribe(const MailboxSubscriber* subscriber) {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    subscribers_.erase(subscriber);
}

void Mailbox::add_message(MailboxMessage message) {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    message_log_.push_back(std::move(message));
    const MailboxMessage& stored = message_log_.back();
    Logger::instance().debug("Message added", { {"channel", channel_id_}, {"side", stored.side}, {"phase", stored.phase}, {"body_len", static_cast<uint64_t>(stored.body.size())} });

    for (auto it = subscribers_.begin(); it != subscribers_.end();) {
        if (auto subscriber = it->second.lock()) {
            subscriber->deliver(channel_id_, stored);
            ++it;
        } else {
            // session went away without unsubscribing
            it = subscribers_.erase(it);
        }
    }
}

std::size_t Mailbox::claim_count() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return claims_.size();
}

std::size_t Mailbox::distinct_sides() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    std::size_t count = 0;
    for (auto it = claims_.begin(); it != claims_.end(); it = claims_.upper_bound(*it)) ++count;
    return count;
}

bool Mailbox::has_claim(const std::string& side) const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return claims_.count(side) != 0;
}

std::size_t Mailbox::message_count() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return message_log_.size();
}

std::size_t Mailbox::subscriber_count() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return subscribers_.size();
}

std::vector<MailboxMessage> Mailbox::messages() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return message_log_;
}

bool Mailbox::closed() const {
    std::lock_guard<std::mutex> lk(mailbox_mutex_);
    return closed_;
}
