// directory.cpp
#include "directory.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cstdint>

Directory::Directory(std::string app_id) : app_id_(std::move(app_id)) {}

std::vector<std::string> Directory::list_waiting() const {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    std::vector<std::string> out;
    for (const auto& kv : mailboxes_) {
        if (kv.second->distinct_sides() == 1) out.push_back(kv.first);
    }
    std::sort(out.begin(), out.end());
    return out;
}

std::string Directory::find_available_id_locked() const {
    for (std::uint64_t candidate = 1;; ++candidate) {
        std::string channel_id = std::to_string(candidate);
        if (!mailboxes_.count(channel_id)) return channel_id;
    }
}

Allocation Directory::allocate(const std::string& side) {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    Allocation allocation;
    allocation.channel_id = find_available_id_locked();
    allocation.mailbox = std::make_shared<Mailbox>(allocation.channel_id);
    allocation.mailbox->add_claim(side);
    mailboxes_.emplace(allocation.channel_id, allocation.mailbox);
    Logger::instance().info("Channel allocated", { {"app", app_id_}, {"channel", allocation.channel_id}, {"side", side}, {"live_channels", static_cast<uint64_t>(mailboxes_.size())} });
    return allocation;
}

std::shared_ptr<Mailbox> Directory::claim(const std::string& channel_id, const std::string& side) {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    auto it = mailboxes_.find(channel_id);
    if (it == mailboxes_.end()) {
        it = mailboxes_.emplace(channel_id, std::make_shared<Mailbox>(channel_id)).first;
        Logger::instance().info("Channel created by claim", { {"app", app_id_}, {"channel", channel_id}, {"live_channels", static_cast<uint64_t>(mailboxes_.size())} });
    }
    it->second->add_claim(side);
    return it->second;
}

ReleaseStatus Directory::release(const std::shared_ptr<Mailbox>& mailbox, const std::string& side) {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    ReleaseStatus status = mailbox->release(side);
    if (status == ReleaseStatus::Deleted) {
        auto it = mailboxes_.find(mailbox->channel_id());
        if (it != mailboxes_.end() && it->second == mailbox) mailboxes_.erase(it);
    }
    return status;
}

std::shared_ptr<Mailbox> Directory::find(const std::string& channel_id) const {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    auto it = mailboxes_.find(channel_id);
    return it == mailboxes_.end() ? nullptr : it->second;
}

std::size_t Directory::size() const {
    std::lock_guard<std::mutex> lk(directory_mutex_);
    return mailboxes_.size();
}
