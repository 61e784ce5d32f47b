// directory.hpp
#pragma once
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include "mailbox.hpp"

struct Allocation {
    std::string channel_id;
    std::shared_ptr<Mailbox> mailbox;
};

// The channel namespace of one application: channel id -> live Mailbox.
// A mailbox is in here exactly while it holds at least one claim.
class Directory {
public:
    explicit Directory(std::string app_id);

    const std::string& app_id() const { return app_id_; }

    // Channel ids claimed by exactly one distinct side, sorted.
    std::vector<std::string> list_waiting() const;

    // Lowest free numeric id, created and claimed for side in one step.
    Allocation allocate(const std::string& side);

    // Claims channel_id for side, creating a fresh mailbox if none is live.
    std::shared_ptr<Mailbox> claim(const std::string& channel_id, const std::string& side);

    // Drops side's claim; on the last one the mailbox is deleted and removed.
    ReleaseStatus release(const std::shared_ptr<Mailbox>& mailbox, const std::string& side);

    std::shared_ptr<Mailbox> find(const std::string& channel_id) const;
    std::size_t size() const;

private:
    std::string find_available_id_locked() const;

    mutable std::mutex directory_mutex_;
    const std::string app_id_;
    std::unordered_map<std::string, std::shared_ptr<Mailbox>> mailboxes_;
};
