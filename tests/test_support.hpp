// test_support.hpp
#pragma once
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "app_registry.hpp"
#include "mailbox.hpp"
#include "session.hpp"

// Collects what a session sends, parsed back into JSON.
class RecordingSink : public ResponseSink {
public:
    void send_text(std::string json_text) override {
        std::lock_guard<std::mutex> lk(mutex_);
        responses_.push_back(nlohmann::json::parse(json_text));
    }

    void request_close() override {
        std::lock_guard<std::mutex> lk(mutex_);
        ++close_requests_;
    }

    // Everything received since the last take().
    std::vector<nlohmann::json> take() {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<nlohmann::json> out;
        out.swap(responses_);
        return out;
    }

    int close_requests() {
        std::lock_guard<std::mutex> lk(mutex_);
        return close_requests_;
    }

private:
    std::mutex mutex_;
    std::vector<nlohmann::json> responses_;
    int close_requests_ = 0;
};

// A session wired to a recording sink, already past the welcome message.
struct TestClient {
    std::shared_ptr<RecordingSink> sink = std::make_shared<RecordingSink>();
    std::shared_ptr<Session> session;

    explicit TestClient(AppRegistry& apps, nlohmann::json welcome = nlohmann::json::object())
        : session(std::make_shared<Session>(apps, sink, std::move(welcome))) {
        session->start();
        sink->take();
    }

    // Sends one command and returns the responses it produced.
    std::vector<nlohmann::json> send(const nlohmann::json& msg, double server_rx = 1000.0) {
        session->handle_message(msg, server_rx);
        return sink->take();
    }

    void bind(const std::string& app_id, const std::string& side) {
        send({ {"type", "bind"}, {"appId", app_id}, {"side", side} });
    }
};

// Records mailbox callbacks directly, without a session in between.
class RecordingSubscriber : public MailboxSubscriber {
public:
    void deliver(const std::string& channel_id, const MailboxMessage& message) override {
        std::lock_guard<std::mutex> lk(mutex_);
        channels_.push_back(channel_id);
        phases_.push_back(message.phase);
    }

    void mailbox_closed(const std::string& channel_id) override {
        std::lock_guard<std::mutex> lk(mutex_);
        closed_.push_back(channel_id);
    }

    std::vector<std::string> phases() {
        std::lock_guard<std::mutex> lk(mutex_);
        return phases_;
    }

    std::vector<std::string> closed() {
        std::lock_guard<std::mutex> lk(mutex_);
        return closed_;
    }

private:
    std::mutex mutex_;
    std::vector<std::string> channels_;
    std::vector<std::string> phases_;
    std::vector<std::string> closed_;
};

inline MailboxMessage make_message(const std::string& side, const std::string& phase, const std::string& body = "00") {
    MailboxMessage message;
    message.side = side;
    message.phase = phase;
    message.body = body;
    message.server_rx = 1000.0;
    return message;
}
