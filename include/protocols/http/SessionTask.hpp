#pragma once

#include "concurrency/Task.hpp"
#include "protocols/http/Session.hpp"

namespace ts::concurrency {

struct SessionTask : Task {
    std::shared_ptr<protocols::http::Session> session;

    explicit SessionTask(std::shared_ptr<protocols::http::Session> s) : session(std::move(s)) {}

    void operator()() override {
        session->run();
    }

    [[nodiscard]] std::string name() const override { return "http session"; }
};

}
