#pragma once

#include <string>

namespace ts::concurrency {

struct Task {
    virtual ~Task() = default;
    virtual void operator()() = 0;

    // Used when the worker reports an escaped exception
    [[nodiscard]] virtual std::string name() const { return "task"; }
};

}
