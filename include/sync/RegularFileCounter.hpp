#pragma once

#include "archive/Entry.hpp"

#include <cstdint>
#include <optional>

namespace ts::sync {

// The coordinate system shared by client and server: a zero-based sequence
// number over regular files with nonzero size, in traversal order. Both sides
// derive it independently, so the rule below is part of the wire protocol.
class RegularFileCounter {
public:
    [[nodiscard]] static bool isCounted(const archive::Entry& entry) {
        return entry.isRegular() && entry.size > 0;
    }

    std::optional<uint64_t> assign(const archive::Entry& entry) {
        if (!isCounted(entry)) return std::nullopt;
        return next_++;
    }

    [[nodiscard]] uint64_t assigned() const { return next_; }

private:
    uint64_t next_ = 0;
};

}
