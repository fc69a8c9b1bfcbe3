#include "sync/PresenceBitmap.hpp"

#include <bit>
#include <stdexcept>

using namespace ts::sync;

PresenceBitmap PresenceBitmap::fromBytes(std::string bytes) {
    PresenceBitmap bitmap;
    bitmap.bytes_.assign(bytes.begin(), bytes.end());
    bitmap.bits_ = static_cast<uint64_t>(bitmap.bytes_.size()) * 8;
    return bitmap;
}

void PresenceBitmap::push(const bool missing) {
    if (bits_ % 8 == 0) bytes_.push_back(0);
    ++bits_;
    if (missing) set(bits_ - 1, true);
}

void PresenceBitmap::set(const uint64_t counter, const bool missing) {
    if (counter >= bits_) throw std::out_of_range("PresenceBitmap::set: counter " + std::to_string(counter) + " beyond " + std::to_string(bits_) + " bits");
    const auto mask = static_cast<uint8_t>(1u << (7 - counter % 8));
    auto& byte = bytes_[counter / 8];
    byte = missing ? static_cast<uint8_t>(byte | mask) : static_cast<uint8_t>(byte & ~mask);
}

bool PresenceBitmap::test(const uint64_t counter) const {
    const auto byteindex = counter / 8;
    if (byteindex >= bytes_.size())
        throw std::out_of_range("PresenceBitmap: counter " + std::to_string(counter) + " needs byte " + std::to_string(byteindex) +
                                " but bitmap has " + std::to_string(bytes_.size()) + " bytes");
    const auto bitindex = 7 - counter % 8;
    return (bytes_[byteindex] >> bitindex) & 1u;
}

std::string PresenceBitmap::pack() const {
    if (bytes_.empty()) return std::string(1, '\0');
    return {bytes_.begin(), bytes_.end()};
}

uint64_t PresenceBitmap::countSet() const {
    uint64_t total = 0;
    for (const auto b : bytes_) total += static_cast<uint64_t>(std::popcount(b));
    return total;
}
