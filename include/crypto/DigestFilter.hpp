#pragma once

#include "crypto/ContentHash.hpp"

#include <boost/iostreams/categories.hpp>
#include <boost/iostreams/operations.hpp>

#include <memory>

namespace ts::crypto {

// Input filter that feeds every byte read through it into a shared hasher.
// Boost copies filters on push, hence the shared_ptr.
class DigestFilter {
public:
    typedef char char_type;
    typedef boost::iostreams::multichar_input_filter_tag category;

    explicit DigestFilter(std::shared_ptr<Sha1Hasher> hasher) : hasher_(std::move(hasher)) {}

    template<typename Source>
    std::streamsize read(Source& src, char* s, std::streamsize n) {
        const auto got = boost::iostreams::read(src, s, n);
        if (got > 0) hasher_->update(s, static_cast<std::size_t>(got));
        return got;
    }

private:
    std::shared_ptr<Sha1Hasher> hasher_;
};

}
