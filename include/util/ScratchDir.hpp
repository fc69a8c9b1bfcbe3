#pragma once

#include <filesystem>
#include <string>

namespace ts::util {

// A fresh private directory (<parent>/<prefix>XXXXXX), removed with its
// contents on destruction.
class ScratchDir {
public:
    explicit ScratchDir(const std::filesystem::path& parent = {}, const std::string& prefix = "tarsync-");
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}
