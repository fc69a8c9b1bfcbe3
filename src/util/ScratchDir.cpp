#include "util/ScratchDir.hpp"
#include "log/Registry.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <stdexcept>
#include <vector>

using namespace ts::util;
using namespace ts::log;

namespace fs = std::filesystem;

ScratchDir::ScratchDir(const fs::path& parent, const std::string& prefix) {
    const auto base = parent.empty() ? fs::temp_directory_path() : parent;
    const auto pattern = (base / (prefix + "XXXXXX")).string();

    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (!mkdtemp(buf.data()))
        throw std::runtime_error("Failed to create scratch directory under " + base.string() + ": " + std::strerror(errno));

    path_ = buf.data();
}

ScratchDir::~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec && Registry::isInitialized())
        Registry::client()->warn("[ScratchDir] Failed to remove {}: {}", path_.string(), ec.message());
}
