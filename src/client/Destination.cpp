#include "client/Destination.hpp"

#include <stdexcept>

std::filesystem::path ts::client::resolveDestination(const std::string& srcUrl, const std::string& dst, const std::string& suffix) {
    if (suffix.empty() || !srcUrl.ends_with(suffix) || srcUrl.size() == suffix.size())
        throw std::invalid_argument("<src> argument requires " + suffix + " suffix");

    const auto slash = srcUrl.rfind('/');
    const auto base = slash == std::string::npos ? srcUrl : srcUrl.substr(slash + 1);
    if (base.empty() || base == suffix) throw std::invalid_argument("<src> has no archive name: " + srcUrl);

    if (dst.empty()) return base;
    if (dst.ends_with('/')) return dst + base;
    if (dst.ends_with(suffix)) return dst;
    return dst + "/" + base;
}
