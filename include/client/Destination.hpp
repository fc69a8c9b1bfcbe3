#pragma once

#include <filesystem>
#include <string>

namespace ts::client {

// Where the rebuilt archive for srcUrl goes. dst ending in '/' or not ending
// in suffix is a directory that receives the URL's basename. Throws
// std::invalid_argument when srcUrl does not end in suffix.
std::filesystem::path resolveDestination(const std::string& srcUrl, const std::string& dst, const std::string& suffix);

}
