#pragma once

namespace ts::sync::protocol {

constexpr const auto* FINGERPRINT_HEADER = "X-Archive-Fingerprint";
constexpr const auto* REGULAR_FILES_HEADER = "X-Regular-File-Count";
constexpr const auto* ARCHIVE_CONTENT_TYPE = "application/octet-stream";

}
