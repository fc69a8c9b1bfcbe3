#include "archive/Entry.hpp"

using namespace ts::archive;

EntryKind ts::archive::kindOf(const char flag) {
    switch (flag) {
        case typeflag::REGULAR:
        case typeflag::REGULAR_OLD:
            return EntryKind::Regular;
        case typeflag::DIRECTORY: return EntryKind::Directory;
        case typeflag::SYMLINK: return EntryKind::Symlink;
        default: return EntryKind::Other;
    }
}

std::string ts::archive::to_string(const EntryKind kind) {
    switch (kind) {
        case EntryKind::Regular: return "regular";
        case EntryKind::Directory: return "directory";
        case EntryKind::Symlink: return "symlink";
        case EntryKind::Other: return "other";
    }
    return "unknown";
}
