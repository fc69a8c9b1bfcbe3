#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace ts::archive {

enum class EntryKind { Regular, Directory, Symlink, Other };

namespace typeflag {
constexpr char REGULAR      = '0';
constexpr char REGULAR_OLD  = '\0';
constexpr char HARDLINK     = '1';
constexpr char SYMLINK      = '2';
constexpr char DIRECTORY    = '5';
constexpr char PAX_LOCAL    = 'x';
constexpr char PAX_GLOBAL   = 'g';
constexpr char GNU_LONGNAME = 'L';
constexpr char GNU_LONGLINK = 'K';
}

EntryKind kindOf(char flag);

// One archive member. Everything except name, typeflag and size is opaque to
// the sync protocol and is carried from input to output unchanged.
struct Entry {
    std::string name;
    char typeflag = typeflag::REGULAR;
    int64_t size = 0;

    int64_t mode = 0644;
    int64_t uid = 0;
    int64_t gid = 0;
    int64_t mtime = 0;
    std::string linkname;
    std::string uname;
    std::string gname;
    int64_t devmajor = 0;
    int64_t devminor = 0;

    // PAX records that have no dedicated field (mtime fractions, xattrs, ...)
    std::map<std::string, std::string> pax;

    [[nodiscard]] EntryKind kind() const { return kindOf(typeflag); }
    [[nodiscard]] bool isRegular() const { return kind() == EntryKind::Regular; }
};

std::string to_string(EntryKind kind);

}
