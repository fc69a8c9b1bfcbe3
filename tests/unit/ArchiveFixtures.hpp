#pragma once

#include "archive/Entry.hpp"
#include "archive/Gzip.hpp"
#include "archive/TarReader.hpp"
#include "archive/TarWriter.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace ts::test {

using Member = std::pair<archive::Entry, std::string>;

inline archive::Entry fileEntry(const std::string& name, const std::size_t size) {
    archive::Entry e;
    e.name = name;
    e.typeflag = archive::typeflag::REGULAR;
    e.size = static_cast<int64_t>(size);
    e.mtime = 1700000000;
    e.uname = "user";
    e.gname = "users";
    return e;
}

inline Member file(const std::string& name, const std::string& content) {
    return {fileEntry(name, content.size()), content};
}

inline Member dir(const std::string& name) {
    archive::Entry e;
    e.name = name;
    e.typeflag = archive::typeflag::DIRECTORY;
    e.mode = 0755;
    return {e, ""};
}

inline Member symlink(const std::string& name, const std::string& target) {
    archive::Entry e;
    e.name = name;
    e.typeflag = archive::typeflag::SYMLINK;
    e.linkname = target;
    e.mode = 0777;
    return {e, ""};
}

inline void writeMembers(std::ostream& out, const std::vector<Member>& members) {
    archive::TarWriter writer(out);
    for (const auto& [entry, content] : members) {
        writer.writeHeader(entry);
        writer.write(content.data(), content.size());
    }
    writer.close();
}

inline std::string makeTar(const std::vector<Member>& members) {
    std::ostringstream out;
    writeMembers(out, members);
    return out.str();
}

inline void writeTgz(const std::filesystem::path& path, const std::vector<Member>& members) {
    archive::GzipWriter gz(path);
    writeMembers(gz.stream(), members);
    gz.finish();
}

inline std::vector<Member> readMembers(std::istream& in) {
    std::vector<Member> out;
    archive::TarReader reader(in);
    while (auto entry = reader.next()) {
        std::string content(static_cast<std::size_t>(entry->size), '\0');
        reader.readExact(content.data(), content.size());
        out.emplace_back(*entry, std::move(content));
    }
    return out;
}

inline std::vector<Member> readTar(const std::string& bytes) {
    std::istringstream in(bytes);
    return readMembers(in);
}

inline std::vector<Member> readTgz(const std::filesystem::path& path) {
    archive::GzipReader gz(path);
    return readMembers(gz.stream());
}

inline std::vector<Member> readTgzBytes(const std::string& bytes) {
    std::istringstream raw(bytes);
    archive::GzipReader gz(raw);
    return readMembers(gz.stream());
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

inline std::string readFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream out;
    out << in.rdbuf();
    return out.str();
}

inline std::vector<std::string> names(const std::vector<Member>& members) {
    std::vector<std::string> out;
    for (const auto& [entry, content] : members) out.push_back(entry.name);
    return out;
}

}
