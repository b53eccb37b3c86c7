#pragma once

#include <cstdint>
#include <filesystem>
#include <vector>

namespace mvx::tree {

// Iterative (explicit work-list) enumeration of a directory tree. Symlinks
// are reported, never followed.
class DirectoryWalker {
public:
    enum class Kind { File, Directory, Other };

    struct Entry {
        std::filesystem::path path;
        std::filesystem::path relative;
        Kind kind{Kind::File};
        std::uintmax_t size{};
    };

    struct Listing {
        std::vector<Entry> files;         // regular files, sorted by relative path
        std::vector<Entry> directories;   // deepest first, root excluded
        std::vector<Entry> others;        // symlinks, fifos, sockets, devices

        [[nodiscard]] std::uintmax_t totalBytes() const;
    };

    explicit DirectoryWalker(bool recursive = true);

    [[nodiscard]] Listing walk(const std::filesystem::path& root) const;

    static void sortByRelativePath(std::vector<Entry>& entries);
    static void sortDeepestFirst(std::vector<Entry>& entries);

private:
    bool recursive;
};

}
