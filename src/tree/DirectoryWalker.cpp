#include "tree/DirectoryWalker.hpp"

#include <algorithm>
#include <numeric>

using namespace mvx::tree;
namespace fs = std::filesystem;

DirectoryWalker::DirectoryWalker(const bool recursive) : recursive(recursive) {}

DirectoryWalker::Listing DirectoryWalker::walk(const fs::path& root) const {
    Listing listing;
    std::vector<fs::path> pending{root};

    while (!pending.empty()) {
        const auto dir = std::move(pending.back());
        pending.pop_back();

        for (const auto& entry : fs::directory_iterator(dir)) {
            const auto st = entry.symlink_status();
            Entry e{entry.path(), entry.path().lexically_relative(root)};

            if (fs::is_regular_file(st)) {
                e.kind = Kind::File;
                e.size = entry.file_size();
                listing.files.push_back(std::move(e));
            } else if (fs::is_directory(st)) {
                e.kind = Kind::Directory;
                if (recursive) pending.push_back(e.path);
                listing.directories.push_back(std::move(e));
            } else {
                e.kind = Kind::Other;
                listing.others.push_back(std::move(e));
            }
        }
    }

    sortByRelativePath(listing.files);
    sortByRelativePath(listing.others);
    sortDeepestFirst(listing.directories);
    return listing;
}

std::uintmax_t DirectoryWalker::Listing::totalBytes() const {
    return std::accumulate(files.begin(), files.end(), std::uintmax_t{0},
                           [](const std::uintmax_t sum, const Entry& e) { return sum + e.size; });
}

void DirectoryWalker::sortByRelativePath(std::vector<Entry>& entries) {
    std::ranges::sort(entries, [](const Entry& a, const Entry& b) { return a.relative < b.relative; });
}

void DirectoryWalker::sortDeepestFirst(std::vector<Entry>& entries) {
    const auto depth = [](const Entry& e) { return std::distance(e.relative.begin(), e.relative.end()); };
    std::ranges::sort(entries, [&depth](const Entry& a, const Entry& b) {
        const auto da = depth(a), db = depth(b);
        if (da != db) return da > db;
        return a.relative < b.relative;
    });
}
