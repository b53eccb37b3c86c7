#pragma once

#include "transfer/Mode.hpp"
#include "transfer/Outcome.hpp"
#include "tree/DirectoryWalker.hpp"

#include <filesystem>

namespace mvx::runtime { class Cancellation; }
namespace mvx::progress { class Sink; }

namespace mvx::transfer {

class FileTransfer;

// Merges the contents of a source directory into a destination tree. Files
// unique to either side are left alone; same-name files follow the conflict
// policy of FileTransfer.
class DirectoryMerger {
public:
    DirectoryMerger(const FileTransfer& files, const runtime::Cancellation& cancellation);

    // request.destination is the merge root itself. Throws TransferError for
    // requests that cannot start (not a directory, merge into itself).
    MergeReport merge(const Request& request, progress::Sink* sink = nullptr) const;

    // Throws unless `destination` may receive the contents of `source`.
    static void validate(const std::filesystem::path& source, const std::filesystem::path& destination);

    static bool isWithin(const std::filesystem::path& path, const std::filesystem::path& root);

private:
    void prune(const tree::DirectoryWalker::Listing& listing, const std::filesystem::path& root,
               MergeReport& report) const;

    const FileTransfer& files_;
    const runtime::Cancellation& cancellation_;
};

}
