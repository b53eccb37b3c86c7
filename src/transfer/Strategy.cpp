#include "transfer/Strategy.hpp"
#include "transfer/Error.hpp"
#include "io/FileDescriptor.hpp"
#include "progress/Tracker.hpp"
#include "runtime/Cancellation.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <vector>

using namespace mvx::transfer;
using namespace mvx::logging;
namespace fs = std::filesystem;

namespace {

// Closest existing ancestor; the destination itself usually does not exist yet.
fs::path probePath(const fs::path& p) {
    auto cur = p;
    std::error_code ec;
    while (!cur.empty() && !fs::exists(cur, ec)) {
        if (cur == cur.parent_path()) break;
        cur = cur.parent_path();
    }
    return cur.empty() ? fs::path(".") : cur;
}

// Regular files only; anything else could block in open(2) or read(2) indefinitely.
void requireRegular(const FileUnit& unit, const struct stat& st) {
    if (!S_ISREG(st.st_mode))
        throw TransferError(ErrorKind::SourceNotSupported, unit.source,
                            "Source '" + unit.source.string() + "' is not a regular file");
}

mvx::io::FileDescriptor openSource(const FileUnit& unit, struct stat& st) {
    if (::stat(unit.source.c_str(), &st) != 0)
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.source, "Cannot stat source", errno);
    requireRegular(unit, st);

    // O_NONBLOCK in case the path was swapped for a FIFO since the stat; no effect on regular files.
    mvx::io::FileDescriptor in(::open(unit.source.c_str(), O_RDONLY | O_NONBLOCK | O_CLOEXEC));
    if (!in) throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.source, "Cannot open source", errno);

    if (::fstat(in.get(), &st) != 0)
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.source, "Cannot stat source", errno);
    requireRegular(unit, st);
    return in;
}

int openDestination(const fs::path& p, const bool overwrite, const mode_t mode) {
    int flags = O_WRONLY | O_CREAT | O_CLOEXEC;
    flags |= overwrite ? O_TRUNC : O_EXCL;
    return ::open(p.c_str(), flags, mode);
}

ssize_t readSome(const int fd, char* buf, const size_t len) {
    for (;;) {
        const auto n = ::read(fd, buf, len);
        if (n < 0 && errno == EINTR) continue;
        return n;
    }
}

bool writeAll(const int fd, const char* buf, size_t len) {
    while (len > 0) {
        const auto n = ::write(fd, buf, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        buf += n;
        len -= static_cast<size_t>(n);
    }
    return true;
}

}

Strategy::Strategy(const config::TransferConfig& config, const runtime::Cancellation& cancellation)
    : config_(config), cancellation_(cancellation) {}

Strategy::Result Strategy::execute(const Mode mode, const FileUnit& unit, progress::Tracker& tracker,
                                   const bool overwrite) const {
    if (cancellation_.isForced()) throw TransferError::cancelled(unit.source);

    const auto log = LogRegistry::transfer();
    const bool local = (config_.rename || config_.reflink) && sameDevice(unit.source, unit.destination);

    if (mode == Mode::Move && config_.rename && local && tryRename(unit)) {
        tracker.advance(unit.label(), unit.size);
        log->debug("[Strategy] Renamed '{}' -> '{}'", unit.source.string(), unit.destination.string());
        return {Method::Rename};
    }

    bool cloneAttempted = false;
    if (mode == Mode::Copy && config_.reflink && local) {
        if (tryReflink(unit, overwrite)) {
            tracker.advance(unit.label(), unit.size);
            log->debug("[Strategy] Reflinked '{}' -> '{}'", unit.source.string(), unit.destination.string());
            return {Method::Reflink};
        }
        cloneAttempted = true;
    }

    // A refused clone leaves the destination created and empty; it is ours to truncate.
    stream(mode, unit, tracker, overwrite || cloneAttempted);

    Result result{Method::Stream};
    if (mode == Mode::Move) result.warning = removeSource(unit);

    log->debug("[Strategy] {} '{}' -> '{}' ({} bytes streamed)", mode == Mode::Move ? "Moved" : "Copied",
               unit.source.string(), unit.destination.string(), tracker.unitDone());
    return result;
}

bool Strategy::tryRename(const FileUnit& unit) const {
    if (::rename(unit.source.c_str(), unit.destination.c_str()) == 0) return true;

    const int err = errno;
    if (err == EXDEV) {
        LogRegistry::transfer()->trace("[Strategy] rename crosses devices for '{}', streaming instead", unit.source.string());
        return false;
    }
    throw TransferError::fromErrno(ErrorKind::FastPathFailure, unit.source, "Cannot rename", err);
}

bool Strategy::tryReflink(const FileUnit& unit, const bool overwrite) const {
    struct stat st{};
    const auto in = openSource(unit, st);

    io::FileDescriptor out(openDestination(unit.destination, overwrite, st.st_mode & 0777));
    if (!out) {
        const int err = errno;
        if (err == EEXIST) throw TransferError::destinationExists(unit.destination);
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Cannot open destination", err);
    }

    if (::ioctl(out.get(), FICLONE, in.get()) == 0) {
        if (const int err = out.close())
            throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Cannot close", err);
        return true;
    }

    const int err = errno;
    if (isUnsupported(err)) {
        LogRegistry::transfer()->trace("[Strategy] reflink unsupported for '{}': {}", unit.destination.string(),
                                       std::strerror(err));
        return false;
    }
    // An exclusive create means the file is ours; do not leave an empty one behind.
    if (!overwrite) {
        (void)out.close();
        if (::unlink(unit.destination.c_str()) != 0)
            LogRegistry::transfer()->warn("[Strategy] Cannot remove empty destination '{}': {}",
                                          unit.destination.string(), std::strerror(errno));
    }
    throw TransferError::fromErrno(ErrorKind::FastPathFailure, unit.destination, "Cannot clone into", err);
}

void Strategy::stream(const Mode mode, const FileUnit& unit, progress::Tracker& tracker, const bool overwrite) const {
    struct stat st{};
    const auto in = openSource(unit, st);

    io::FileDescriptor out(openDestination(unit.destination, overwrite, st.st_mode & 0777));
    if (!out) {
        const int err = errno;
        if (err == EEXIST) throw TransferError::destinationExists(unit.destination);
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Cannot open destination", err);
    }

    std::vector<char> buffer(static_cast<size_t>(config_.chunk_size));
    for (;;) {
        const auto n = readSome(in.get(), buffer.data(), buffer.size());
        if (n < 0) throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.source, "Read failed on", errno);
        if (n == 0) break;

        if (!writeAll(out.get(), buffer.data(), static_cast<size_t>(n)))
            throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Write failed on", errno);

        tracker.advance(unit.label(), static_cast<uint64_t>(n));

        // Requested lets the file finish; Forced leaves the partial destination behind.
        if (cancellation_.isForced()) throw TransferError::cancelled(unit.destination);
    }

    if (config_.preserve_mode && ::fchmod(out.get(), st.st_mode & 07777) != 0)
        LogRegistry::transfer()->warn("[Strategy] Cannot preserve mode on '{}': {}", unit.destination.string(),
                                      std::strerror(errno));

    if (mode == Mode::Move && config_.fsync && ::fsync(out.get()) != 0)
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Cannot flush", errno);

    if (const int err = out.close())
        throw TransferError::fromErrno(ErrorKind::StreamingIO, unit.destination, "Cannot close", err);
}

std::optional<std::string> Strategy::removeSource(const FileUnit& unit) const {
    if (cancellation_.isForced()) throw TransferError::cancelled(unit.source);

    if (::unlink(unit.source.c_str()) == 0) return std::nullopt;

    const auto warning = "Cannot remove source '" + unit.source.string() + "': " + std::strerror(errno);
    LogRegistry::transfer()->warn("[Strategy] {}", warning);
    return warning;
}

bool Strategy::sameDevice(const fs::path& source, const fs::path& destination) {
    struct stat a{}, b{};
    if (::lstat(source.c_str(), &a) != 0) return false;
    if (::stat(probePath(destination).c_str(), &b) != 0) return false;
    return a.st_dev == b.st_dev;
}

bool Strategy::isUnsupported(const int err) {
    return err == EOPNOTSUPP || err == ENOTSUP || err == ENOTTY || err == EINVAL || err == EXDEV || err == ENOSYS;
}
