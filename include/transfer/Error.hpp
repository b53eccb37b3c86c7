#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace mvx::transfer {

enum class ErrorKind {
    SourceNotFound,
    SourceNotSupported,
    DestinationExists,
    DestinationNotADirectory,
    DestinationNotAFile,
    DirectoryCreation,
    FastPathFailure,
    StreamingIO,
    DirectoryCleanup,
    InvalidRequest,
    Cancelled,
};

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, std::filesystem::path path, const std::string& message, std::error_code ec = {});

    [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] const std::error_code& code() const noexcept { return ec_; }

    [[nodiscard]] bool isCancelled() const noexcept { return kind_ == ErrorKind::Cancelled; }

    static TransferError sourceNotFound(const std::filesystem::path& p);
    static TransferError destinationExists(const std::filesystem::path& p);
    static TransferError destinationNotADirectory(const std::filesystem::path& p);
    static TransferError destinationNotAFile(const std::filesystem::path& p);
    static TransferError cancelled(const std::filesystem::path& p);
    static TransferError fromErrno(ErrorKind kind, const std::filesystem::path& p, const std::string& context, int err);

private:
    ErrorKind kind_;
    std::filesystem::path path_;
    std::error_code ec_;
};

std::string to_string(ErrorKind kind);

}
