#include "transfer/Error.hpp"

using namespace mvx::transfer;

namespace {
std::string withCode(const std::string& message, const std::error_code& ec) {
    if (!ec) return message;
    return message + ": " + ec.message();
}
}

TransferError::TransferError(const ErrorKind kind, std::filesystem::path path, const std::string& message,
                             const std::error_code ec)
    : std::runtime_error(withCode(message, ec)), kind_(kind), path_(std::move(path)), ec_(ec) {}

TransferError TransferError::sourceNotFound(const std::filesystem::path& p) {
    return {ErrorKind::SourceNotFound, p, "Source '" + p.string() + "' does not exist"};
}

TransferError TransferError::destinationExists(const std::filesystem::path& p) {
    return {ErrorKind::DestinationExists, p, "Destination '" + p.string() + "' already exists"};
}

TransferError TransferError::destinationNotADirectory(const std::filesystem::path& p) {
    return {ErrorKind::DestinationNotADirectory, p,
            "Destination '" + p.string() + "' already exists and is not a directory"};
}

TransferError TransferError::destinationNotAFile(const std::filesystem::path& p) {
    return {ErrorKind::DestinationNotAFile, p, "Destination '" + p.string() + "' already exists and is not a file"};
}

TransferError TransferError::cancelled(const std::filesystem::path& p) {
    return {ErrorKind::Cancelled, p, "Transfer of '" + p.string() + "' was cancelled"};
}

TransferError TransferError::fromErrno(const ErrorKind kind, const std::filesystem::path& p,
                                       const std::string& context, const int err) {
    return {kind, p, context + " '" + p.string() + "'", std::error_code(err, std::generic_category())};
}

std::string mvx::transfer::to_string(const ErrorKind kind) {
    switch (kind) {
    case ErrorKind::SourceNotFound: return "source not found";
    case ErrorKind::SourceNotSupported: return "source not supported";
    case ErrorKind::DestinationExists: return "destination exists";
    case ErrorKind::DestinationNotADirectory: return "destination not a directory";
    case ErrorKind::DestinationNotAFile: return "destination not a file";
    case ErrorKind::DirectoryCreation: return "directory creation";
    case ErrorKind::FastPathFailure: return "fast path failure";
    case ErrorKind::StreamingIO: return "streaming I/O";
    case ErrorKind::DirectoryCleanup: return "directory cleanup";
    case ErrorKind::InvalidRequest: return "invalid request";
    case ErrorKind::Cancelled: return "cancelled";
    default: return "unknown";
    }
}
