/**
 * @file TransferTask.h
 * @brief Data transfer task model shared by the engine and its observers
 */

#pragma once

#include <cstdint>
#include <string>

namespace P2Lan {

enum class TransferDirection {
    Send,
    Receive
};

/**
 * @brief Lifecycle of a single file transfer task
 *
 * Terminal: Completed, Failed, Cancelled, Rejected.
 */
enum class TransferStatus {
    Pending,             ///< Accepted, waiting for a worker slot
    Requesting,          ///< Request being sent
    WaitingForApproval,  ///< Request sent, waiting for the receiver
    InProgress,
    Paused,
    Completed,
    Failed,
    Cancelled,
    Rejected
};

/**
 * @brief Reason carried by a rejected file_transfer_response
 */
enum class RejectReason {
    UserRejected,
    Timeout,
    FileSizeExceeded,
    TotalSizeExceeded,
    StorageInsufficient,
    UnsupportedFileType,
    PeerBlocked,
    NotPaired,
    Unknown
};

std::string transferStatusToString(TransferStatus status);
std::string transferDirectionToString(TransferDirection direction);
std::string rejectReasonToString(RejectReason reason);
RejectReason rejectReasonFromString(const std::string& value);

inline bool isTerminalStatus(TransferStatus status) {
    return status == TransferStatus::Completed ||
           status == TransferStatus::Failed ||
           status == TransferStatus::Cancelled ||
           status == TransferStatus::Rejected;
}

/**
 * @brief Snapshot of one transfer task
 *
 * The engine owns the live task; callers only ever see copies.
 * Timestamps are wall clock milliseconds since epoch (0 = not yet).
 */
struct DataTransferTask {
    std::string id;
    std::string batchId;
    std::string requestId;
    TransferDirection direction = TransferDirection::Send;
    std::string peerId;
    std::string peerName;

    std::string fileName;
    std::string filePath;    ///< Source path (send)
    std::string savePath;    ///< Final destination (receive)
    int64_t fileSize = 0;
    int64_t transferredBytes = 0;

    TransferStatus status = TransferStatus::Pending;
    std::string errorMessage;

    int64_t createdAtMs = 0;
    int64_t startedAtMs = 0;
    int64_t finishedAtMs = 0;

    std::string resumedFromTaskId;

    double progress() const {
        if (fileSize <= 0) {
            return status == TransferStatus::Completed ? 1.0 : 0.0;
        }
        return static_cast<double>(transferredBytes) / static_cast<double>(fileSize);
    }
};

}  // namespace P2Lan
