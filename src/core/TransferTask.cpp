/**
 * @file TransferTask.cpp
 * @brief String conversions for transfer enums
 */

#include "p2lan/TransferTask.h"

namespace P2Lan {

std::string transferStatusToString(TransferStatus status) {
    switch (status) {
        case TransferStatus::Pending:            return "pending";
        case TransferStatus::Requesting:         return "requesting";
        case TransferStatus::WaitingForApproval: return "waitingForApproval";
        case TransferStatus::InProgress:         return "inProgress";
        case TransferStatus::Paused:             return "paused";
        case TransferStatus::Completed:          return "completed";
        case TransferStatus::Failed:             return "failed";
        case TransferStatus::Cancelled:          return "cancelled";
        case TransferStatus::Rejected:           return "rejected";
    }
    return "pending";
}

std::string transferDirectionToString(TransferDirection direction) {
    return direction == TransferDirection::Send ? "send" : "receive";
}

std::string rejectReasonToString(RejectReason reason) {
    switch (reason) {
        case RejectReason::UserRejected:        return "userRejected";
        case RejectReason::Timeout:             return "timeout";
        case RejectReason::FileSizeExceeded:    return "fileSizeExceeded";
        case RejectReason::TotalSizeExceeded:   return "totalSizeExceeded";
        case RejectReason::StorageInsufficient: return "storageInsufficient";
        case RejectReason::UnsupportedFileType: return "unsupportedFileType";
        case RejectReason::PeerBlocked:         return "peerBlocked";
        case RejectReason::NotPaired:           return "notPaired";
        case RejectReason::Unknown:             return "unknown";
    }
    return "unknown";
}

RejectReason rejectReasonFromString(const std::string& value) {
    if (value == "userRejected")        return RejectReason::UserRejected;
    if (value == "timeout")             return RejectReason::Timeout;
    if (value == "fileSizeExceeded")    return RejectReason::FileSizeExceeded;
    if (value == "totalSizeExceeded")   return RejectReason::TotalSizeExceeded;
    if (value == "storageInsufficient") return RejectReason::StorageInsufficient;
    if (value == "unsupportedFileType") return RejectReason::UnsupportedFileType;
    if (value == "peerBlocked")         return RejectReason::PeerBlocked;
    if (value == "notPaired")           return RejectReason::NotPaired;
    return RejectReason::Unknown;
}

}  // namespace P2Lan
