/**
 * @file FileNameUtils.h
 * @brief Receiver-side sanitizing of peer-provided file names.
 */

#pragma once

#include <string>

namespace P2Lan {

// Sanitizes a peer-provided file name into a safe single path component in place.
// Directory components are stripped, path separators and traversal hints are
// replaced. Returns false if the name cannot be made safe (empty, control
// characters, only dots, too long).
bool sanitizeFileNameInPlace(std::string& name);

// Returns true if the name is already safe and requires no changes.
bool isSafeFileName(const std::string& name);

}  // namespace P2Lan
