/**
 * @file FileNameUtils.cpp
 * @brief Receiver-side file name sanitizing.
 */

#include "p2lan/FileNameUtils.h"
#include "p2lan/config.h"

namespace P2Lan {
namespace {

static bool isControlChar(unsigned char ch) {
    return ch < 32 || ch == 127;
}

static void trimTrailingSpaces(std::string& s) {
    while (!s.empty() && s.back() == ' ') {
        s.pop_back();
    }
}

}  // namespace

bool sanitizeFileNameInPlace(std::string& name) {
    if (name.empty()) return false;

    // Peers may send a full path; keep only the last component.
    const auto lastSep = name.find_last_of("/\\");
    if (lastSep != std::string::npos) {
        name = name.substr(lastSep + 1);
    }

    for (char& ch : name) {
        const unsigned char uch = static_cast<unsigned char>(ch);
        if (isControlChar(uch)) return false;
        if (ch == ':' || ch == '*' || ch == '?' || ch == '"' ||
            ch == '<' || ch == '>' || ch == '|') {
            ch = '_';
        }
    }

    // Replace traversal-like hints.
    size_t pos = 0;
    while ((pos = name.find("..", pos)) != std::string::npos) {
        name.replace(pos, 2, "__");
    }

    trimTrailingSpaces(name);

    if (name.empty()) return false;
    if (name.find_first_not_of("._ ") == std::string::npos) return false;
    if (name.size() > MAX_FILENAME_LENGTH) return false;

    return true;
}

bool isSafeFileName(const std::string& name) {
    std::string copy = name;
    if (!sanitizeFileNameInPlace(copy)) return false;
    return copy == name;
}

}  // namespace P2Lan
