/**
 * @file RecordStore.cpp
 * @brief File-backed and in-memory RecordStore implementations
 */

#include "p2lan/RecordStore.h"
#include "p2lan/AtomicFile.h"

#include <fstream>
#include <sstream>

namespace P2Lan {

//=============================================================================
// JsonFileRecordStore
//=============================================================================

JsonFileRecordStore::JsonFileRecordStore(std::filesystem::path directory)
    : m_directory(std::move(directory))
{
}

std::filesystem::path JsonFileRecordStore::pathForKey(const std::string& key) const {
    return m_directory / (key + ".json");
}

bool JsonFileRecordStore::load(const std::string& key, nlohmann::json& out, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);

    const auto path = pathForKey(key);
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        out = nullptr;
        return true;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        errorMsg = "Cannot open " + path.string();
        return false;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        out = nlohmann::json::parse(buffer.str());
    } catch (const nlohmann::json::parse_error& e) {
        errorMsg = "Invalid JSON in " + path.string() + ": " + e.what();
        return false;
    }
    return true;
}

bool JsonFileRecordStore::save(const std::string& key, const nlohmann::json& value, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    std::filesystem::create_directories(m_directory, ec);
    if (ec) {
        errorMsg = "Cannot create " + m_directory.string() + ": " + ec.message();
        return false;
    }

    return writeFileAtomically(pathForKey(key), value.dump(4), errorMsg);
}

//=============================================================================
// InMemoryRecordStore
//=============================================================================

bool InMemoryRecordStore::load(const std::string& key, nlohmann::json& out, std::string& /*errorMsg*/) {
    std::lock_guard<std::mutex> lock(m_mutex);
    auto it = m_documents.find(key);
    out = (it == m_documents.end()) ? nlohmann::json(nullptr) : it->second;
    return true;
}

bool InMemoryRecordStore::save(const std::string& key, const nlohmann::json& value, std::string& errorMsg) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_failSaves) {
        errorMsg = "Simulated save failure";
        return false;
    }
    m_documents[key] = value;
    ++m_saveCount;
    return true;
}

void InMemoryRecordStore::setFailSaves(bool fail) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_failSaves = fail;
}

size_t InMemoryRecordStore::saveCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_saveCount;
}

}  // namespace P2Lan
