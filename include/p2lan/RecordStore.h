/**
 * @file RecordStore.h
 * @brief Key/value persistence used by the trust store and settings
 */

#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

namespace P2Lan {

/**
 * @brief Persistence collaborator
 *
 * A key maps to one JSON document. save() replaces the whole document;
 * implementations must never leave a half-written document behind.
 */
class RecordStore {
public:
    virtual ~RecordStore() = default;

    /**
     * @brief Load a document
     * @param key Document key
     * @param out Loaded document, or null if the key has never been saved
     * @param errorMsg Reason on failure
     * @return false only on a read or parse error
     */
    virtual bool load(const std::string& key, nlohmann::json& out, std::string& errorMsg) = 0;

    /**
     * @brief Replace a document
     */
    virtual bool save(const std::string& key, const nlohmann::json& value, std::string& errorMsg) = 0;
};

/**
 * @brief One `<key>.json` file per document under a directory
 *
 * Writes go through writeFileAtomically() (temp file then rename).
 */
class JsonFileRecordStore : public RecordStore {
public:
    explicit JsonFileRecordStore(std::filesystem::path directory);

    bool load(const std::string& key, nlohmann::json& out, std::string& errorMsg) override;
    bool save(const std::string& key, const nlohmann::json& value, std::string& errorMsg) override;

    std::filesystem::path pathForKey(const std::string& key) const;

private:
    std::filesystem::path m_directory;
    std::mutex m_mutex;
};

/**
 * @brief Process-local store for tests
 */
class InMemoryRecordStore : public RecordStore {
public:
    bool load(const std::string& key, nlohmann::json& out, std::string& errorMsg) override;
    bool save(const std::string& key, const nlohmann::json& value, std::string& errorMsg) override;

    /// Make every following save() fail until reset
    void setFailSaves(bool fail);
    size_t saveCount() const;

private:
    mutable std::mutex m_mutex;
    std::map<std::string, nlohmann::json> m_documents;
    bool m_failSaves = false;
    size_t m_saveCount = 0;
};

}  // namespace P2Lan
