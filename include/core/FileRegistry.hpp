#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "core/FileRecord.hpp"

namespace lanshare {

/**
 * In-memory map of shared files. Every operation takes the internal lock, so
 * callers never see a partially applied insert or delete.
 */
class FileRegistry
{
public:
    FileRegistry() = default;
    FileRegistry(const FileRegistry&) = delete;
    FileRegistry& operator=(const FileRegistry&) = delete;

    std::optional<FileRecord> get(const std::string& id) const;

    // Snapshot ordered by id
    std::vector<FileRecord> list() const;

    // Insert or replace; returns the record that was replaced, if any
    std::optional<FileRecord> put(const FileRecord& record);

    // Returns the removed record, or nullopt if the id was unknown
    std::optional<FileRecord> remove(const std::string& id);

    size_t size() const;

    // Listing JSON array
    std::string serialize() const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, FileRecord> files_;
};

} // namespace lanshare
