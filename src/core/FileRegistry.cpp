#include "core/FileRegistry.hpp"
#include <algorithm>
#include <iostream>

namespace lanshare {

std::optional<FileRecord> FileRegistry::get(const std::string& id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = files_.find(id);
    if (it == files_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<FileRecord> FileRegistry::list() const
{
    std::vector<FileRecord> records;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        records.reserve(files_.size());
        for (const auto& entry : files_) {
            records.push_back(entry.second);
        }
    }

    std::sort(records.begin(), records.end(),
              [](const FileRecord& a, const FileRecord& b) {
                  return a.id < b.id;
              });
    return records;
}

std::optional<FileRecord> FileRegistry::put(const FileRecord& record)
{
    std::optional<FileRecord> previous;
    size_t total = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(record.id);
        if (it != files_.end()) {
            previous = it->second;
            it->second = record;
        } else {
            files_.emplace(record.id, record);
        }
        total = files_.size();
    }

    std::cout << "[REGISTRY] " << (previous ? "Replaced " : "Added ") << record.to_str()
              << " (" << total << " shared)" << std::endl;
    return previous;
}

std::optional<FileRecord> FileRegistry::remove(const std::string& id)
{
    std::optional<FileRecord> removed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = files_.find(id);
        if (it == files_.end()) {
            return std::nullopt;
        }
        removed = std::move(it->second);
        files_.erase(it);
    }

    std::cout << "[REGISTRY] Removed " << removed->name << " (id " << id << ")" << std::endl;
    return removed;
}

size_t FileRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return files_.size();
}

std::string FileRegistry::serialize() const
{
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : list()) {
        j.push_back(record.to_json());
    }
    return j.dump();
}

} // namespace lanshare
