#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>

namespace lanshare {

// A shared file as seen by peers
struct FileRecord {
    std::string id;
    std::string name;
    uint64_t size = 0;
    std::string mimeType;
    std::string storagePath;  // absolute or cwd-relative path of the backing file
    bool uploaded = false;    // backing file lives in the upload directory

    // Listing form: {id, name, size, type}
    nlohmann::json to_json() const;
    std::string to_str() const;
};

} // namespace lanshare
