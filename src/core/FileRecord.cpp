#include "core/FileRecord.hpp"
#include <sstream>

namespace lanshare {

nlohmann::json FileRecord::to_json() const {
    nlohmann::json j;
    j["id"] = id;
    j["name"] = name;
    j["size"] = size;
    j["type"] = mimeType;
    return j;
}

std::string FileRecord::to_str() const {
    std::ostringstream ss;
    ss << "FileRecord{id=" << id << ", name=" << name << ", size=" << size
       << ", type=" << mimeType << ", path=" << storagePath
       << (uploaded ? ", uploaded" : "") << "}";
    return ss.str();
}

} // namespace lanshare
