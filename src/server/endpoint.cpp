#include "server/endpoint.hpp"

namespace lanshare {

namespace {

int hex_value(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string endpoint::url_decode(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] == '%' && i + 2 < value.size()) {
            int hi = hex_value(value[i + 1]);
            int lo = hex_value(value[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out += static_cast<char>(hi * 16 + lo);
                i += 2;
                continue;
            }
        }
        out += value[i];
    }
    return out;
}

endpoint::endpoint(Handler handler, HttpMethod rest_type, const std::string& path)
    : handler(std::move(handler)), rest_type(rest_type), path(path), segments(split_path(path)) {}

std::vector<std::string> endpoint::split_path(const std::string& path)
{
    std::vector<std::string> parts;
    size_t pos = 0;
    while (pos <= path.size()) {
        size_t next = path.find('/', pos);
        if (next == std::string::npos) next = path.size();
        if (next > pos) {
            parts.push_back(path.substr(pos, next - pos));
        }
        pos = next + 1;
    }
    return parts;
}

bool endpoint::matches(const std::string& request_path,
                       std::unordered_map<std::string, std::string>& params) const
{
    std::vector<std::string> actual = split_path(request_path);
    if (actual.size() != segments.size()) return false;

    std::unordered_map<std::string, std::string> captured;
    for (size_t i = 0; i < segments.size(); ++i) {
        const std::string& expected = segments[i];
        if (!expected.empty() && expected.front() == ':') {
            captured[expected.substr(1)] = url_decode(actual[i]);
        } else if (expected != actual[i]) {
            return false;
        }
    }
    params = std::move(captured);
    return true;
}

} // namespace lanshare
