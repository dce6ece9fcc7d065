#pragma once 

#include <string>
#include <vector>
#include <functional>
#include <unordered_map>
#include "const/rest_enums.hpp"
#include "http/ChunkWriter.hpp"
#include "http/Request.hpp"

namespace lanshare {

class endpoint
{
public:
    // A handler either returns a buffered response or streams one through the writer
    using Handler = std::function<http::Response(http::Request&, http::ChunkWriter&)>;

private:
    Handler handler;
    HttpMethod rest_type;
    std::string path;
    std::vector<std::string> segments;

public:
    endpoint(Handler handler, 
             HttpMethod rest_type, 
             const std::string& path);

    std::string get_path() const { return path; }
    const Handler& get_handler() const { return handler; }
    HttpMethod get_rest_type() const { return rest_type; }

    // Matches a request path against the pattern; ":name" segments capture into params
    bool matches(const std::string& request_path,
                 std::unordered_map<std::string, std::string>& params) const;

    static std::vector<std::string> split_path(const std::string& path);
    static std::string url_decode(const std::string& value);
};

} // namespace lanshare
