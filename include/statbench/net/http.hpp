#pragma once

#include <string>
#include <utility>
#include <vector>

namespace statbench::net {

using Headers = std::vector<std::pair<std::string, std::string>>;

// Throws std::runtime_error on transport failure or a non-2xx status. The
// error text carries the response body when the server sent one.
std::string post_json(const std::string& url,
                      const std::string& body,
                      const Headers& headers,
                      long timeout_ms = -1);

} // namespace statbench::net
