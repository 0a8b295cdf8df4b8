#ifndef RELGRAPH_NET_FETCH_ERROR_H
#define RELGRAPH_NET_FETCH_ERROR_H

#include <stdexcept>
#include <string>

namespace relgraph {
namespace net {

// Failure to obtain usable graph data from the collaborator API.
// http_status is 0 for transport errors and malformed payloads.
class FetchError : public std::runtime_error {
public:
    explicit FetchError(const std::string& message, long http_status = 0)
        : std::runtime_error(message), http_status_(http_status) {}

    long http_status() const { return http_status_; }
    bool is_unauthorized() const { return http_status_ == 401; }

private:
    long http_status_;
};

} // namespace net
} // namespace relgraph

#endif // RELGRAPH_NET_FETCH_ERROR_H
