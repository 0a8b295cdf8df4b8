#ifndef RELGRAPH_NET_CURL_UTILS_H
#define RELGRAPH_NET_CURL_UTILS_H

#include <curl/curl.h>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>

namespace relgraph {
namespace net {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<struct curl_slist, decltype(&curl_slist_free_all)>;

// Standard CURL write callback function to append data to a std::string
size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output);

// CURLOPT_XFERINFOFUNCTION callback; clientp is a std::stop_token*. A non-zero
// return makes curl abort the transfer with CURLE_ABORTED_BY_CALLBACK.
int StopTokenProgressCallback(void* clientp, curl_off_t dltotal, curl_off_t dlnow,
                              curl_off_t ultotal, curl_off_t ulnow);

// Percent-encode a query parameter value.
std::string EscapeQueryValue(CURL* curl, const std::string& value);

} // namespace net
} // namespace relgraph

#endif // RELGRAPH_NET_CURL_UTILS_H
