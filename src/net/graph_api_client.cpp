#include <relgraph/net/graph_api_client.h>
#include <relgraph/graph/model/graph_json.h>
#include <relgraph/net/curl_utils.h>
#include <relgraph/net/fetch_error.h>
#include <curl/curl.h>
#include <algorithm>
#include <utility>

namespace relgraph {
namespace net {

GraphApiClient::GraphApiClient(std::string base_url, std::string api_token, long timeout_seconds)
    : base_url_(std::move(base_url)), api_token_(std::move(api_token)), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

int GraphApiClient::ClampLimit(int limit) {
    return std::clamp(limit, graph::GraphScope::kMinLimit, graph::GraphScope::kMaxLimit);
}

std::string GraphApiClient::BuildGraphUrl(const graph::GraphScope& scope) const {
    std::string url = base_url_ + "/graph/?";
    if (scope.investigation_id && !scope.investigation_id->empty()) {
        CurlHandle curl{curl_easy_init(), curl_easy_cleanup};
        if (!curl) {
            throw FetchError("Failed to initialize CURL");
        }
        url += "investigation_id=" + EscapeQueryValue(curl.get(), *scope.investigation_id) + "&";
    }
    url += "limit=" + std::to_string(ClampLimit(scope.limit));
    return url;
}

graph::GraphData GraphApiClient::FetchGraph(const graph::GraphScope& scope, std::stop_token stop) {
    std::string url = BuildGraphUrl(scope);

    CurlHandle curl{curl_easy_init(), curl_easy_cleanup};
    if (!curl) {
        throw FetchError("Failed to initialize CURL");
    }

    struct curl_slist* headers = nullptr;
    CurlHeaders headers_guard{nullptr, curl_slist_free_all};
    headers = curl_slist_append(headers, "Accept: application/json");
    if (!api_token_.empty()) {
        headers = curl_slist_append(headers, ("Authorization: Bearer " + api_token_).c_str());
    }
    headers_guard.reset(headers);

    std::string response_buffer;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response_buffer);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeout_seconds_);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, StopTokenProgressCallback);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &stop);

    CURLcode res = curl_easy_perform(curl.get());
    if (res == CURLE_ABORTED_BY_CALLBACK) {
        throw FetchError("Graph request cancelled");
    }
    if (res != CURLE_OK) {
        throw FetchError("Graph request failed: " + std::string(curl_easy_strerror(res)));
    }

    long http_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_code);
    if (http_code == 401) {
        throw FetchError("Graph request unauthorized (HTTP 401)", http_code);
    }
    if (http_code != 200) {
        throw FetchError("Graph request returned HTTP status " + std::to_string(http_code) +
                             ". Response: " + response_buffer,
                         http_code);
    }

    return graph::ParseGraphResponse(response_buffer);
}

} // namespace net
} // namespace relgraph
