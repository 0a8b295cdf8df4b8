#include <relgraph/net/curl_utils.h>
#include <relgraph/net/fetch_error.h>

namespace relgraph {
namespace net {

size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* output) {
    size_t total_size = size * nmemb;
    output->append(static_cast<char*>(contents), total_size);
    return total_size;
}

int StopTokenProgressCallback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* stop = static_cast<const std::stop_token*>(clientp);
    return (stop && stop->stop_requested()) ? 1 : 0;
}

std::string EscapeQueryValue(CURL* curl, const std::string& value) {
    char* escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.length()));
    if (!escaped) {
        throw FetchError("Failed to encode query parameter");
    }
    std::string result(escaped);
    curl_free(escaped);
    return result;
}

} // namespace net
} // namespace relgraph
