#include <relgraph/graph/model/graph_json.h>
#include <relgraph/net/fetch_error.h>
#include <nlohmann/json.hpp>
#include <optional>

namespace relgraph {
namespace graph {
namespace {

using json = nlohmann::ordered_json;

// Ids arrive as strings or as database integers.
std::optional<std::string> ReadId(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number_integer()) return std::to_string(it->get<long long>());
    if (it->is_number_unsigned()) return std::to_string(it->get<unsigned long long>());
    return std::nullopt;
}

std::string ReadString(const json& object, const char* key, const std::string& fallback) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

PropertyMap ReadProperties(const json& object) {
    auto it = object.find("properties");
    if (it == object.end() || !it->is_object()) return PropertyMap::object();
    return *it;
}

const json& RequireArray(const json& document, const char* key) {
    auto it = document.find(key);
    if (it == document.end() || !it->is_array()) {
        throw net::FetchError(std::string("Graph response has no '") + key + "' array");
    }
    return *it;
}

} // namespace

GraphData ParseGraphResponse(const std::string& body) {
    json document;
    try {
        document = json::parse(body);
    } catch (const json::parse_error& e) {
        throw net::FetchError(std::string("Graph response is not valid JSON: ") + e.what());
    }
    if (!document.is_object()) {
        throw net::FetchError("Graph response is not a JSON object");
    }

    GraphData data;
    const json& nodes = RequireArray(document, "nodes");
    const json& links = RequireArray(document, "links");

    data.nodes.reserve(nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const json& entry = nodes[i];
        if (!entry.is_object()) {
            throw net::FetchError("Graph node " + std::to_string(i) + " is not an object");
        }
        auto id = ReadId(entry, "id");
        if (!id) {
            throw net::FetchError("Graph node " + std::to_string(i) + " has no usable id");
        }
        RawNode node;
        node.id = std::move(*id);
        node.name = ReadString(entry, "name", "Unknown");
        node.type = ReadString(entry, "type", "");
        node.properties = ReadProperties(entry);
        data.nodes.push_back(std::move(node));
    }

    data.links.reserve(links.size());
    for (std::size_t i = 0; i < links.size(); ++i) {
        const json& entry = links[i];
        if (!entry.is_object()) {
            throw net::FetchError("Graph link " + std::to_string(i) + " is not an object");
        }
        auto source = ReadId(entry, "source");
        auto target = ReadId(entry, "target");
        if (!source || !target) {
            throw net::FetchError("Graph link " + std::to_string(i) + " has no usable endpoints");
        }
        RawLink link;
        link.source = std::move(*source);
        link.target = std::move(*target);
        link.type = ReadString(entry, "type", "");
        link.properties = ReadProperties(entry);
        data.links.push_back(std::move(link));
    }

    return data;
}

} // namespace graph
} // namespace relgraph
