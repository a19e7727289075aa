#include "sloup/storage/manifest_json.hpp"

#include <utility>

#include <json/json.h>

namespace sloup::storage {

using namespace sloup::core;

std::string manifest_to_json(const Manifest& entries) {
    Json::Value root(Json::arrayValue);
    for (const ManifestEntry& e : entries) {
        Json::Value item(Json::objectValue);
        item["path"] = e.path;
        item["etag"] = e.etag;
        item["size_bytes"] = Json::UInt64(e.size_bytes);
        root.append(std::move(item));
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, root);
}

} // namespace sloup::storage
