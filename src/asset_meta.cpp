#include "protocol/asset_meta.hpp"

namespace protocol {

void to_json(nlohmann::json& j, const AssetMetadata& meta) {
    j = nlohmann::json{
        {"id", meta.id},
        {"filename", meta.filename},
        {"type", meta.type},
        {"size_bytes", meta.size_bytes},
        {"width", meta.width},
        {"height", meta.height},
        {"creation_date", meta.creation_date},
        {"is_live_photo", meta.is_live_photo}
    };
    if (meta.duration_seconds) {
        j["duration_seconds"] = *meta.duration_seconds;
    }
}

void from_json(const nlohmann::json& j, AssetMetadata& meta) {
    j.at("id").get_to(meta.id);
    j.at("filename").get_to(meta.filename);
    j.at("type").get_to(meta.type);
    j.at("size_bytes").get_to(meta.size_bytes);
    j.at("width").get_to(meta.width);
    j.at("height").get_to(meta.height);
    j.at("creation_date").get_to(meta.creation_date);
    j.at("is_live_photo").get_to(meta.is_live_photo);

    auto it = j.find("duration_seconds");
    if (it != j.end() && !it->is_null()) {
        meta.duration_seconds = it->get<double>();
    } else {
        meta.duration_seconds.reset();
    }
}

void to_json(nlohmann::json& j, const AssetListResponse& response) {
    j = nlohmann::json{
        {"assets", response.assets},
        {"total_count", response.total_count},
        {"photos_count", response.photos_count},
        {"videos_count", response.videos_count},
        {"total_size_bytes", response.total_size_bytes}
    };
}

void from_json(const nlohmann::json& j, AssetListResponse& response) {
    j.at("assets").get_to(response.assets);
    j.at("total_count").get_to(response.total_count);
    j.at("photos_count").get_to(response.photos_count);
    j.at("videos_count").get_to(response.videos_count);
    j.at("total_size_bytes").get_to(response.total_size_bytes);
}

AssetListResponse build_asset_list(std::vector<AssetMetadata> assets) {
    AssetListResponse response;
    response.assets = std::move(assets);
    response.total_count = response.assets.size();

    for (const auto& meta : response.assets) {
        if (meta.type == AssetType::VIDEO) {
            ++response.videos_count;
        } else {
            ++response.photos_count; // photo and live_photo
        }
        response.total_size_bytes += meta.size_bytes;
    }
    return response;
}

std::vector<uint8_t> serialize_asset_list(const AssetListResponse& response) {
    nlohmann::json j = response;
    std::string payload = j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return std::vector<uint8_t>(payload.begin(), payload.end());
}

AssetListResponse parse_asset_list(const std::vector<uint8_t>& payload) {
    nlohmann::json j = nlohmann::json::parse(payload.begin(), payload.end());
    return j.get<AssetListResponse>();
}

} // namespace protocol
