#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <vector>
#include <nlohmann/json.hpp>

namespace protocol {

enum class AssetType {
    PHOTO,
    VIDEO,
    LIVE_PHOTO
};

NLOHMANN_JSON_SERIALIZE_ENUM(AssetType, {
    {AssetType::PHOTO, "photo"},
    {AssetType::VIDEO, "video"},
    {AssetType::LIVE_PHOTO, "live_photo"},
})

// One library item as exchanged with the peer, not as stored.
struct AssetMetadata {
    std::string id;
    std::string filename;
    AssetType type = AssetType::PHOTO;
    uint64_t size_bytes = 0;
    int width = 0;
    int height = 0;
    std::optional<double> duration_seconds; // absent for plain photos
    std::string creation_date;               // ISO-8601
    bool is_live_photo = false;
};

struct AssetListResponse {
    std::vector<AssetMetadata> assets;
    uint64_t total_count = 0;
    uint64_t photos_count = 0;
    uint64_t videos_count = 0;
    uint64_t total_size_bytes = 0;
};

// Key names are a contract with the peer implementation.
void to_json(nlohmann::json& j, const AssetMetadata& meta);
void from_json(const nlohmann::json& j, AssetMetadata& meta);
void to_json(nlohmann::json& j, const AssetListResponse& response);
void from_json(const nlohmann::json& j, AssetListResponse& response);

// Builds the response with aggregates recomputed from `assets`.
AssetListResponse build_asset_list(std::vector<AssetMetadata> assets);

std::vector<uint8_t> serialize_asset_list(const AssetListResponse& response);

// Throws nlohmann::json::exception on malformed input.
AssetListResponse parse_asset_list(const std::vector<uint8_t>& payload);

} // namespace protocol
