#include "test_util.hpp"
#include "protocol/asset_meta.hpp"

#include <cstdio>
#include <string>
#include <vector>

using namespace protocol;

static AssetMetadata make_asset(const std::string& id, AssetType type, uint64_t size) {
    AssetMetadata meta;
    meta.id = id;
    meta.filename = id + ".bin";
    meta.type = type;
    meta.size_bytes = size;
    meta.width = 4032;
    meta.height = 3024;
    meta.creation_date = "2024-05-01T10:00:00Z";
    meta.is_live_photo = type == AssetType::LIVE_PHOTO;
    if (type != AssetType::PHOTO) meta.duration_seconds = 2.5;
    return meta;
}

static void test_aggregates() {
    std::fprintf(stderr, "-- test_aggregates\n");

    auto response = build_asset_list({
        make_asset("a", AssetType::PHOTO, 100),
        make_asset("b", AssetType::VIDEO, 2000),
        make_asset("c", AssetType::LIVE_PHOTO, 300),
        make_asset("d", AssetType::VIDEO, 4000),
    });

    CHECK_EQ(response.total_count, 4u);
    CHECK_EQ(response.photos_count, 2u);
    CHECK_EQ(response.videos_count, 2u);
    CHECK_EQ(response.photos_count + response.videos_count, response.total_count);
    CHECK_EQ(response.total_size_bytes, 6400u);

    auto empty = build_asset_list({});
    CHECK_EQ(empty.total_count, 0u);
    CHECK_EQ(empty.total_size_bytes, 0u);
}

static void test_json_keys() {
    std::fprintf(stderr, "-- test_json_keys\n");

    auto response = build_asset_list({
        make_asset("p1", AssetType::PHOTO, 10),
        make_asset("v1", AssetType::VIDEO, 20),
    });
    auto payload = serialize_asset_list(response);
    auto j = nlohmann::json::parse(payload.begin(), payload.end());

    CHECK(j.contains("total_count"));
    CHECK(j.contains("photos_count"));
    CHECK(j.contains("videos_count"));
    CHECK(j.contains("total_size_bytes"));
    CHECK_EQ(j["assets"].size(), 2u);

    const auto& photo = j["assets"][0];
    CHECK(photo.contains("size_bytes"));
    CHECK(photo.contains("creation_date"));
    CHECK(photo.contains("is_live_photo"));
    CHECK(!photo.contains("duration_seconds"));
    CHECK(photo["type"] == "photo");

    const auto& video = j["assets"][1];
    CHECK(video.contains("duration_seconds"));
    CHECK(video["type"] == "video");
}

static void test_parse() {
    std::fprintf(stderr, "-- test_parse\n");

    auto response = build_asset_list({
        make_asset("live", AssetType::LIVE_PHOTO, 77),
        make_asset("still", AssetType::PHOTO, 5),
    });
    auto parsed = parse_asset_list(serialize_asset_list(response));

    CHECK_EQ(parsed.assets.size(), 2u);
    CHECK_STR_EQ(parsed.assets[0].id, "live");
    CHECK(parsed.assets[0].type == AssetType::LIVE_PHOTO);
    CHECK(parsed.assets[0].is_live_photo);
    CHECK(parsed.assets[0].duration_seconds.has_value());
    CHECK(!parsed.assets[1].duration_seconds.has_value());
    CHECK_EQ(parsed.total_size_bytes, 82u);

    // Explicit null is accepted as absent
    std::string text = R"({"assets":[{"id":"x","filename":"x.jpg","type":"photo","size_bytes":1,
        "width":0,"height":0,"duration_seconds":null,"creation_date":"","is_live_photo":false}],
        "total_count":1,"photos_count":1,"videos_count":0,"total_size_bytes":1})";
    auto with_null = parse_asset_list(std::vector<uint8_t>(text.begin(), text.end()));
    CHECK(!with_null.assets[0].duration_seconds.has_value());

    bool threw = false;
    try {
        std::string bad = "{\"assets\": 5}";
        parse_asset_list(std::vector<uint8_t>(bad.begin(), bad.end()));
    } catch (nlohmann::json::exception&) {
        threw = true;
    }
    CHECK(threw);
}

static void test_invalid_filename_bytes() {
    std::fprintf(stderr, "-- test_invalid_filename_bytes\n");

    auto meta = make_asset("bad", AssetType::PHOTO, 1);
    meta.filename = "IMG_\xFF.jpg";
    auto payload = serialize_asset_list(build_asset_list({meta}));
    auto parsed = parse_asset_list(payload);
    CHECK_EQ(parsed.assets.size(), 1u);
    CHECK_STR_EQ(parsed.assets[0].id, "bad");
}

int main() {
    test_aggregates();
    test_json_keys();
    test_parse();
    test_invalid_filename_bytes();
    TEST_SUMMARY();
    return g_fail_count > 0 ? 1 : 0;
}
