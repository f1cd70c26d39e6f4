#pragma once

#include <string>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include "protocol/asset_meta.hpp"
#include "transfer.hpp"

namespace assets {

// I/O fault inside a store. Not-found is reported with empty results instead.
class AssetStoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class Component {
    PRIMARY,      // the still image of a live photo, or the only file otherwise
    PAIRED_VIDEO  // motion component of a live photo
};

// Everything about an asset except its size, which may be expensive.
struct AssetRecord {
    std::string id;
    std::string filename;
    protocol::AssetType type = protocol::AssetType::PHOTO;
    int width = 0;
    int height = 0;
    std::optional<double> duration_seconds;
    std::string creation_date;
};

protocol::AssetMetadata to_metadata(const AssetRecord& record, uint64_t size_bytes);

class AssetStore {
public:
    virtual ~AssetStore() = default;

    // Cheap metadata for the whole library, newest first.
    virtual std::vector<AssetRecord> list_assets() = 0;
    virtual std::optional<AssetRecord> find(const std::string& id) = 0;

    virtual std::optional<uint64_t> size_of(const std::string& id) = 0;
    virtual std::optional<std::vector<uint8_t>> make_thumbnail(const std::string& id) = 0;

    // nullptr when the asset or the component does not exist.
    virtual std::unique_ptr<transfer::PayloadSource> open_original(const std::string& id,
                                                                   Component component) = 0;
};

// Progress is reported as the fraction of assets whose size is known.
using SnapshotProgress = std::function<void(double)>;

// Full metadata snapshot with sizes and aggregates. Propagates AssetStoreError.
protocol::AssetListResponse snapshot(AssetStore& store, const SnapshotProgress& progress = nullptr);

// GET_FULL_FILE info field: "<id>" for the primary component,
// "<id>/video" for a live photo's paired video. Ids never contain '/'.
std::string file_request_info(const std::string& id, Component component);
std::pair<std::string, Component> parse_file_request(const std::string& info);

// Serves a directory tree of media files.
//
// A photo with a sibling video of the same stem is a live photo; the sibling
// is its paired video and is not listed on its own. Ids are a BLAKE2b digest
// of the path relative to the root.
class DirectoryAssetStore : public AssetStore {
public:
    explicit DirectoryAssetStore(std::filesystem::path root,
                                 uint64_t max_inline_thumbnail_bytes = 512 * 1024);

    // Rescans the tree. Throws AssetStoreError when the root is unreadable.
    void refresh();

    std::vector<AssetRecord> list_assets() override;
    std::optional<AssetRecord> find(const std::string& id) override;
    std::optional<uint64_t> size_of(const std::string& id) override;
    std::optional<std::vector<uint8_t>> make_thumbnail(const std::string& id) override;
    std::unique_ptr<transfer::PayloadSource> open_original(const std::string& id,
                                                           Component component) override;

    const std::filesystem::path& root() const { return root_; }

private:
    struct Entry {
        AssetRecord record;
        std::filesystem::path primary;
        std::optional<std::filesystem::path> paired_video;
        int64_t modified = 0;
    };

    std::filesystem::path root_;
    uint64_t max_inline_thumbnail_bytes_;
    std::mutex mutex_;
    bool scanned_ = false;
    std::map<std::string, Entry> entries_;
    std::vector<std::string> order_;

    void ensure_scanned();
    std::optional<Entry> lookup(const std::string& id);
};

bool is_photo_extension(const std::string& ext);
bool is_video_extension(const std::string& ext);

// Pixel dimensions from a PNG IHDR or JPEG SOF header; {0, 0} if unknown.
std::pair<int, int> probe_dimensions(const std::filesystem::path& path);

} // namespace assets
