#include "asset_store.hpp"
#include "security.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iostream>
#include <set>

namespace fs = std::filesystem;

namespace assets {

namespace {

const char* const PAIRED_VIDEO_SUFFIX = "/video";

std::string lowercase(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool is_hidden(const fs::path& path) {
    std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

int64_t to_unix_seconds(fs::file_time_type ftime) {
    auto sctp = std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        ftime - fs::file_time_type::clock::now() + std::chrono::system_clock::now());
    return std::chrono::duration_cast<std::chrono::seconds>(sctp.time_since_epoch()).count();
}

std::string iso8601_utc(int64_t unix_seconds) {
    std::time_t t = static_cast<std::time_t>(unix_seconds);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buf);
}

std::optional<std::vector<uint8_t>> read_whole_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }
    file.seekg(0, std::ios::end);
    auto size = file.tellg();
    file.seekg(0);

    std::vector<uint8_t> bytes(static_cast<std::size_t>(size));
    if (!bytes.empty() && !file.read(reinterpret_cast<char*>(bytes.data()), size)) {
        throw AssetStoreError("Failed to read " + path.string());
    }
    return bytes;
}

uint16_t read_be16(std::istream& in) {
    unsigned char b[2] = {0, 0};
    in.read(reinterpret_cast<char*>(b), 2);
    return static_cast<uint16_t>((b[0] << 8) | b[1]);
}

} // namespace

bool is_photo_extension(const std::string& ext) {
    static const std::set<std::string> photos = {
        ".jpg", ".jpeg", ".png", ".heic", ".heif", ".gif", ".webp", ".tif", ".tiff", ".dng"
    };
    return photos.count(lowercase(ext)) > 0;
}

bool is_video_extension(const std::string& ext) {
    static const std::set<std::string> videos = {
        ".mov", ".mp4", ".m4v", ".avi", ".mkv", ".3gp"
    };
    return videos.count(lowercase(ext)) > 0;
}

std::pair<int, int> probe_dimensions(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) return {0, 0};

    unsigned char sig[8] = {0};
    file.read(reinterpret_cast<char*>(sig), 8);
    if (file.gcount() < 8) return {0, 0};

    // PNG: IHDR is always the first chunk
    static const unsigned char png_sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    if (std::equal(sig, sig + 8, png_sig)) {
        unsigned char ihdr[16] = {0};
        file.read(reinterpret_cast<char*>(ihdr), 16);
        if (file.gcount() < 16) return {0, 0};
        auto be32 = [](const unsigned char* p) {
            return static_cast<int>((uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) |
                                    (uint32_t(p[2]) << 8) | uint32_t(p[3]));
        };
        return {be32(ihdr + 8), be32(ihdr + 12)};
    }

    // JPEG: walk segments until a start-of-frame marker
    if (sig[0] != 0xFF || sig[1] != 0xD8) return {0, 0};
    file.seekg(2);
    while (file) {
        int c = file.get();
        if (c != 0xFF) {
            if (c == EOF) break;
            continue;
        }
        int marker = file.get();
        while (marker == 0xFF) marker = file.get();
        if (marker == EOF || marker == 0xD9 || marker == 0xDA) break;
        if (marker == 0x01 || (marker >= 0xD0 && marker <= 0xD8)) continue;

        uint16_t length = read_be16(file);
        if (length < 2) break;

        bool is_sof = marker >= 0xC0 && marker <= 0xCF &&
                      marker != 0xC4 && marker != 0xC8 && marker != 0xCC;
        if (is_sof) {
            file.get(); // sample precision
            int height = read_be16(file);
            int width = read_be16(file);
            if (!file) break;
            return {width, height};
        }
        file.seekg(length - 2, std::ios::cur);
    }
    return {0, 0};
}

protocol::AssetMetadata to_metadata(const AssetRecord& record, uint64_t size_bytes) {
    protocol::AssetMetadata meta;
    meta.id = record.id;
    meta.filename = record.filename;
    meta.type = record.type;
    meta.size_bytes = size_bytes;
    meta.width = record.width;
    meta.height = record.height;
    meta.duration_seconds = record.type == protocol::AssetType::PHOTO
        ? std::nullopt : record.duration_seconds;
    meta.creation_date = record.creation_date;
    meta.is_live_photo = record.type == protocol::AssetType::LIVE_PHOTO;
    return meta;
}

protocol::AssetListResponse snapshot(AssetStore& store, const SnapshotProgress& progress) {
    std::vector<AssetRecord> records = store.list_assets();
    std::vector<protocol::AssetMetadata> metadata;
    metadata.reserve(records.size());

    std::size_t done = 0;
    for (const auto& record : records) {
        uint64_t size = store.size_of(record.id).value_or(0);
        metadata.push_back(to_metadata(record, size));

        ++done;
        if (progress) progress(static_cast<double>(done) / records.size());
    }
    if (records.empty() && progress) progress(1.0);

    return protocol::build_asset_list(std::move(metadata));
}

std::string file_request_info(const std::string& id, Component component) {
    if (component == Component::PAIRED_VIDEO) {
        return id + PAIRED_VIDEO_SUFFIX;
    }
    return id;
}

std::pair<std::string, Component> parse_file_request(const std::string& info) {
    auto slash = info.find('/');
    if (slash != std::string::npos && info.substr(slash) == PAIRED_VIDEO_SUFFIX) {
        return {info.substr(0, slash), Component::PAIRED_VIDEO};
    }
    return {info, Component::PRIMARY};
}

// ─── DirectoryAssetStore ────────────────────────────────────────────────────

DirectoryAssetStore::DirectoryAssetStore(fs::path root, uint64_t max_inline_thumbnail_bytes)
    : root_(std::move(root)), max_inline_thumbnail_bytes_(max_inline_thumbnail_bytes) {}

void DirectoryAssetStore::refresh() {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw AssetStoreError("Library directory not found: " + root_.string());
    }

    struct Candidate {
        fs::path path;
        int64_t modified;
    };
    // Keyed by parent directory + lowercase stem so live pairs line up
    std::map<std::string, std::vector<Candidate>> photos;
    std::map<std::string, std::vector<Candidate>> videos;

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw AssetStoreError("Cannot read " + root_.string() + ": " + ec.message());
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            std::cerr << "[AssetStore] Skipping entry: " << ec.message() << "\n";
            ec.clear();
            continue;
        }
        const auto& path = it->path();
        if (is_hidden(path)) {
            if (it->is_directory(ec)) it.disable_recursion_pending();
            continue;
        }
        if (!it->is_regular_file(ec)) continue;

        std::string key = (path.parent_path() / lowercase(path.stem().string())).string();
        std::string ext = path.extension().string();
        int64_t modified = to_unix_seconds(it->last_write_time(ec));

        if (is_photo_extension(ext)) {
            photos[key].push_back({path, modified});
        } else if (is_video_extension(ext)) {
            videos[key].push_back({path, modified});
        }
    }

    std::map<std::string, Entry> entries;
    auto add_entry = [&](const Candidate& c, protocol::AssetType type,
                         std::optional<fs::path> paired) {
        Entry entry;
        entry.primary = c.path;
        entry.paired_video = std::move(paired);
        entry.modified = c.modified;

        std::string relative = fs::relative(c.path, root_, ec).generic_string();
        entry.record.id = security::hash_hex(relative.empty() ? c.path.string() : relative);
        entry.record.filename = c.path.filename().string();
        entry.record.type = type;
        entry.record.creation_date = iso8601_utc(c.modified);

        if (type == protocol::AssetType::VIDEO) {
            // Container parsing is not done here; duration stays present but unknown
            entry.record.duration_seconds = 0.0;
        } else {
            auto dims = probe_dimensions(c.path);
            entry.record.width = dims.first;
            entry.record.height = dims.second;
        }
        entries[entry.record.id] = std::move(entry);
    };

    std::set<std::string> paired_keys;
    for (const auto& [key, list] : photos) {
        auto video = videos.find(key);
        bool live = video != videos.end() && list.size() == 1 && video->second.size() == 1;
        if (live) {
            paired_keys.insert(key);
            add_entry(list.front(), protocol::AssetType::LIVE_PHOTO, video->second.front().path);
        } else {
            for (const auto& c : list) add_entry(c, protocol::AssetType::PHOTO, std::nullopt);
        }
    }
    for (const auto& [key, list] : videos) {
        if (paired_keys.count(key)) continue;
        for (const auto& c : list) add_entry(c, protocol::AssetType::VIDEO, std::nullopt);
    }

    std::vector<std::string> order;
    order.reserve(entries.size());
    for (const auto& [id, entry] : entries) order.push_back(id);
    std::sort(order.begin(), order.end(), [&entries](const std::string& a, const std::string& b) {
        const auto& ea = entries.at(a);
        const auto& eb = entries.at(b);
        if (ea.modified != eb.modified) return ea.modified > eb.modified;
        return ea.primary < eb.primary;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    entries_ = std::move(entries);
    order_ = std::move(order);
    scanned_ = true;

    std::cout << "[AssetStore] Indexed " << entries_.size() << " assets under " << root_.string() << "\n";
}

void DirectoryAssetStore::ensure_scanned() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (scanned_) return;
    }
    refresh();
}

std::optional<DirectoryAssetStore::Entry> DirectoryAssetStore::lookup(const std::string& id) {
    ensure_scanned();
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<AssetRecord> DirectoryAssetStore::list_assets() {
    ensure_scanned();
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AssetRecord> records;
    records.reserve(order_.size());
    for (const auto& id : order_) {
        records.push_back(entries_.at(id).record);
    }
    return records;
}

std::optional<AssetRecord> DirectoryAssetStore::find(const std::string& id) {
    auto entry = lookup(id);
    if (!entry) return std::nullopt;
    return entry->record;
}

std::optional<uint64_t> DirectoryAssetStore::size_of(const std::string& id) {
    auto entry = lookup(id);
    if (!entry) return std::nullopt;

    std::error_code ec;
    uint64_t total = fs::file_size(entry->primary, ec);
    if (ec) {
        throw AssetStoreError("Cannot stat " + entry->primary.string() + ": " + ec.message());
    }
    if (entry->paired_video) {
        uint64_t video = fs::file_size(*entry->paired_video, ec);
        if (!ec) total += video;
    }
    return total;
}

std::optional<std::vector<uint8_t>> DirectoryAssetStore::make_thumbnail(const std::string& id) {
    auto entry = lookup(id);
    if (!entry) return std::nullopt;

    fs::path sidecar = entry->primary.parent_path() / ".thumbnails" /
                       (entry->primary.stem().string() + ".jpg");
    std::error_code ec;
    if (fs::is_regular_file(sidecar, ec)) {
        return read_whole_file(sidecar);
    }

    if (entry->record.type == protocol::AssetType::VIDEO) {
        return std::nullopt;
    }
    uint64_t size = fs::file_size(entry->primary, ec);
    if (ec || size > max_inline_thumbnail_bytes_) {
        return std::nullopt;
    }
    return read_whole_file(entry->primary);
}

std::unique_ptr<transfer::PayloadSource> DirectoryAssetStore::open_original(const std::string& id,
                                                                            Component component) {
    auto entry = lookup(id);
    if (!entry) return nullptr;

    fs::path path = entry->primary;
    if (component == Component::PAIRED_VIDEO) {
        if (!entry->paired_video) return nullptr;
        path = *entry->paired_video;
    }

    auto payload = std::make_unique<transfer::FilePayload>(path.string());
    if (!payload->is_open()) {
        throw AssetStoreError("Cannot open " + path.string());
    }
    return payload;
}

} // namespace assets
