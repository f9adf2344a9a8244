#include "MetadataStore.h"
#include "../core/ChunkPlan.h"
#include <algorithm>
#include <fstream>
#include <filesystem>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {
json toJson(const TransferSnapshot& data) {
    json chunks = json::array();
    for (const auto& c : data.chunks) {
        chunks.push_back({
            { "index", c.index },
            { "start", c.start },
            { "end", c.end },
            { "downloaded", c.downloadedBytes },
            { "completed", c.transferComplete },
            { "post_part_completed", c.hookComplete }
            });
    }

    return {
        { "url", data.url },
        { "total_size", data.totalSize },
        { "chunk_size", data.chunkSize },
        { "filename_prefix", data.namePrefix },
        { "chunks", chunks },
        { "completed_count", data.completedCount }
    };
}

void fromJson(const json& j, TransferSnapshot& out) {
    out.url = j.at("url").get<std::string>();
    out.totalSize = j.at("total_size").get<std::int64_t>();
    out.chunkSize = j.at("chunk_size").get<std::int64_t>();
    out.namePrefix = j.at("filename_prefix").get<std::string>();

    out.chunks.clear();
    for (const auto& jc : j.at("chunks")) {
        ChunkDescriptor c;
        c.index = jc.at("index").get<int>();
        c.start = jc.at("start").get<std::int64_t>();
        c.end = jc.at("end").get<std::int64_t>();
        c.downloadedBytes = jc.value("downloaded", std::int64_t{ 0 });
        c.transferComplete = jc.value("completed", false);
        c.hookComplete = jc.value("post_part_completed", false);
        out.chunks.push_back(c);
    }

    out.completedCount = j.value("completed_count", 0);
}

// Rejects files whose chunk list breaks the plan invariants.
Error checkShape(const TransferSnapshot& s, const std::string& path) {
    if (s.chunks.empty())
        return { ErrorCode::Io, "state file " + path + " has no chunks" };
    if (static_cast<std::int64_t>(s.chunks.size()) > kMaxChunkCount)
        return { ErrorCode::Io, "state file " + path + " lists more than " + std::to_string(kMaxChunkCount) + " chunks" };
    if (s.chunks.front().start != 0 || s.chunks.back().end != s.totalSize - 1)
        return { ErrorCode::Io, "state file " + path + " does not cover the whole resource" };

    for (std::size_t i = 0; i < s.chunks.size(); ++i) {
        const auto& c = s.chunks[i];
        if (c.index != static_cast<int>(i) || c.end < c.start)
            return { ErrorCode::Io, "state file " + path + " has a malformed chunk at position " + std::to_string(i) };
        if (i + 1 < s.chunks.size() && c.end + 1 != s.chunks[i + 1].start)
            return { ErrorCode::Io, "state file " + path + " has non-contiguous chunks at index " + std::to_string(i) };
    }
    return {};
}
}

MetadataStore::MetadataStore(const std::string& path)
    : metadataPath(path) {}

std::string MetadataStore::pathFor(const std::string& dir, const std::string& prefix) {
    return (fs::path(dir) / ("." + prefix + "-state.json")).string();
}

bool MetadataStore::exists() const {
    std::error_code ec;
    return fs::exists(metadataPath, ec);
}

Error MetadataStore::load(TransferSnapshot& out) const {
    std::ifstream in(metadataPath);
    if (!in.is_open())
        return { ErrorCode::Io, "failed to open state file " + metadataPath };

    try {
        json j = json::parse(in);
        fromJson(j, out);
    }
    catch (const json::exception& e) {
        return { ErrorCode::Io, "failed to parse state file " + metadataPath + ": " + e.what() };
    }

    if (Error err = checkShape(out, metadataPath))
        return err;

    // completed_count is derived; never trust the stored copy over the flags
    int completed = 0;
    for (auto& c : out.chunks) {
        c.downloadedBytes = std::clamp<std::int64_t>(c.downloadedBytes, 0, c.length());
        if (c.transferComplete)
            ++completed;
    }
    out.completedCount = completed;

    return {};
}

Error MetadataStore::save(const TransferSnapshot& data) const {
    const std::string tmpPath = metadataPath + ".tmp";

    {
        std::ofstream out(tmpPath, std::ios::trunc);
        if (!out.is_open())
            return { ErrorCode::Io, "failed to write state file " + tmpPath };

        out << toJson(data).dump(2) << '\n';
        out.flush();
        if (!out)
            return { ErrorCode::Io, "failed to write state file " + tmpPath };
    }

    std::error_code ec;
    fs::rename(tmpPath, metadataPath, ec);

    if (ec) {
        fs::remove(tmpPath, ec);
        return { ErrorCode::Io, "failed to rename state file into " + metadataPath };
    }

    return {};
}

Error MetadataStore::remove() const {
    std::error_code ec;
    fs::remove(metadataPath, ec);
    if (ec)
        return { ErrorCode::Io, "failed to delete state file " + metadataPath + ": " + ec.message() };
    return {};
}

bool MetadataStore::validate(const TransferSnapshot& local,
    const std::string& url,
    std::int64_t totalSize) const {
    return local.url == url && local.totalSize == totalSize;
}
