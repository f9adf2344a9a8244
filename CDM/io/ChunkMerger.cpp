#include "ChunkMerger.h"
#include "MetadataStore.h"
#include "../monitor/Logger.h"
#include "../monitor/ProgressTracker.h"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <regex>
#include <vector>

#include <glob.h>

namespace fs = std::filesystem;

namespace {
const std::regex kPartName(R"(^(.+?)\.(\d+)\.part$)");

std::string groupBasename(const std::string& groupKey) {
    return fs::path(groupKey).filename().string();
}

std::string groupDirectory(const std::string& groupKey) {
    std::string dir = fs::path(groupKey).parent_path().string();
    return dir.empty() ? "." : dir;
}
}

bool parseChunkArtifactName(const std::string& path,
    std::string& groupKey,
    std::uint64_t& index) {
    const fs::path p(path);
    const std::string name = p.filename().string();

    std::smatch m;
    if (!std::regex_match(name, m, kPartName))
        return false;

    try {
        index = std::stoull(m[2].str());
    }
    catch (const std::exception&) {
        return false;
    }

    groupKey = (p.parent_path() / m[1].str()).string();
    return true;
}

std::map<std::string, std::vector<std::string>> groupChunkArtifacts(const std::vector<std::string>& files) {
    std::map<std::string, std::vector<std::string>> groups;

    for (const auto& file : files) {
        std::string key;
        std::uint64_t index = 0;
        if (parseChunkArtifactName(file, key, index))
            groups[key].push_back(file);
    }

    return groups;
}

Error globFiles(const std::string& pattern, std::vector<std::string>& out) {
    out.clear();

    glob_t g{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &g);
    if (rc == GLOB_NOMATCH) {
        globfree(&g);
        return {};
    }
    if (rc != 0) {
        globfree(&g);
        return { ErrorCode::Merge, "failed to expand pattern: " + pattern };
    }

    for (std::size_t i = 0; i < g.gl_pathc; ++i)
        out.emplace_back(g.gl_pathv[i]);
    globfree(&g);

    std::sort(out.begin(), out.end());
    return {};
}

ChunkMerger::ChunkMerger(const MergeConfig& config, Logger& log)
    : cfg(config), logger(log) {
    if (cfg.pattern.empty())
        cfg.pattern = "*.part";
}

Error ChunkMerger::merge() {
    std::vector<std::string> matches;
    if (Error err = globFiles(cfg.pattern, matches))
        return err;

    if (matches.empty())
        return { ErrorCode::Merge, "no files match pattern: " + cfg.pattern };

    const auto groups = groupChunkArtifacts(matches);

    if (!cfg.outputName.empty()) {
        // Exact "<dir>/<basename>" first, then a unique basename match
        auto it = groups.find(cfg.outputName);
        if (it == groups.end()) {
            const std::string wanted = fs::path(cfg.outputName).filename().string();
            auto found = groups.end();
            std::size_t hits = 0;
            for (auto g = groups.begin(); g != groups.end(); ++g) {
                if (groupBasename(g->first) == wanted) {
                    found = g;
                    ++hits;
                }
            }
            if (hits == 1)
                it = found;
        }

        if (it != groups.end())
            return mergeFiles(cfg.outputName, it->second, groupDirectory(it->first), groupBasename(it->first));

        if (cfg.strictOutputMatch)
            return { ErrorCode::Merge, "no chunk group named " + cfg.outputName + " matches " + cfg.pattern };

        logger.warn("no chunk group named " + cfg.outputName + "; merging all " +
            std::to_string(matches.size()) + " files matching " + cfg.pattern);
        return mergeFiles(cfg.outputName, matches, std::string(), std::string());
    }

    if (groups.empty())
        return { ErrorCode::Merge, "no valid chunk files found" };

    if (groups.size() == 1) {
        const auto& only = *groups.begin();
        logger.info("Auto-detected output name: " + only.first);
        return mergeFiles(only.first, only.second, groupDirectory(only.first), groupBasename(only.first));
    }

    return mergeAllGroups(groups);
}

Error ChunkMerger::mergeAllGroups(const std::map<std::string, std::vector<std::string>>& groups) {
    logger.info("Found " + std::to_string(groups.size()) + " download sessions to merge:");
    for (const auto& g : groups)
        logger.info("  - " + g.first + " (" + std::to_string(g.second.size()) + " files)");

    std::vector<std::string> failed;
    for (const auto& g : groups) {
        if (Error err = mergeFiles(g.first, g.second, groupDirectory(g.first), groupBasename(g.first))) {
            logger.error("failed to merge " + g.first + ": " + err.message);
            failed.push_back(g.first);
        }
    }

    if (failed.empty())
        return {};

    std::string list;
    for (const auto& name : failed)
        list += (list.empty() ? "" : ", ") + name;
    return { ErrorCode::Merge, std::to_string(failed.size()) + " of " + std::to_string(groups.size()) +
        " groups failed to merge: " + list };
}

void ChunkMerger::warnOnGaps(const std::string& groupKey, const std::vector<std::string>& files) {
    std::uint64_t expected = 0;
    for (const auto& f : files) {
        std::string key;
        std::uint64_t index = 0;
        if (!parseChunkArtifactName(f, key, index))
            continue;
        if (index != expected) {
            logger.warn(groupKey + ": expected chunk " + std::to_string(expected) + " but found " + f);
            return;
        }
        ++expected;
    }
}

Error ChunkMerger::mergeFiles(const std::string& outputPath,
    std::vector<std::string> sources,
    const std::string& stateDir,
    const std::string& basename) {
    mergedBytes = 0;
    std::sort(sources.begin(), sources.end());

    if (!basename.empty())
        warnOnGaps(outputPath, sources);

    logger.info("Merging " + std::to_string(sources.size()) + " chunk files into: " + outputPath);

    const std::string tmpPath = outputPath + ".assembling";
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open())
        return { ErrorCode::Merge, "failed to create output file " + tmpPath };

    std::size_t deleted = 0;
    auto fail = [&](const std::string& why) -> Error {
        out.close();
        std::error_code ec;
        // Keep the partial output if some sources are already gone
        if (deleted == 0) {
            fs::remove(tmpPath, ec);
            return { ErrorCode::Merge, why };
        }
        return { ErrorCode::Merge, why + " (" + std::to_string(deleted) +
            " merged chunks were already deleted; their bytes are kept in " + tmpPath + ")" };
    };

    std::vector<char> buffer(1 << 20);
    std::size_t current = 0;
    for (const auto& partPath : sources) {
        ++current;
        logger.debug("[" + std::to_string(current) + "/" + std::to_string(sources.size()) + "] Merging " + partPath);

        std::ifstream in(partPath, std::ios::binary);
        if (!in.is_open())
            return fail("failed to open " + partPath);

        while (in) {
            in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
            const std::streamsize got = in.gcount();
            if (got <= 0)
                break;
            out.write(buffer.data(), got);
            if (!out)
                return fail("failed to write " + tmpPath + " while copying " + partPath);
            mergedBytes += got;
        }
        if (in.bad())
            return fail("failed to read " + partPath);
        in.close();

        if (cfg.deleteAfter) {
            out.flush();
            if (!out)
                return fail("failed to write " + tmpPath);

            std::error_code ec;
            if (fs::remove(partPath, ec))
                ++deleted;
            else
                logger.warn("failed to delete " + partPath + ": " + ec.message());
        }
    }

    out.close();
    if (!out)
        return fail("failed to close output file " + tmpPath);

    std::error_code ec;
    fs::rename(tmpPath, outputPath, ec);
    if (ec)
        return fail("failed to rename " + tmpPath + " to " + outputPath + ": " + ec.message());

    logger.info("Merge complete: " + outputPath + " (" + formatBytes(mergedBytes) + ")");

    if (cfg.deleteAfter && !basename.empty()) {
        MetadataStore store(MetadataStore::pathFor(stateDir, basename));
        if (store.exists()) {
            if (Error err = store.remove())
                logger.warn(err.message);
        }
    }

    return {};
}
