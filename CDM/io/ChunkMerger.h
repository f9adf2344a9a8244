#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "../core/utils.h"

class Logger;

// "<dir>/<basename>.<digits>.part" -> ("<dir>/<basename>", index).
// Any other shape is rejected.
bool parseChunkArtifactName(const std::string& path,
    std::string& groupKey,
    std::uint64_t& index);

// Groups artifacts by "<dir>/<basename>"; unparseable names are dropped.
std::map<std::string, std::vector<std::string>> groupChunkArtifacts(const std::vector<std::string>& files);

// Sorted matches of a shell glob. No match is not an error.
Error globFiles(const std::string& pattern, std::vector<std::string>& out);

// Concatenates complete chunk artifacts back into their original files.
class ChunkMerger {
public:
    ChunkMerger(const MergeConfig& config, Logger& logger);

    Error merge();

    // Sources are appended in lexicographic order, which equals index order
    // because indices are zero-padded to a fixed width.
    Error mergeFiles(const std::string& outputPath,
        std::vector<std::string> sources,
        const std::string& stateDir,
        const std::string& basename);

    std::int64_t lastMergedBytes() const { return mergedBytes; }

private:
    Error mergeAllGroups(const std::map<std::string, std::vector<std::string>>& groups);
    void warnOnGaps(const std::string& groupKey, const std::vector<std::string>& files);

private:
    MergeConfig cfg;
    Logger& logger;
    std::int64_t mergedBytes = 0;
};
