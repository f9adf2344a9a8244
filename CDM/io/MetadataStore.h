#pragma once
#include <string>

#include "../core/utils.h"

// JSON state file for one name prefix: <dir>/.<prefix>-state.json
class MetadataStore
{
public:
    explicit MetadataStore(const std::string& path);

    static std::string pathFor(const std::string& dir, const std::string& prefix);

    Error load(TransferSnapshot& out) const;
    // Writes <path>.tmp then renames it over <path>.
    Error save(const TransferSnapshot& data) const;
    Error remove() const;

    bool exists() const;
    bool validate(const TransferSnapshot& local,
        const std::string& url,
        std::int64_t totalSize) const;

    const std::string& path() const { return metadataPath; }

private:
    std::string metadataPath;
};
