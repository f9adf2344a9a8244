#include "TransferState.h"
#include "ChunkPlan.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

std::string chunkFileName(const std::string& prefix, int index, const char* suffix) {
    std::ostringstream os;
    os << prefix << '.' << std::setw(6) << std::setfill('0') << index << '.' << suffix;
    return os.str();
}

TransferState::TransferState(TransferSnapshot snapshot, const std::string& dir)
    : data(std::move(snapshot)),
    dirPath(dir),
    store(MetadataStore::pathFor(dir, data.namePrefix)) {
}

std::unique_ptr<TransferState> TransferState::create(const std::string& url,
    std::int64_t totalSize,
    std::int64_t chunkSize,
    const std::string& namePrefix,
    const std::string& dir,
    Error& err) {
    std::vector<ChunkRange> ranges;
    err = planChunks(totalSize, chunkSize, ranges);
    if (err)
        return nullptr;

    TransferSnapshot s;
    s.url = url;
    s.totalSize = totalSize;
    s.chunkSize = chunkSize;
    s.namePrefix = namePrefix;
    s.completedCount = 0;
    s.chunks.reserve(ranges.size());

    int index = 0;
    for (const auto& r : ranges) {
        ChunkDescriptor c;
        c.index = index++;
        c.start = r.start;
        c.end = r.end;
        s.chunks.push_back(c);
    }

    return std::unique_ptr<TransferState>(new TransferState(std::move(s), dir));
}

std::unique_ptr<TransferState> TransferState::load(const std::string& namePrefix,
    const std::string& dir,
    Error& err) {
    err = {};
    MetadataStore probe(MetadataStore::pathFor(dir, namePrefix));
    if (!probe.exists())
        return nullptr;

    TransferSnapshot s;
    err = probe.load(s);
    if (err)
        return nullptr;

    // The file name, not its contents, identifies the prefix
    s.namePrefix = namePrefix;
    return std::unique_ptr<TransferState>(new TransferState(std::move(s), dir));
}

bool TransferState::validIndex(int index) const {
    return index >= 0 && static_cast<std::size_t>(index) < data.chunks.size();
}

bool TransferState::markTransferComplete(int index, std::int64_t downloadedBytes) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!validIndex(index))
        return false;

    auto& c = data.chunks[index];
    if (c.transferComplete)
        return false;

    c.transferComplete = true;
    c.downloadedBytes = std::max(c.downloadedBytes, downloadedBytes);
    ++data.completedCount;
    return true;
}

void TransferState::markHookComplete(int index, bool success) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!validIndex(index))
        return;

    // A failed hook never clears an earlier success
    if (success)
        data.chunks[index].hookComplete = true;
}

void TransferState::recordProgress(int index, std::int64_t downloadedBytes) {
    std::lock_guard<std::mutex> lock(mtx);
    if (!validIndex(index))
        return;

    auto& c = data.chunks[index];
    if (downloadedBytes > c.downloadedBytes)
        c.downloadedBytes = std::min(downloadedBytes, c.length());
}

Error TransferState::save() {
    std::lock_guard<std::mutex> lock(mtx);
    return store.save(data);
}

Error TransferState::remove() {
    std::lock_guard<std::mutex> lock(mtx);
    return store.remove();
}

bool TransferState::matches(const std::string& url, std::int64_t totalSize) const {
    std::lock_guard<std::mutex> lock(mtx);
    return store.validate(data, url, totalSize);
}

TransferSnapshot TransferState::snapshot() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data;
}

ChunkDescriptor TransferState::chunk(int index) const {
    std::lock_guard<std::mutex> lock(mtx);
    if (!validIndex(index))
        return {};
    return data.chunks[index];
}

std::size_t TransferState::chunkCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.chunks.size();
}

int TransferState::completedCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.completedCount;
}

bool TransferState::allTransfersComplete() const {
    std::lock_guard<std::mutex> lock(mtx);
    return data.completedCount == static_cast<int>(data.chunks.size());
}

std::vector<int> TransferState::pendingHooks() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<int> out;
    for (const auto& c : data.chunks) {
        if (c.transferComplete && !c.hookComplete)
            out.push_back(c.index);
    }
    return out;
}

std::int64_t TransferState::bytesOnDisk() const {
    std::lock_guard<std::mutex> lock(mtx);
    std::int64_t total = 0;
    for (const auto& c : data.chunks)
        total += c.transferComplete ? c.length() : c.downloadedBytes;
    return total;
}

std::string TransferState::partPath(int index) const {
    return (fs::path(dirPath) / chunkFileName(data.namePrefix, index, "part")).string();
}

std::string TransferState::tmpPath(int index) const {
    return (fs::path(dirPath) / chunkFileName(data.namePrefix, index, "tmp")).string();
}

std::size_t TransferState::removeArtifacts(const std::string& suffix) const {
    const std::string head = data.namePrefix + ".";
    const std::string tail = "." + suffix;
    std::size_t removed = 0;

    std::error_code ec;
    for (fs::directory_iterator it(dirPath, ec), end; !ec && it != end; it.increment(ec)) {
        const std::string name = it->path().filename().string();
        if (name.size() <= head.size() + tail.size())
            continue;
        if (name.compare(0, head.size(), head) != 0)
            continue;
        if (name.compare(name.size() - tail.size(), tail.size(), tail) != 0)
            continue;

        const std::string digits = name.substr(head.size(), name.size() - head.size() - tail.size());
        bool numeric = !digits.empty();
        for (char ch : digits)
            numeric = numeric && std::isdigit(static_cast<unsigned char>(ch));
        if (!numeric)
            continue;

        std::error_code rmEc;
        if (fs::remove(it->path(), rmEc))
            ++removed;
    }
    return removed;
}
