#include "HookPipeline.h"
#include "TransferState.h"
#include "../monitor/Logger.h"

#include <cstdio>
#include <sstream>

#ifndef _WIN32
#include <sys/wait.h>
#endif

std::string expandHookCommand(const std::string& tmpl,
    const std::map<std::string, std::string>& values) {
    std::string out;
    out.reserve(tmpl.size());

    std::size_t i = 0;
    while (i < tmpl.size()) {
        bool replaced = false;
        if (tmpl[i] == '{') {
            for (const auto& kv : values) {
                if (tmpl.compare(i, kv.first.size(), kv.first) == 0) {
                    out += kv.second;
                    i += kv.first.size();
                    replaced = true;
                    break;
                }
            }
        }
        if (!replaced)
            out += tmpl[i++];
    }
    return out;
}

int runShellCommand(const std::string& command, std::string& output) {
    output.clear();
    const std::string full = command + " 2>&1";

#ifdef _WIN32
    FILE* pipe = _popen(full.c_str(), "r");
#else
    FILE* pipe = popen(full.c_str(), "r");
#endif
    if (!pipe)
        return -1;

    char buffer[4096];
    std::size_t n = 0;
    while ((n = std::fread(buffer, 1, sizeof(buffer), pipe)) > 0)
        output.append(buffer, n);

#ifdef _WIN32
    return _pclose(pipe);
#else
    int status = pclose(pipe);
    if (status == -1)
        return -1;
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    return -1;
#endif
}

Error runHookCommand(const std::string& command, std::string& output) {
    const int status = runShellCommand(command, output);
    if (status == 0)
        return {};
    if (status < 0)
        return { ErrorCode::Hook, "command could not be run to completion" };
    return { ErrorCode::Hook, "exit status " + std::to_string(status) };
}

namespace {
std::string indent(const std::string& text) {
    std::istringstream in(text);
    std::ostringstream out;
    std::string line;
    bool first = true;
    while (std::getline(in, line)) {
        if (!first)
            out << '\n';
        out << "  " << line;
        first = false;
    }
    return out.str();
}
}

HookPipeline::HookPipeline(const std::string& tmpl,
    std::size_t workers,
    std::size_t cap,
    TransferState& st,
    Logger& log)
    : commandTemplate(tmpl),
    workerCount(workers == 0 ? 1 : workers),
    capacity(cap),
    state(st),
    logger(log) {
}

HookPipeline::~HookPipeline() {
    finish(false);
}

void HookPipeline::start() {
    if (started)
        return;
    started = true;
    pool.start(workerCount, [this]() { workerLoop(); });
}

bool HookPipeline::submit(int chunkIndex) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        if (closed || queue.size() >= capacity)
            return false;
        queue.push_back(chunkIndex);
    }
    cv.notify_one();
    return true;
}

void HookPipeline::finish(bool drain) {
    {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
        if (!drain) {
            dropCount += queue.size();
            queue.clear();
        }
    }
    cv.notify_all();
    pool.join();
}

void HookPipeline::workerLoop() {
    while (true) {
        int index = 0;
        {
            std::unique_lock<std::mutex> lock(mtx);
            cv.wait(lock, [this]() { return closed || !queue.empty(); });
            if (queue.empty())
                return;
            index = queue.front();
            queue.pop_front();
        }
        runHook(index);
    }
}

void HookPipeline::runHook(int chunkIndex) {
    const std::string tag = "[post-part chunk " + std::to_string(chunkIndex) + "] ";

    const std::string cmd = expandHookCommand(commandTemplate, {
        { "{part}", state.partPath(chunkIndex) },
        { "{idx}", std::to_string(chunkIndex) },
        { "{base}", state.namePrefix() }
        });

    logger.info(tag + "Running: " + cmd);

    std::string output;
    const Error err = runHookCommand(cmd, output);

    if (!output.empty())
        logger.info(tag + "Output:\n" + indent(output));

    const bool ok = err.ok();
    if (ok) {
        logger.info(tag + "Completed");
        ++okCount;
    }
    else {
        logger.warn(tag + "Failed: " + err.message);
        ++failCount;
    }

    state.markHookComplete(chunkIndex, ok);
    if (Error saveErr = state.save())
        logger.warn(tag + "failed to save state: " + saveErr.message);
}
