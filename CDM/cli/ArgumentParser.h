#pragma once
#include <cstdint>
#include <iosfwd>
#include <string>
#include "../core/utils.h"

enum class Command {
    Download,
    Merge,
    Version,
    Help
};

struct CommandLine {
    Command command = Command::Help;
    DownloadConfig download;
    MergeConfig merge;
    // Subcommand whose usage `help` should print; empty for the overview.
    std::string helpTopic;
};

// "100M" -> 100000000. Accepts an optional K/M/G suffix (decimal units).
bool parseSize(const std::string& text, std::int64_t& out);

class ArgumentParser {
public:
    // Returns a Usage error on malformed input.
    Error parse(int argc, char* argv[], CommandLine& out);

    static void printUsage(std::ostream& os, const std::string& topic = {});

private:
    Error parseDownload(int argc, char* argv[], int first, DownloadConfig& out);
    Error parseMerge(int argc, char* argv[], int first, MergeConfig& out);
};
