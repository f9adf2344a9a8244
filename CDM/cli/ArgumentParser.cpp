#include "ArgumentParser.h"
#include <iostream>
#include <cstdlib>
#include <cctype>
#include <limits>

namespace {
bool parseInteger(const std::string& text, std::int64_t& out) {
    if (text.empty())
        return false;

    std::size_t used = 0;
    try {
        out = std::stoll(text, &used, 10);
    }
    catch (const std::exception&) {
        return false;
    }
    return used == text.size();
}

// "--jobs=4" -> ("--jobs", "4"); anything else is returned unsplit.
void splitInlineValue(std::string& arg, std::string& value, bool& hasValue) {
    hasValue = false;
    if (arg.rfind("--", 0) != 0)
        return;
    auto eq = arg.find('=');
    if (eq == std::string::npos)
        return;
    value = arg.substr(eq + 1);
    arg = arg.substr(0, eq);
    hasValue = true;
}

Error usage(const std::string& msg) {
    return { ErrorCode::Usage, msg };
}
}

bool parseSize(const std::string& text, std::int64_t& out) {
    std::string s = text;
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front())))
        s.erase(s.begin());
    if (s.empty())
        return false;

    std::int64_t multiplier = 1;
    switch (s.back()) {
    case 'K': case 'k': multiplier = 1000; break;
    case 'M': case 'm': multiplier = 1000 * 1000; break;
    case 'G': case 'g': multiplier = 1000 * 1000 * 1000; break;
    default: break;
    }
    if (multiplier != 1)
        s.pop_back();

    std::int64_t value = 0;
    if (!parseInteger(s, value))
        return false;

    if (value > 0 && value > std::numeric_limits<std::int64_t>::max() / multiplier)
        return false;

    out = value * multiplier;
    return true;
}

Error ArgumentParser::parse(int argc, char* argv[], CommandLine& out) {
    if (argc < 2) {
        out.command = Command::Help;
        return usage("a command is required");
    }

    const std::string cmd = argv[1];

    if (cmd == "download") {
        out.command = Command::Download;
        return parseDownload(argc, argv, 2, out.download);
    }
    if (cmd == "merge") {
        out.command = Command::Merge;
        return parseMerge(argc, argv, 2, out.merge);
    }
    if (cmd == "version" || cmd == "--version") {
        out.command = Command::Version;
        return {};
    }
    if (cmd == "help" || cmd == "-h" || cmd == "--help") {
        out.command = Command::Help;
        if (argc > 2)
            out.helpTopic = argv[2];
        return {};
    }

    out.command = Command::Help;
    return usage("unknown command: " + cmd);
}

Error ArgumentParser::parseDownload(int argc, char* argv[], int first, DownloadConfig& out) {
    bool noHead = false;

    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool hasValue = false;
        splitInlineValue(arg, value, hasValue);

        auto takeValue = [&](std::string& dst) -> bool {
            if (hasValue) {
                dst = value;
                return true;
            }
            if (i + 1 >= argc)
                return false;
            dst = argv[++i];
            return true;
        };

        auto takeCount = [&](std::int64_t& dst, std::int64_t minimum) -> Error {
            std::string text;
            if (!takeValue(text))
                return usage(arg + " requires a value");
            if (!parseInteger(text, dst) || dst < minimum || dst > std::numeric_limits<int>::max())
                return usage("invalid value for " + arg + ": " + text);
            return {};
        };

        std::int64_t n = 0;

        if (arg == "-c") {
            std::string text;
            if (!takeValue(text))
                return usage("-c requires a value");
            if (!parseSize(text, out.chunkSize) || out.chunkSize <= 0)
                return usage("invalid chunk size: " + text);
        }
        else if (arg == "-x") {
            if (!takeValue(out.proxy))
                return usage("-x requires a value");
        }
        else if (arg == "-r") {
            if (Error err = takeCount(n, 0))
                return err;
            out.maxRetries = static_cast<int>(n);
        }
        else if (arg == "--no-head") {
            noHead = true;
        }
        else if (arg == "--size") {
            if (Error err = takeCount(n, 1))
                return err;
            out.totalSize = n;
        }
        else if (arg == "--jobs") {
            if (Error err = takeCount(n, 1))
                return err;
            out.concurrency = static_cast<std::size_t>(n);
        }
        else if (arg == "--force") {
            out.forceRestart = true;
        }
        else if (arg == "--merge") {
            out.mergeAfter = true;
        }
        else if (arg == "--post-part") {
            if (!takeValue(out.hookCommand))
                return usage("--post-part requires a value");
        }
        else if (arg == "--post-part-jobs") {
            if (Error err = takeCount(n, 0))
                return err;
            out.hookConcurrency = static_cast<std::size_t>(n);
        }
        else if (arg == "--timeout") {
            if (Error err = takeCount(n, 0))
                return err;
            out.timeoutSec = n;
        }
        else if (arg == "-d") {
            if (!takeValue(out.outputDir))
                return usage("-d requires a value");
        }
        else if (arg == "-v" || arg == "--verbose") {
            out.verbose = true;
        }
        else if (!arg.empty() && arg[0] == '-') {
            return usage("unknown option: " + arg);
        }
        else if (out.url.empty()) {
            out.url = arg;
        }
        else {
            return usage("unexpected argument: " + arg);
        }
    }

    if (out.url.empty())
        return usage("URL is required");

    out.skipHead = noHead;
    if (noHead && out.totalSize <= 0)
        return usage("--no-head requires --size");

    return {};
}

Error ArgumentParser::parseMerge(int argc, char* argv[], int first, MergeConfig& out) {
    for (int i = first; i < argc; ++i) {
        std::string arg = argv[i];
        std::string value;
        bool hasValue = false;
        splitInlineValue(arg, value, hasValue);

        auto takeValue = [&](std::string& dst) -> bool {
            if (hasValue) {
                dst = value;
                return true;
            }
            if (i + 1 >= argc)
                return false;
            dst = argv[++i];
            return true;
        };

        if (arg == "-o") {
            if (!takeValue(out.outputName))
                return usage("-o requires a value");
        }
        else if (arg == "--pattern") {
            if (!takeValue(out.pattern) || out.pattern.empty())
                return usage("--pattern requires a value");
        }
        else if (arg == "--delete") {
            out.deleteAfter = true;
        }
        else if (arg == "--strict") {
            out.strictOutputMatch = true;
        }
        else {
            return usage("unexpected argument: " + arg);
        }
    }

    return {};
}

void ArgumentParser::printUsage(std::ostream& os, const std::string& topic) {
    if (topic == "download") {
        os <<
            "Usage:\n"
            "  cdm download [options] <url>\n\n"
            "Options:\n"
            "  -c <size>            Chunk size, K/M/G suffix (default: 100M)\n"
            "  -x <url>             Proxy URL (e.g. socks5h://127.0.0.1:9050)\n"
            "  -r <n>               Retries per chunk (default: 10)\n"
            "  --no-head            Skip the HEAD request (requires --size)\n"
            "  --size <bytes>       Total size in bytes\n"
            "  --jobs <n>           Concurrent chunks (default: 1)\n"
            "  --force              Discard saved state and start over\n"
            "  --merge              Merge chunks after the download\n"
            "  --post-part <cmd>    Run after each chunk; placeholders {part} {idx} {base}\n"
            "  --post-part-jobs <n> Concurrent post-part commands (default: 0 = 10)\n"
            "  --timeout <sec>      Stop the run after this many seconds (default: none)\n"
            "  -d <dir>             Directory for chunks and state (default: .)\n"
            "  -v                   Verbose logging\n";
        return;
    }

    if (topic == "merge") {
        os <<
            "Usage:\n"
            "  cdm merge [options]\n\n"
            "Options:\n"
            "  -o <file>            Output file (default: detected from chunk names)\n"
            "  --pattern <glob>     Chunk files to merge (default: *.part)\n"
            "  --delete             Delete chunks and state after merging\n"
            "  --strict             Fail when -o matches no chunk group\n";
        return;
    }

    os <<
        "Usage:\n"
        "  cdm <command> [options]\n\n"
        "Commands:\n"
        "  download   Download a file in resumable chunks\n"
        "  merge      Merge chunk files into their original file\n"
        "  version    Print the version\n"
        "  help       Show help for a command\n";
}
