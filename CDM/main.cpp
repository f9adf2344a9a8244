#include <iostream>
#include <csignal>
#include "cli/ArgumentParser.h"
#include "core/DownloadController.h"
#include "io/ChunkMerger.h"
#include "monitor/Logger.h"
#include "net/HttpClient.h"

namespace {
volatile std::sig_atomic_t gStopRequested = 0;

void handleSignal(int) {
    gStopRequested = 1;
}

int runDownload(const DownloadConfig& config, Logger& logger) {
    HttpClient::globalInit();

    DownloadController controller(config, logger, &gStopRequested);
    Error err = controller.run();

    HttpClient::globalCleanup();

    if (err.code == ErrorCode::Cancelled) {
        logger.info("Download cancelled; run the same command again to resume");
        return 0;
    }
    if (err) {
        logger.error(std::string(errorCodeName(err.code)) + ": " + err.message);
        return 1;
    }
    return 0;
}

int runMerge(const MergeConfig& config, Logger& logger) {
    ChunkMerger merger(config, logger);
    if (Error err = merger.merge()) {
        logger.error(std::string(errorCodeName(err.code)) + ": " + err.message);
        return 1;
    }
    return 0;
}
}

int main(int argc, char* argv[]) {
    CommandLine cmd;
    ArgumentParser parser;

    if (Error err = parser.parse(argc, argv, cmd)) {
        std::cerr << "Error: " << err.message << "\n\n";
        ArgumentParser::printUsage(std::cerr, argc > 1 ? argv[1] : "");
        return 1;
    }

    switch (cmd.command) {
    case Command::Version:
        std::cout << "cdm " << CDM_VERSION << "\n";
        return 0;
    case Command::Help:
        ArgumentParser::printUsage(std::cout, cmd.helpTopic);
        return 0;
    default:
        break;
    }

    std::signal(SIGINT, handleSignal);
    std::signal(SIGTERM, handleSignal);

    Logger logger;
    if (cmd.command == Command::Download && cmd.download.verbose)
        logger.setLevel(LogLevel::Debug);
    logger.start();

    const int rc = cmd.command == Command::Download
        ? runDownload(cmd.download, logger)
        : runMerge(cmd.merge, logger);

    logger.stop();
    return rc;
}
