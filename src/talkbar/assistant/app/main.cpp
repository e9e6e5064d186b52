#include "talkbar/assistant/ChatInferencer.h"
#include "talkbar/assistant/ConfigManager.h"
#include "talkbar/assistant/ConsoleSurface.h"
#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/SessionOrchestrator.h"
#include "talkbar/assistant/SpeechCapturer.h"
#include "talkbar/assistant/SpeechService.h"
#include "talkbar/assistant/SpeechSpeaker.h"

#include <iostream>
#include <string>

using namespace talkbar::assistant;
using LogLevel = ErrorHandler::LogLevel;

static ErrorHandler::LoggerConfig readLoggerConfig(const ConfigManager& cfg) {
    ErrorHandler::LoggerConfig lc;
    lc.minLevel = ErrorHandler::parseLogLevel(cfg.getString("logging.min_level", "info")).value_or(LogLevel::Info);
    lc.filePath = cfg.getString("logging.file", "logs/assistant.log");
    return lc;
}

static void printUsage() {
    std::cout << "talkbar: Enter = activate/re-activate, c = dismiss, q = quit\n";
}

int main(int argc, char** argv) {
    const std::string configPath = argc > 1 ? argv[1] : "config/talkbar.json";

    ConfigManager cfg;
    ErrorInfo err;
    if (!cfg.loadFromFile(configPath, &err)) {
        std::cerr << "Failed to load config: " << err.toString() << "\n";
        return 1;
    }
    cfg.applyEnvironmentOverrides();

    const auto issues = cfg.validate();
    for (const auto& issue : issues) {
        std::cerr << "[config] " << issue << "\n";
    }
    if (ConfigManager::hasHardValidationErrors(issues)) {
        std::cerr << "Config has errors, aborting: " << configPath << "\n";
        return 1;
    }

    ErrorHandler logger;
    if (!logger.setLoggerConfig(readLoggerConfig(cfg))) {
        std::cerr << "[WARN] cannot open log file, logging to stderr only\n";
    }
    if (!err.message.empty()) {
        logger.log(LogLevel::Warning, err.message);
    }

    SpeechService speech(cfg);
    SpeechCapturer capturer(cfg, speech, logger);
    ChatInferencer inferencer(cfg);
    SpeechSpeaker speaker(cfg, speech, logger);
    ConsoleSurface surface(std::cout);

    logger.log(LogLevel::Info, "LLM endpoint " + cfg.getString("llm.base_url") + ", model " +
                                   cfg.getString("llm.model") + ", STT " + speech.sttConfig().baseUrl +
                                   ", TTS voice " + speech.ttsConfig().voice);

    SessionOrchestrator orchestrator(capturer, inferencer, speaker, surface, logger,
                                     SessionOrchestrator::Options::fromConfig(cfg));
    orchestrator.start();
    printUsage();

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line == "q" || line == "quit") {
            break;
        }
        if (line == "c" || line == "cancel") {
            orchestrator.cancel();
            continue;
        }
        if (line.empty()) {
            orchestrator.activate();
            continue;
        }
        printUsage();
    }

    orchestrator.stop();
    return 0;
}
