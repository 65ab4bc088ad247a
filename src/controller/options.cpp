// AEGIS - Controller Options Implementation
// Copyright (c) 2024 AEGIS Developers
// MIT License

#include "aegis/controller/options.h"
#include "aegis/crypto/signature.h"

#include <algorithm>
#include <cctype>
#include <memory>

namespace aegis {
namespace controller {

namespace {

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

void Warn(std::vector<std::string>* warnings, const std::string& msg) {
    LOG_WARN(util::LogCategory::CONFIG) << msg;
    if (warnings) {
        warnings->push_back(msg);
    }
}

} // namespace

std::optional<ProvisionedKey> ParseProvisionedKey(const std::string& entry) {
    size_t colon = entry.find(':');
    if (colon == std::string::npos) {
        return std::nullopt;
    }

    ProvisionedKey key;
    key.keyId = util::ConfigManager::Trim(entry.substr(0, colon));
    key.publicKey = ToLower(util::ConfigManager::Trim(entry.substr(colon + 1)));
    if (key.keyId.empty() || !crypto::IsValidEd25519PublicKey(key.publicKey)) {
        return std::nullopt;
    }
    return key;
}

ControllerOptions ControllerOptions::FromConfig(const util::ConfigManager& config,
                                                std::vector<std::string>* warnings) {
    namespace keys = util::ConfigKeys;
    ControllerOptions opts;

    opts.initialVersion = config.GetString(keys::INITIAL_VERSION, DEFAULT_INITIAL_VERSION);
    if (opts.initialVersion.empty()) {
        Warn(warnings, "Empty initialversion; using " + std::string(DEFAULT_INITIAL_VERSION));
        opts.initialVersion = DEFAULT_INITIAL_VERSION;
    }

    if (config.HasKey(keys::MAX_PENDING_UPDATES)) {
        auto max = config.TryGetUInt(keys::MAX_PENDING_UPDATES);
        if (max) {
            opts.maxPendingUpdates = static_cast<size_t>(*max);
        } else {
            Warn(warnings, "Invalid maxpendingupdates; using " +
                           std::to_string(opts.maxPendingUpdates));
        }
    }

    opts.allowDemoKeys = config.GetBool(keys::ALLOW_DEMO_KEYS, false);

    for (const std::string& entry : config.GetList(keys::AUTHORIZED_KEY)) {
        auto key = ParseProvisionedKey(entry);
        if (!key) {
            Warn(warnings, "Ignoring malformed authorizedkey entry '" + entry + "'");
            continue;
        }
        opts.authorizedKeys.push_back(*key);
    }

    if (config.HasKey(keys::MAX_STEPS, keys::SCRIPT_SECTION)) {
        auto steps = config.TryGetUInt(keys::MAX_STEPS, keys::SCRIPT_SECTION);
        if (steps && *steps > 0) {
            opts.scriptLimits.maxSteps = *steps;
        } else {
            Warn(warnings, "Invalid script.maxsteps; using " +
                           std::to_string(opts.scriptLimits.maxSteps));
        }
    }

    if (config.HasKey(keys::MAX_DEPTH, keys::SCRIPT_SECTION)) {
        auto depth = config.TryGetUInt(keys::MAX_DEPTH, keys::SCRIPT_SECTION);
        if (depth && *depth > 0) {
            opts.scriptLimits.maxDepth = static_cast<size_t>(*depth);
        } else {
            Warn(warnings, "Invalid script.maxdepth; using " +
                           std::to_string(opts.scriptLimits.maxDepth));
        }
    }

    opts.logLevel = util::LogLevelFromString(config.GetString(keys::LOG_LEVEL, "info"));
    opts.debugCategories = config.GetList(keys::DEBUG);
    opts.logFile = config.GetString(keys::LOG_FILE, "");
    opts.printToConsole = config.GetBool(keys::PRINT_TO_CONSOLE, true);

    return opts;
}

void ApplyLoggingOptions(const ControllerOptions& options) {
    util::Logger& logger = util::Logger::Instance();

    logger.ClearSinks();
    if (options.printToConsole) {
        logger.AddSink(std::make_shared<util::ConsoleSink>());
    }
    if (!options.logFile.empty()) {
        auto file = std::make_shared<util::FileSink>(options.logFile);
        if (file->IsOpen()) {
            logger.AddSink(file);
        } else {
            // Reported through whatever sinks remain
            LOG_ERROR(util::LogCategory::CONFIG) << "Cannot open log file " << options.logFile;
        }
    }

    util::LogLevel level = options.logLevel;
    logger.EnableAllCategories();

    if (!options.debugCategories.empty()) {
        if (level > util::LogLevel::Debug) {
            level = util::LogLevel::Debug;
        }
        bool all = std::any_of(options.debugCategories.begin(), options.debugCategories.end(),
                               [](const std::string& c) { return c == "all" || c == "1"; });
        if (!all) {
            // Debug output for the listed categories only
            logger.DisableAllCategories();
            logger.EnableCategory(util::LogCategory::DEFAULT);
            for (const std::string& category : options.debugCategories) {
                logger.EnableCategory(category);
            }
        }
    }

    logger.SetLevel(level);
}

} // namespace controller
} // namespace aegis
