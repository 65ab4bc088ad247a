// AEGIS - Controller Options
// Copyright (c) 2024 AEGIS Developers
// MIT License
//
// Runtime options for a Controller, read from an aegis.conf style
// configuration through ConfigManager.

#ifndef AEGIS_CONTROLLER_OPTIONS_H
#define AEGIS_CONTROLLER_OPTIONS_H

#include "aegis/script/interpreter.h"
#include "aegis/util/config.h"
#include "aegis/util/logging.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace aegis {
namespace controller {

/// Default controller version before any self-update
constexpr const char* DEFAULT_INITIAL_VERSION = "1.0.0";

/// A public key provisioned out of band
struct ProvisionedKey {
    std::string keyId;
    std::string publicKey;
};

/**
 * Parse an "id:hex" authorizedkey entry.
 * The key must decode to a valid Ed25519 public key.
 */
std::optional<ProvisionedKey> ParseProvisionedKey(const std::string& entry);

struct ControllerOptions {
    std::string initialVersion{DEFAULT_INITIAL_VERSION};
    /// 0 leaves the pending queue unbounded
    size_t maxPendingUpdates{0};

    /// Allow Initialize() to hand the demo private key to the caller
    bool allowDemoKeys{false};

    /// Keys registered when the controller is constructed
    std::vector<ProvisionedKey> authorizedKeys;

    script::InterpreterLimits scriptLimits;

    // Logging
    util::LogLevel logLevel{util::LogLevel::Info};
    std::vector<std::string> debugCategories;
    std::string logFile;
    bool printToConsole{true};

    /**
     * Read options from configuration. Invalid values keep their defaults
     * and are reported through warnings.
     */
    static ControllerOptions FromConfig(const util::ConfigManager& config,
                                        std::vector<std::string>* warnings = nullptr);
};

/// Configure the global Logger (level, categories, sinks) from options
void ApplyLoggingOptions(const ControllerOptions& options);

} // namespace controller
} // namespace aegis

#endif // AEGIS_CONTROLLER_OPTIONS_H
