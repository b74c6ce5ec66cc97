#pragma once

#include "dxfer/core/result.hpp"

#include <spdlog/common.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace dxfer::app {

enum class Mode {
    Send,
    Receive
};

/**
 * @brief Resolved command-line configuration
 *
 * PRECEDENCE:
 * Built-in defaults, then DXFER_* environment variables, then flags.
 */
struct Config {
    static constexpr std::uint16_t kDefaultPort = 4001;
    static constexpr std::size_t kDefaultChunkSize = 64 * 1024;

    Mode mode = Mode::Receive;
    std::vector<std::filesystem::path> files;      ///< tx only, in sending order
    std::filesystem::path downloads;
    std::string host = "127.0.0.1";                ///< tx only
    std::uint16_t port = kDefaultPort;
    std::size_t chunk_size = kDefaultChunkSize;
    spdlog::level::level_enum log_level = spdlog::level::info;
};

/// Returns the value of an environment variable, if set
using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// EnvLookup over the process environment
EnvLookup process_environment();

/**
 * @brief Build a Config from argv-style arguments (program name excluded)
 *
 * Every invalid invocation is reported as ErrorKind::UsageError.
 */
Result<Config> parse_args(const std::vector<std::string>& args, const EnvLookup& env);

std::string usage();

} // namespace dxfer::app
