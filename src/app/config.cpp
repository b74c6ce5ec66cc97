#include "dxfer/app/config.hpp"

#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace dxfer::app {

namespace {

Result<Config> usage_error(const std::string& message) {
    return Err<Config>(ErrorKind::UsageError, message);
}

std::optional<std::uint64_t> parse_unsigned(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

std::optional<std::uint16_t> parse_port(const std::string& text) {
    auto value = parse_unsigned(text);
    if (!value || *value == 0 || *value > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(*value);
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& text) {
    auto level = spdlog::level::from_str(text);
    // from_str maps unknown names to off; only accept "off" when spelled out
    if (level == spdlog::level::off && text != "off") {
        return std::nullopt;
    }
    return level;
}

} // namespace

EnvLookup process_environment() {
    return [](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (value == nullptr) {
            return std::nullopt;
        }
        return std::string(value);
    };
}

std::string usage() {
    return "usage: dxfer [options] tx FILE...\n"
           "       dxfer [options] rx\n"
           "\n"
           "options:\n"
           "  --downloads DIR      where received files are stored (rx)\n"
           "  --listen PORT        port to accept the peer on (rx, default 4001)\n"
           "  --connect HOST:PORT  peer to dial (tx, default 127.0.0.1:4001)\n"
           "  --chunk-size BYTES   payload bytes per write (tx, default 65536)\n"
           "  --log-level LEVEL    trace, debug, info, warn, error, critical, off\n";
}

Result<Config> parse_args(const std::vector<std::string>& args, const EnvLookup& env) {
    Config config;

    if (auto home = env("HOME")) {
        config.downloads = std::filesystem::path(*home) / "Downloads";
    } else {
        config.downloads = std::filesystem::current_path();
    }
    if (auto downloads = env("DXFER_DOWNLOADS")) {
        config.downloads = *downloads;
    }
    if (auto level = env("DXFER_LOG_LEVEL")) {
        auto parsed = parse_level(*level);
        if (!parsed) {
            return usage_error("DXFER_LOG_LEVEL: unknown level '" + *level + "'");
        }
        config.log_level = *parsed;
    }

    std::optional<Mode> mode;
    bool saw_listen = false;
    bool saw_connect = false;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (!arg.empty() && arg.rfind("--", 0) == 0) {
            if (mode == Mode::Send && arg == "--") {
                // Everything after "--" is a file name
                for (++i; i < args.size(); ++i) {
                    config.files.emplace_back(args[i]);
                }
                break;
            }
            if (i + 1 >= args.size()) {
                return usage_error(arg + " requires a value");
            }
            const std::string& value = args[++i];

            if (arg == "--downloads") {
                if (value.empty()) {
                    return usage_error("--downloads: empty path");
                }
                config.downloads = value;
            } else if (arg == "--listen") {
                auto port = parse_port(value);
                if (!port) {
                    return usage_error("--listen: invalid port '" + value + "'");
                }
                config.port = *port;
                saw_listen = true;
            } else if (arg == "--connect") {
                auto colon = value.rfind(':');
                if (colon == std::string::npos || colon == 0) {
                    return usage_error("--connect: expected HOST:PORT, got '" + value + "'");
                }
                auto port = parse_port(value.substr(colon + 1));
                if (!port) {
                    return usage_error("--connect: invalid port in '" + value + "'");
                }
                config.host = value.substr(0, colon);
                config.port = *port;
                saw_connect = true;
            } else if (arg == "--chunk-size") {
                auto size = parse_unsigned(value);
                if (!size || *size == 0 || *size > std::numeric_limits<std::uint32_t>::max()) {
                    return usage_error("--chunk-size: must be a positive integer, got '" + value + "'");
                }
                config.chunk_size = static_cast<std::size_t>(*size);
            } else if (arg == "--log-level") {
                auto level = parse_level(value);
                if (!level) {
                    return usage_error("--log-level: unknown level '" + value + "'");
                }
                config.log_level = *level;
            } else {
                return usage_error("unknown option " + arg);
            }
            continue;
        }

        if (!mode) {
            if (arg == "tx") {
                mode = Mode::Send;
            } else if (arg == "rx") {
                mode = Mode::Receive;
            } else {
                return usage_error("unknown command '" + arg + "'");
            }
            continue;
        }

        if (*mode == Mode::Receive) {
            return usage_error("rx takes no arguments, got '" + arg + "'");
        }
        config.files.emplace_back(arg);
    }

    if (!mode) {
        return usage_error("missing command (tx or rx)");
    }
    config.mode = *mode;

    if (config.mode == Mode::Send) {
        if (config.files.empty()) {
            return usage_error("tx requires at least one file");
        }
        if (saw_listen) {
            return usage_error("--listen is only valid with rx");
        }
    } else if (saw_connect) {
        return usage_error("--connect is only valid with tx");
    }

    return Ok(std::move(config));
}

} // namespace dxfer::app
