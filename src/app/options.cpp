#include "strata/app/options.hpp"

#include <nlohmann/json.hpp>

#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>

namespace strata::app {

using json = nlohmann::json;

namespace {

Result<std::int64_t> parse_integer(const std::string& flag, const std::string& text) {
    std::int64_t value = 0;
    const auto* first = text.data();
    const auto* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (text.empty() || ec != std::errc() || ptr != last) {
        return Err<std::int64_t>(ErrorKind::InvalidArgument, flag + " expects an integer, got '" + text + "'");
    }
    return Ok(value);
}

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

Result<std::optional<std::string>> json_string(const json& document, const char* key) {
    if (!document.contains(key)) {
        return Ok(std::optional<std::string>{});
    }
    const auto& value = document.at(key);
    if (!value.is_string()) {
        return Err<std::optional<std::string>>(ErrorKind::InvalidArgument,
                                               std::string("config key '") + key + "' must be a string");
    }
    return Ok(std::optional<std::string>(value.get<std::string>()));
}

Result<std::optional<std::int64_t>> json_integer(const json& document, const char* key) {
    if (!document.contains(key)) {
        return Ok(std::optional<std::int64_t>{});
    }
    const auto& value = document.at(key);
    if (!value.is_number_integer()) {
        return Err<std::optional<std::int64_t>>(ErrorKind::InvalidArgument,
                                                std::string("config key '") + key + "' must be an integer");
    }
    return Ok(std::optional<std::int64_t>(value.get<std::int64_t>()));
}

} // namespace

Result<RawSettings> parse_arguments(const std::vector<std::string>& args) {
    RawSettings raw;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            raw.help = true;
            continue;
        }

        const bool takes_value = arg == "--watch" || arg == "--backup" || arg == "--restore" ||
                                 arg == "--refresh" || arg == "--until" || arg == "--segment-limit" ||
                                 arg == "--log-level" || arg == "--config";
        if (!takes_value) {
            return Err<RawSettings>(ErrorKind::InvalidArgument, "Unknown argument: " + arg);
        }
        if (i + 1 >= args.size() || args[i + 1].empty()) {
            return Err<RawSettings>(ErrorKind::InvalidArgument, arg + " requires a value");
        }
        const std::string& value = args[++i];

        if (arg == "--watch") {
            raw.watch = value;
        } else if (arg == "--backup") {
            raw.backup = value;
        } else if (arg == "--restore") {
            raw.restore = value;
        } else if (arg == "--log-level") {
            raw.log_level = value;
        } else if (arg == "--config") {
            raw.config = value;
        } else {
            auto number = parse_integer(arg, value);
            if (number.is_error()) {
                return Err<RawSettings>(number.error());
            }
            if (arg == "--refresh") {
                raw.refresh = number.value();
            } else if (arg == "--until") {
                raw.until = number.value();
            } else {
                raw.segment_limit = number.value();
            }
        }
    }

    return Ok(raw);
}

Result<RawSettings> parse_config_text(const std::string& text) {
    const json document = json::parse(text, nullptr, false);
    if (document.is_discarded()) {
        return Err<RawSettings>(ErrorKind::InvalidArgument, "Config is not valid JSON");
    }
    if (!document.is_object()) {
        return Err<RawSettings>(ErrorKind::InvalidArgument, "Config must be a JSON object");
    }

    RawSettings raw;
    struct StringKey { const char* key; std::optional<std::string>* target; };
    struct IntegerKey { const char* key; std::optional<std::int64_t>* target; };

    for (const auto& entry : {StringKey{"watch", &raw.watch}, StringKey{"backup", &raw.backup},
                              StringKey{"restore", &raw.restore}, StringKey{"log_level", &raw.log_level}}) {
        auto value = json_string(document, entry.key);
        if (value.is_error()) {
            return Err<RawSettings>(value.error());
        }
        *entry.target = value.value();
    }

    for (const auto& entry : {IntegerKey{"refresh", &raw.refresh}, IntegerKey{"until", &raw.until},
                              IntegerKey{"segment_limit", &raw.segment_limit}}) {
        auto value = json_integer(document, entry.key);
        if (value.is_error()) {
            return Err<RawSettings>(value.error());
        }
        *entry.target = value.value();
    }

    return Ok(raw);
}

Result<RawSettings> load_config_file(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<RawSettings>(ErrorKind::Io, "Failed to open config file: " + path.string());
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();

    auto parsed = parse_config_text(buffer.str());
    if (parsed.is_error()) {
        return Err<RawSettings>(parsed.error().kind, path.string() + ": " + parsed.error().message);
    }
    return parsed;
}

RawSettings merge_settings(RawSettings base, const RawSettings& overrides) {
    if (overrides.watch) base.watch = overrides.watch;
    if (overrides.backup) base.backup = overrides.backup;
    if (overrides.restore) base.restore = overrides.restore;
    if (overrides.refresh) base.refresh = overrides.refresh;
    if (overrides.until) base.until = overrides.until;
    if (overrides.segment_limit) base.segment_limit = overrides.segment_limit;
    if (overrides.log_level) base.log_level = overrides.log_level;
    if (overrides.config) base.config = overrides.config;
    base.help = base.help || overrides.help;
    return base;
}

Result<Options> validate(const RawSettings& settings) {
    Options options;

    if (settings.log_level) {
        auto level = parse_level(*settings.log_level);
        if (!level) {
            return Err<Options>(ErrorKind::InvalidArgument, "Unknown log level: " + *settings.log_level);
        }
        options.log_level = *level;
    }

    if (settings.help) {
        options.mode = Mode::Help;
        return Ok(options);
    }

    if (settings.watch && settings.restore) {
        return Err<Options>(ErrorKind::InvalidArgument, "--watch and --restore are mutually exclusive");
    }
    if (!settings.watch && !settings.restore) {
        return Err<Options>(ErrorKind::InvalidArgument, "One of --watch or --restore is required");
    }
    if (!settings.backup) {
        return Err<Options>(ErrorKind::InvalidArgument,
                            std::string("--backup required for ") + (settings.watch ? "watch" : "restore") + " mode");
    }
    options.backup_root = *settings.backup;

    if (settings.refresh) {
        if (*settings.refresh <= 0 || *settings.refresh > kMaxRefreshSeconds) {
            return Err<Options>(ErrorKind::InvalidArgument,
                                "--refresh must be between 1 and " + std::to_string(kMaxRefreshSeconds) + " seconds");
        }
        options.refresh_seconds = *settings.refresh;
    }
    if (settings.segment_limit) {
        if (*settings.segment_limit <= 0) {
            return Err<Options>(ErrorKind::InvalidArgument, "--segment-limit must be positive");
        }
        options.segment_limit = static_cast<std::size_t>(*settings.segment_limit);
    }

    if (settings.watch) {
        options.mode = Mode::Watch;
        options.watch_root = *settings.watch;
        if (settings.until) {
            return Err<Options>(ErrorKind::InvalidArgument, "--until only applies to restore mode");
        }
    } else {
        options.mode = Mode::Restore;
        options.restore_root = *settings.restore;
        options.until = settings.until;
    }

    return Ok(options);
}

Result<Options> parse_options(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto cli = parse_arguments(args);
    if (cli.is_error()) {
        return Err<Options>(cli.error());
    }

    RawSettings merged = cli.value();
    if (cli.value().config) {
        auto file = load_config_file(*cli.value().config);
        if (file.is_error()) {
            return Err<Options>(file.error());
        }
        merged = merge_settings(file.value(), cli.value());
    }

    return validate(merged);
}

std::string usage(const std::string& program) {
    std::ostringstream oss;
    oss << "Usage:\n"
        << "  " << program << " --watch <path> --backup <path> [--refresh <seconds>]\n"
        << "  " << program << " --restore <path> --backup <path> [--until <epoch-seconds>]\n"
        << "\n"
        << "Options:\n"
        << "  --refresh <seconds>      Scan interval in watch mode (default 60, at most one year)\n"
        << "  --until <epoch-seconds>  Restore the state as of this time\n"
        << "  --segment-limit <bytes>  Soft size limit per journal segment (default 5242880)\n"
        << "  --log-level <level>      trace, debug, info, warn, error, off (default info)\n"
        << "  --config <file.json>     Read settings from a JSON file; flags override it\n"
        << "  -h, --help               Show this help\n";
    return oss.str();
}

} // namespace strata::app
