#include "config.hpp"
#include "curl_stream.hpp"
#include "exception.hpp"
#include "fetcher.hpp"
#include "localization.hpp"
#include "log.hpp"
#include "progress.hpp"
#include "transport.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.commands") << std::endl;
    std::cerr << get_string("info.fetch_desc") << std::endl;
    std::cerr << get_string("info.config_desc") << std::endl;
}

size_t parse_chunk_size(const std::string& text) {
    size_t pos = 0;
    unsigned long long value = 0;
    try {
        value = std::stoull(text, &pos);
    } catch (const std::exception&) {
        throw InvalidRequestError(string_format("error.invalid_chunk_size_value", text));
    }
    if (pos != text.size() || value == 0) {
        throw InvalidRequestError(string_format("error.invalid_chunk_size_value", text));
    }
    return static_cast<size_t>(value);
}

void configure_logger(Logger& logger, const cxxopts::ParseResult& result, const Config& config) {
    std::string level = config.get(LOG_LEVEL_KEY, "INFO");
    if (result.count("log-level")) {
        level = result["log-level"].as<std::string>();
    }
    logger.set_level(parse_log_level(level));

    std::optional<std::string> log_file = config.get(LOG_FILE_KEY);
    if (result.count("log-file")) {
        log_file = result["log-file"].as<std::string>();
    }
    if (log_file && !log_file->empty()) {
        logger.set_log_file(*log_file);
    }
}

int run_fetch(const cxxopts::ParseResult& result, const std::vector<std::string>& urls, const Config& config, Logger& logger) {
    if (urls.empty()) {
        throw InvalidRequestError(get_string("error.no_urls"));
    }

    DownloadRequest base;
    base.destination_dir = result.count("dir")
        ? fs::path(result["dir"].as<std::string>())
        : fs::path(config.get(DATA_DIR_KEY, fs::current_path().string()));
    base.resume = !result["no-resume"].as<bool>();
    base.overwrite = result["overwrite"].as<bool>();
    base.chunk_size = parse_chunk_size(result.count("chunk-size")
        ? result["chunk-size"].as<std::string>()
        : config.get(CHUNK_SIZE_KEY, std::to_string(DEFAULT_CHUNK_SIZE)));
    base.verbosity = result["verbose"].as<int>();
    base.mirror_layout = result["mirror"].as<bool>();
    if (result.count("checksum")) {
        if (urls.size() != 1) {
            throw InvalidRequestError(get_string("error.checksum_multiple_urls"));
        }
        base.expected_checksum = result["checksum"].as<std::string>();
    }

    std::unique_ptr<ProgressSink> progress;
    if (result["quiet"].as<bool>() || !is_stdout_tty()) {
        progress = std::make_unique<NullProgressSink>();
    } else {
        progress = std::make_unique<StreamProgressSink>(std::cout);
    }

    const TransportSet transports = make_default_transports();
    ResumableFetcher fetcher(logger, transports, *progress);

    for (const auto& url : urls) {
        DownloadRequest request = base;
        request.url = url;
        const fs::path path = fetcher.fetch(request);
        std::cout << path.string() << std::endl;
    }
    return 0;
}

int run_config(const cxxopts::ParseResult& result, const std::vector<std::string>& args, Config& config, Logger& logger) {
    const bool unset = result["unset"].as<bool>();
    if (args.empty() || args.size() > 2 || (unset && args.size() != 1)) {
        throw InvalidRequestError(get_string("error.invalid_arg_count"));
    }

    const std::string& key = args[0];
    if (unset) {
        config.set(key, std::nullopt);
        logger.info(string_format("info.config_unset", key, config.path().string()));
        return 0;
    }

    if (args.size() == 1) {
        auto value = config.get(key);
        if (!value) {
            logger.warning(string_format("warning.config_key_unset", key));
            return 1;
        }
        std::cout << *value << std::endl;
        return 0;
    }

    if (!is_known_config_key(key)) {
        logger.warning(string_format("warning.non_standard_config_key", key));
    }
    config.set(key, args[1]);
    logger.info(string_format("info.config_set", key, config.path().string()));
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    Logger logger;
    try {
        CurlGlobalInitializer curl_initializer;
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("info.help_desc"))
            ("d,dir", get_string("help.dir"), cxxopts::value<std::string>())
            ("no-resume", get_string("help.no_resume"), cxxopts::value<bool>()->default_value("false"))
            ("overwrite", get_string("help.overwrite"), cxxopts::value<bool>()->default_value("false"))
            ("checksum", get_string("help.checksum"), cxxopts::value<std::string>())
            ("chunk-size", get_string("help.chunk_size"), cxxopts::value<std::string>())
            ("v,verbose", get_string("help.verbose"), cxxopts::value<int>()->default_value("0")->implicit_value("1"))
            ("q,quiet", get_string("help.quiet"), cxxopts::value<bool>()->default_value("false"))
            ("log-level", get_string("help.log_level"), cxxopts::value<std::string>())
            ("log-file", get_string("help.log_file"), cxxopts::value<std::string>())
            ("config", get_string("help.config"), cxxopts::value<std::string>())
            ("mirror", get_string("help.mirror"), cxxopts::value<bool>()->default_value("false"))
            ("unset", get_string("help.unset"), cxxopts::value<bool>()->default_value("false"))
            ("command", "", cxxopts::value<std::string>())
            ("args", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command", "args"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        if (!result.count("command")) {
            print_usage(options);
            return 1;
        }

        Config config = result.count("config")
            ? Config(fs::path(result["config"].as<std::string>()))
            : Config();
        configure_logger(logger, result, config);

        const std::string& command = result["command"].as<std::string>();
        std::vector<std::string> args;
        if (result.count("args")) {
            args = result["args"].as<std::vector<std::string>>();
        }

        if (command == "fetch") {
            return run_fetch(result, args, config, logger);
        } else if (command == "config") {
            return run_config(result, args, config, logger);
        }

        print_usage(options);
        return 1;

    } catch (const cxxopts::exceptions::exception& e) {
        logger.error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const DsfetchException& e) {
        logger.error(string_format("error.dsfetch_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        logger.error(string_format("error.unexpected_error", e.what()));
        return 1;
    }
}
