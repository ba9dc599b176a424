#include "config.hpp"
#include "dumper.hpp"
#include "exception.hpp"
#include "localization.hpp"
#include "utils.hpp"

#include <cxxopts.hpp>

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

void print_usage(const cxxopts::Options& options) {
    std::cerr << options.help({""});
    std::cerr << get_string("info.usage_repodata") << std::endl;
}

int main(int argc, char* argv[]) {
    try {
        init_localization();

        cxxopts::Options options(argv[0]);
        options.custom_help(get_string("info.usage"));
        options.positional_help("<repodata>...");
        options.set_width(100);

        options.add_options()
            ("h,help", get_string("help.help"))
            ("c,cache", get_string("help.cache"), cxxopts::value<std::string>())
            ("m,mode", get_string("help.mode"), cxxopts::value<std::string>())
            ("L,limit", get_string("help.limit"), cxxopts::value<std::int64_t>())
            ("b,prune", get_string("help.prune"), cxxopts::value<bool>()->default_value("false"))
            ("v,log-level", get_string("help.log_level"), cxxopts::value<std::string>()->default_value("warn"))
            ("C,directory", get_string("help.directory"), cxxopts::value<std::string>()->default_value("."))
            ("repodata", "", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"repodata"});

        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            print_usage(options);
            return 0;
        }

        set_log_level(parse_log_level(result["log-level"].as<std::string>()));

        Settings settings;
        settings.output_dir = result["directory"].as<std::string>();
        settings.remove_old_files = result["prune"].as<bool>();

        if (result.count("cache")) {
            settings.cache_file = result["cache"].as<std::string>();
        }

        std::string mode = result.count("mode") ? result["mode"].as<std::string>()
                                                : default_dir_mode_string(settings.output_dir);
        settings.dir_mode = parse_dir_mode(mode);

        const std::int64_t max_limit = get_file_limit();
        settings.open_limit = result.count("limit") ? result["limit"].as<std::int64_t>()
                                                    : default_open_limit(max_limit);
        validate_open_limit(settings.open_limit, max_limit);

        if (result.count("repodata")) {
            for (const auto& file : result["repodata"].as<std::vector<std::string>>()) {
                settings.repodata_files.emplace_back(file);
            }
        }

        if (settings.repodata_files.empty()) {
            print_usage(options);
            log_warning(get_string("warning.no_repodata"));
        }

        log_debug(string_format("debug.settings", settings.output_dir.string(), mode,
                                settings.open_limit, settings.cache_file.string()));

        ElapsedTimer timer;
        run_dump(settings, std::cout);
        log_info(string_format("info.done", timer.elapsed()));

    } catch (const cxxopts::exceptions::exception& e) {
        log_error(string_format("error.cmd_parse_error", e.what()));
        return 1;
    } catch (const MandumpException& e) {
        log_error(string_format("error.mandump_error", e.what()));
        return 1;
    } catch (const std::exception& e) {
        log_error(string_format("error.unexpected_error", e.what()));
        return 1;
    }

    return 0;
}
