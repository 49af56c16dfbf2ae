
#include <iostream>
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string_view>

#include "client/client.hpp"
#include "comet/curl_transport.hpp"
#include "config_manager.hpp"
#include "console.hpp"



static char const * const usage =
    "Usage:\n"
    "  maruska [--host=HOST] [--verbose] [COMMAND [ARGS...]]\n"
    "  maruska (--help | --version)\n"
    "\n"
    "Options:\n"
    "  --host=HOST   Comet endpoint of the marietje server\n"
    "  --verbose     Log everything, including raw packets\n"
    "  --help        Display this message\n"
    "  --version     Print version info and exit\n"
    "\n"
    "Commands:\n"
    "  watch                 Follow what is playing and the queue (default)\n"
    "  playing               Print the currently playing song\n"
    "  queue                 List the current queue\n"
    "  search QUERY [COUNT]  Search the songs list\n"
    "  request KEY           Request playback of a song\n";

// ***WARNING***
// If `%t` is used while `SPDLOG_NO_THREAD_ID` is defined, behavior is undefined
// If `%n` is used while `SPDLOG_NO_NAME` is defined, behavior is undefined
// Remove variables from compilation flags to use those again
static char const * const log_format = "[%Y-%m-%dT%T.%e] [%^%l%$] %v";
int main(int argc, char * argv[]) {
    // First thing: init logging
    // Create a logger object and register it into spdlog's global logger pool
    spdlog::stderr_color_mt("logger"); // Log to stderr, stdout is for command output
    spdlog::get("logger")->set_level(spdlog::level::info);
    spdlog::get("logger")->set_pattern(log_format);

    try {
        // Second thing: read config
        ConfigManager config(ConfigManager::defaultPaths());

        // Then, the command line, which takes precedence
        bool verbose = false;
        int i = 1;
        for (; i < argc && argv[i][0] == '-'; i++) {
            std::string_view arg(argv[i]);
            if (arg == "--help") {
                std::cout << usage;
                return 0;
            } else if (arg == "--version") {
                std::cout << "maruska " MARUSKA_VERSION << std::endl;
                return 0;
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg.substr(0, 7) == "--host=") {
                config.set("host", std::string(arg.substr(7)));
            } else {
                std::cerr << "Unknown option '" << arg << "'\n\n" << usage;
                return 1;
            }
        }

        Console::Command command = Console::Command::WATCH;
        if (i < argc) {
            auto iter = Console::commands.find(argv[i]);
            if (iter == Console::commands.end()) {
                std::cerr << noSuchCommandText(argv[i]) << "\n\n" << usage;
                return 1;
            }
            command = iter->second;
            i++;
        }
        std::vector<std::string> args(argv + i, argv + argc);

        std::shared_ptr<spdlog::logger> logger = spdlog::get("logger");
        logger->set_level(verbose ? spdlog::level::trace
                                  : spdlog::level::from_str(config.getStr("log_level")));
        if (!config.getStr("log_file").empty()) {
            logger->sinks().push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.getStr("log_file")));
        }

        // Now, connect, and run the command!
        CurlGlobal curl;
        Client client(
            std::make_unique<CurlTransport>(config.getStr("host"),
                                            std::chrono::seconds(config.getInt("connect_timeout")),
                                            std::chrono::seconds(config.getInt("request_timeout"))),
            CometChannel::RetryPolicy{std::chrono::milliseconds(config.getInt("retry_delay_ms")),
                                      std::chrono::milliseconds(config.getInt("retry_max_delay_ms"))});

        return Console(config, client, std::cout, std::cerr).run(command, args);

    } catch (std::exception const & exception) {
        spdlog::get("logger")->critical("Exception at top level: {}", exception.what());
    }

    return 1;
}
