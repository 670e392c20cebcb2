// examples/command.cpp
// Send remote admin commands to a server and print the responses.
//
//   cmake -B build -DEASYQUERY_BUILD_EXAMPLES=ON && cmake --build build
//   EASYQUERY_PASSWORD=secret ./build/easyquery_command /players /status
//
// Override the endpoint:
//
//   EASYQUERY_HOST=10.0.0.5 EASYQUERY_PORT=7777 ./build/easyquery_command /players

#include "easyquery/easyquery.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <string>

static std::string env_or(const char* name, const char* fallback) {
    const char* value = std::getenv(name);
    return value ? value : fallback;
}

int main(int argc, char** argv) {
    auto log = spdlog::stdout_color_mt("easyquery");
    log->set_level(spdlog::level::info);

    std::string host = env_or("EASYQUERY_HOST", "127.0.0.1");
    int port = std::atoi(env_or("EASYQUERY_PORT", "7777").c_str());
    std::string password = env_or("EASYQUERY_PASSWORD", "");

    try {
        auto client = easyquery::QueryClient::create(
            easyquery::QueryConfig::builder(host, port, password)
                .username("easyquery-example")
                .logger(log)
                .on_error([&log](const easyquery::QueryError& err) {
                    log->error("{}", err.what());
                })
                .build()
        );

        if (argc < 2) {
            std::cout << client->send_command("/players").to_string() << std::endl;
        }
        for (int i = 1; i < argc; i++) {
            try {
                std::cout << client->send_command(argv[i]).to_string() << std::endl;
            } catch (const easyquery::QueryError& e) {
                if (e.kind() == easyquery::ErrorKind::Disposed) throw;
                log->warn("{} failed: {}", argv[i], e.what());
            }
        }

        client->dispose();
    } catch (const easyquery::QueryError& e) {
        log->critical("{}", e.what());
        return 1;
    }

    return 0;
}
