// examples/console.cpp
// Stream server console output until interrupted.
//
//   EASYQUERY_PASSWORD=secret ./build/easyquery_console
//
// Lines typed on stdin are sent as commands; an empty line quits.

#include "easyquery/easyquery.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <cstdlib>
#include <iostream>
#include <string>

int main() {
    auto log = spdlog::stdout_color_mt("easyquery");
    log->set_level(spdlog::level::warn);

    std::string host = "127.0.0.1";
    int port = 7777;
    std::string password;
    if (const char* env = std::getenv("EASYQUERY_HOST")) host = env;
    if (const char* env = std::getenv("EASYQUERY_PORT")) port = std::atoi(env);
    if (const char* env = std::getenv("EASYQUERY_PASSWORD")) password = env;

    try {
        auto client = easyquery::QueryClient::create(
            easyquery::QueryConfig::builder(host, port, password)
                .subscribe_console(true)
                .subscribe_logs(true)
                .logger(log)
                .on_error([&log](const easyquery::QueryError& err) {
                    log->error("{}", err.what());
                })
                .build()
        );

        client->on_console_message([](const std::string& line) {
            std::cout << "[console] " << line << std::endl;
        });

        std::string line;
        while (std::getline(std::cin, line) && !line.empty()) {
            try {
                std::cout << client->send_command(line).to_string() << std::endl;
            } catch (const easyquery::QueryError& e) {
                if (e.kind() == easyquery::ErrorKind::Disposed) throw;
                log->warn("{}", e.what());
            }
        }

        client->dispose();
    } catch (const easyquery::QueryError& e) {
        log->critical("{}", e.what());
        return 1;
    }

    return 0;
}
