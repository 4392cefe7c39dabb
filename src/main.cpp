#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <core/config.hpp>
#include "cli/query_cli.hpp"
#include "cli/theme.hpp"

static std::atomic<QueryCLI*> g_cli{nullptr};

static void handle_interrupt(int) {
    QueryCLI* cli = g_cli.load();
    if (cli) cli->cancel();
}

void print_usage() {
    std::cerr << theme::section("Usage");
    std::cerr << theme::color::BLUE << "    horizons_query "
              << theme::color::RESET << "<start_time> <target> [output_file]\n"
              << theme::color::DIM
              << "        Fetch the observer table for <target> starting at <start_time>\n"
              << "        (\"YYYY-MM-DD HH:MM\"). Exit 2 lists candidates when ambiguous."
              << theme::color::RESET << "\n";
    std::cerr << theme::color::BLUE << "    horizons_query track "
              << theme::color::RESET << "<tweet_id> <created_at> <mention>\n"
              << theme::color::DIM
              << "        Query the mentioned body and record when its echo is due"
              << theme::color::RESET << "\n";
    std::cerr << theme::color::BLUE << "    horizons_query due"
              << theme::color::RESET << theme::color::DIM
              << "                List echoes whose deadline has passed"
              << theme::color::RESET << "\n";
    std::cerr << theme::color::BLUE << "    horizons_query replied "
              << theme::color::RESET << "<id>" << theme::color::DIM
              << "       Mark an echo as sent"
              << theme::color::RESET << "\n\n";
    std::cerr << theme::color::DIM
              << "    horizons_query --init-config   Write ~/.celestial_echo/config.yaml\n"
              << "    horizons_query --version       Show version\n"
              << "    horizons_query --help          Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc < 2) {
            std::cerr << theme::fail("Missing arguments.");
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];

        if (cmd == "--version") {
            std::cout << "horizons_query version 0.2.0\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "--init-config") {
            auto r = create_default_config();
            if (r.is_err()) {
                std::cerr << theme::fail(r.error);
                return 1;
            }
            std::cerr << theme::ok("Config at " + get_config_path().string());
            return 0;
        }

        auto config = Config::load();
        if (config.is_err()) {
            std::cerr << theme::fail(config.error);
            return 1;
        }

        QueryCLI cli(config.value);
        g_cli.store(&cli);
        std::signal(SIGINT, handle_interrupt);
        std::signal(SIGTERM, handle_interrupt);

        int code = 1;
        if (cmd == "track") {
            if (argc < 5) {
                std::cerr << theme::fail("Usage: horizons_query track <tweet_id> <created_at> <mention>");
                code = 1;
            } else {
                code = cli.run_track(argv[2], argv[3], argv[4]);
            }
        } else if (cmd == "due") {
            code = cli.run_due();
        } else if (cmd == "replied") {
            if (argc < 3) {
                std::cerr << theme::fail("Usage: horizons_query replied <id>");
                code = 1;
            } else {
                code = cli.run_replied(argv[2]);
            }
        } else if (argc < 3) {
            std::cerr << theme::fail("Missing target.");
            print_usage();
            code = 1;
        } else {
            code = cli.run_query(argv[1], argv[2], argc >= 4 ? argv[3] : "");
        }

        g_cli.store(nullptr);
        return code;
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
