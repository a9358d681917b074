#include <iostream>
#include <string>
#include <vector>
#include <memory>

#include "router_config.hpp"
#include "registration_store.hpp"
#include "router.hpp"
#include "http_recipient.hpp"
#include "device_id.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "metrics.hpp"

namespace {

constexpr int EXIT_NOT_FOUND = 2;

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [options] <command> [args]\n"
              << "Commands:\n"
              << "  register <dev-eui> <url> [method]   Register a device (method defaults to POST)\n"
              << "  lookup <dev-eui>                    Print the recipient a device routes to\n"
              << "Options:\n"
              << "  --backend, -b <url>   memory:// or tcp://host:port (env DEVROUTE_BACKEND_URL)\n"
              << "  --table, -t <name>    Registration table (env DEVROUTE_TABLE)\n"
              << "  --expiry, -e <sec>    Registration lifetime, 0 disables (env DEVROUTE_EXPIRY_SEC)\n"
              << "  --quiet, -q           Only log warnings and errors\n"
              << "  --metrics, -m         Print counters in Prometheus format after the command\n"
              << "  --help, -h            Show this help\n";
}

}

int main(int argc, char* argv[]) {
    using devroute::Failure;
    using devroute::Logger;
    using devroute::Nature;
    try {
        devroute::RouterConfig config;

        // --- Environment Variable Overrides ---
        devroute::load_config_from_env(config);
        
        // --- CLI Argument Parsing (flags win over the environment) ---
        std::vector<std::string> positional;
        bool dump_metrics = false;
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            auto next_value = [&](const std::string& flag) -> std::string {
                if (i + 1 >= argc) {
                    throw Failure(Nature::Structural, "Missing value for " + flag);
                }
                return argv[++i];
            };
            if (arg == "--help" || arg == "-h") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--backend" || arg == "-b") {
                config.backend_url = next_value(arg);
            } else if (arg == "--table" || arg == "-t") {
                config.table_name = next_value(arg);
            } else if (arg == "--expiry" || arg == "-e") {
                config.expiry_delay = devroute::parse_expiry_seconds(next_value(arg));
            } else if (arg == "--metrics" || arg == "-m") {
                dump_metrics = true;
            } else if (arg == "--quiet" || arg == "-q") {
                Logger::set_min_level(Logger::Level::WARNING);
            } else {
                positional.push_back(arg);
            }
        }

        if (positional.empty()) {
            print_usage(argv[0]);
            return 1;
        }

        if (config.backend_url == "memory://") {
            Logger::log(Logger::Level::WARNING, Logger::Event::CONFIG, "",
                        "In-memory backend: registrations do not outlive this process");
        }

        auto store = devroute::RegistrationStore::open(config);
        devroute::Router router(*store);

        const std::string& command = positional[0];
        int status = 0;
        if (command == "register" && (positional.size() == 3 || positional.size() == 4)) {
            std::string method = positional.size() == 4 ? positional[3] : "POST";
            devroute::HttpRegistration registration(
                devroute::parse_device_id(positional[1]),
                devroute::HttpRecipient(positional[2], method));
            router.register_device(registration);
            std::cout << "[+] Registered " << positional[1] << " -> " << method << " " << positional[2] << "\n";
        } else if (command == "lookup" && positional.size() == 2) {
            auto recipient = router.resolve(devroute::parse_device_id(positional[1]));
            if (recipient) {
                std::cout << recipient->method() << " " << recipient->url() << "\n";
            } else {
                std::cerr << "[-] " << positional[1] << " is not registered\n";
                status = EXIT_NOT_FOUND;
            }
        } else {
            print_usage(argv[0]);
            status = 1;
        }

        store->close();
        if (dump_metrics) {
            std::cout << devroute::MetricsRegistry::instance().collect_prometheus();
        }
        return status;

    } catch (const Failure& e) {
        std::cerr << "[!] " << devroute::nature_to_string(e.nature()) << " error: " << e.what() << "\n";
        return e.is(Nature::NotFound) ? EXIT_NOT_FOUND : 1;
    } catch (const std::exception& e) {
        std::cerr << "[!] Fatal error: " << e.what() << "\n";
        return 1;
    }
}
