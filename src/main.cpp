#include <iostream>
#include <string>
#include <vector>
#include "onboard.hpp"
#include "gateway.hpp"
#include "status.hpp"
#include "utils.hpp"

static void print_usage() {
    std::cout << "Usage: convmem <command> [options]\n\n"
              << "Commands:\n"
              << "  onboard                     Write the default config (~/.convmem/config.json)\n"
              << "  serve [--host H] [--port P]\n"
              << "                              Start the HTTP memory gateway\n"
              << "  status                      Show current configuration\n\n"
              << "Options:\n"
              << "  --config PATH               Use PATH instead of the default config\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string cmd = argv[1];
    std::string config_path = convmem::default_config_path();
    std::vector<std::string> args;
    for (int i = 2; i < argc; i++) {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc) {
            config_path = convmem::expand_path(argv[++i]);
        } else {
            args.push_back(a);
        }
    }

    if (cmd == "onboard") {
        return convmem::cmd_onboard(config_path);
    }
    else if (cmd == "serve") {
        std::string host;
        int port = 0;
        for (size_t i = 0; i < args.size(); i++) {
            if (args[i] == "--host" && i + 1 < args.size()) {
                host = args[++i];
            } else if (args[i] == "--port" && i + 1 < args.size()) {
                try {
                    port = std::stoi(args[++i]);
                } catch (const std::exception&) {
                    std::cerr << "Invalid port: " << args[i] << "\n";
                    return 1;
                }
            }
        }
        return convmem::cmd_serve(config_path, host, port);
    }
    else if (cmd == "status") {
        return convmem::cmd_status(config_path);
    }
    else if (cmd == "help" || cmd == "--help" || cmd == "-h") {
        print_usage();
        return 0;
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    print_usage();
    return 1;
}
