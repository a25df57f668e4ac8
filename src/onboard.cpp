#include "onboard.hpp"
#include "config.hpp"
#include <iostream>

namespace convmem {

int cmd_onboard(const std::string& config_path) {
    if (fs::exists(config_path)) {
        std::cout << "[onboard] Config already exists: " << config_path << "\n";
        return 0;
    }

    try {
        Config cfg = Config::make_default();
        cfg.save(config_path);
    } catch (const std::exception& e) {
        std::cerr << "[onboard] Failed to write config: " << e.what() << "\n";
        return 1;
    }

    std::cout << "[onboard] Created config: " << config_path << "\n";
    std::cout << "\nconvmem is ready. The default embedding provider is \"local\" (offline hashing).\n"
              << "To use an OpenAI-compatible endpoint, set embedding.provider to \"default\"\n"
              << "and export OPENAI_API_KEY (or fill providers.default.api_key).\n"
              << "Then run: convmem serve\n";
    return 0;
}

} // namespace convmem
