#pragma once
#include <string>

namespace convmem {
int cmd_onboard(const std::string& config_path);
} // namespace convmem
