#pragma once
#include <string>

namespace convmem {
int cmd_status(const std::string& config_path);
} // namespace convmem
