#pragma once
#include <string>
#include <vector>

namespace chime {
int cmd_remind(const std::vector<std::string>& args);
} // namespace chime
