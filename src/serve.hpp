#pragma once
#include <string>

namespace chime {
int cmd_serve(const std::string& host, int port);
} // namespace chime
