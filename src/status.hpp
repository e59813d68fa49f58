#pragma once

namespace chime {
int cmd_status();
} // namespace chime
