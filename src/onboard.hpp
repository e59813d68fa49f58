#pragma once

namespace chime {
int cmd_onboard();
} // namespace chime
