#pragma once
#include "notification_sink.hpp"
#include "../config.hpp"
#include <memory>
#include <ostream>

namespace chime {

// Builds the fan-out of every sink enabled in the config. A misconfigured
// sink (bad webhook URL) is skipped with a warning.
std::unique_ptr<FanoutSink> make_sinks(const NotifyConfig& cfg, std::ostream& console);

} // namespace chime
