#include "executor/supervisor_builder.hpp"

#include "absl/memory/memory.h"
#include "executor/local_supervisor.hpp"
#include "executor/monitor_supervisor.hpp"
#include "util/flags.hpp"

namespace executor {

std::unique_ptr<ProcessSupervisor> SupervisorBuilder::Get(
    const std::string& kind) {
  if (kind == "local") {
    return absl::make_unique<LocalSupervisor>(FLAGS_temp_directory);
  }
  if (kind == "monitor") {
    return absl::make_unique<MonitorSupervisor>(FLAGS_monitor_binary);
  }
  return nullptr;
}

}  // namespace executor
