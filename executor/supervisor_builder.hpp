#ifndef EXECUTOR_SUPERVISOR_BUILDER_HPP
#define EXECUTOR_SUPERVISOR_BUILDER_HPP
#include "executor/supervisor.hpp"

#include <memory>
#include <string>

namespace executor {

class SupervisorBuilder {
 public:
  // kind is "local" or "monitor". Returns nullptr for any other kind.
  static std::unique_ptr<ProcessSupervisor> Get(const std::string& kind);
};

}  // namespace executor

#endif
