#include "CrashHandler.hpp"
#include <backward.hpp>

#include "Log.hpp"

namespace CrashHandler {

// Lives for the whole process; signal handlers outlive any scope.
static backward::SignalHandling *s_SignalHandler = nullptr;

void Init() {
  if (!s_SignalHandler) {
    s_SignalHandler = new backward::SignalHandling();
    if (!s_SignalHandler->loaded()) {
      LOG_WARN("Crash handler could not install signal handlers");
    }
  }
}

} // namespace CrashHandler
