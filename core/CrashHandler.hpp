#pragma once

namespace CrashHandler {

// Installs backward-cpp signal handlers that print a stack trace on
// SIGSEGV/SIGABRT and friends. Safe to call more than once.
void Init();

} // namespace CrashHandler
