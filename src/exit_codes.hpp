/* ──────────────────────────────────────────────────────────────
   exit_codes.hpp   –  driver exit status per failure type
   ────────────────────────────────────────────────────────────── */
#pragma once

#include <exception>

namespace refrax {

enum ExitCode : int {
    kExitOk        = 0,
    kExitFailure   = 1,   // failed operation, or an unexpected std::exception
    kExitUsage     = 2,   // bad command line or configuration
    kExitFatal     = 3,   // backbone or storage unavailable
    kExitCancelled = 4,
};

/*  Logs the exception of a failed command and returns its exit code.
    Anything that is not a std::exception is rethrown.              */
int report_command_failure(std::exception_ptr ep);

/* same for the configuration phase: every std::exception is a usage error */
int report_config_failure(std::exception_ptr ep);

}  // namespace refrax
