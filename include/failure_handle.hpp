/**
 * netsdr-client
 */

#pragma once

// Installs handlers that print a backtrace to stderr on SIGSEGV, SIGABRT, SIGFPE and SIGBUS, then
// re-raise the signal with the default action.
void InitFailureHandle();
