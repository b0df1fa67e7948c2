#ifndef MCPC_DEBUG_LOG_HPP
#define MCPC_DEBUG_LOG_HPP

#include <string>

namespace debug_log {

// Returns true if MCPC_DEBUG env is set to a truthy value (1, true, yes).
bool is_debug_enabled();

// Writes message to stderr with [mcpc] prefix only when is_debug_enabled().
void log(const std::string &message);

// Writes message to stderr with [mcpc] prefix unconditionally.
// Used for operational events (transport failures, dispatcher exit).
// stdout is never written to, it belongs to the command output.
void log_message(const std::string &message);

} // namespace debug_log

#endif // MCPC_DEBUG_LOG_HPP
