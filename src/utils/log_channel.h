/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                  \
  LOGCHANNEL(core, "core", "Messages that don't have a intuitive log channel can be logged here.")                \
  LOGCHANNEL(dap, "dap", "Raw debug adapter protocol traffic, every message read from or written to the adapter.") \
  LOGCHANNEL(session, "session", "Session lifecycle: state transitions, capability negotiation, correlation.")    \
  LOGCHANNEL(data, "data", "Updates to the cached modules, threads and output of a session.")                     \
  LOGCHANNEL(warning, "warning", "Unexpected behaviors should be logged to this chanel")

namespace dapc {
ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, i8)
} // namespace dapc
