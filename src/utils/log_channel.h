/** LICENSE TEMPLATE */
#pragma once

#include <common/macros.h>

#define FOR_EACH_LOG(LOGCHANNEL)                                                                                  \
  LOGCHANNEL(core, "Core", "Messages that don't have a intuitive log channel can be logged here.")                \
  LOGCHANNEL(dap, "Debug Adapter Protocol", "Traffic between the client, dapsync and the debug adapter.")         \
  LOGCHANNEL(sync, "Address Synchronization", "Stop handling, register detection, retries and failure episodes")  \
  LOGCHANNEL(transport, "Viewer Transport", "Requests sent to the external viewer and their outcome")             \
  LOGCHANNEL(warning, "Warnings", "Unexpected behaviors should be logged to this chanel")

ENUM_TYPE_METADATA(Channel, FOR_EACH_LOG, DEFAULT_ENUM, i8)
