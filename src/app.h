/** LICENSE TEMPLATE */
#pragma once

namespace dapsync {
// Parses the command line and runs whatever it asks for. Returns the process exit code.
int Start(int argc, const char **argv) noexcept;
} // namespace dapsync
