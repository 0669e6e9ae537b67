#pragma once

namespace ssrp::cli {

// Installs a Qt message handler that writes
// "<timestamp> <level> <category> <message>" lines to stderr.
// With verbose set, ssrp.* debug output is enabled as well.
void install_stderr_logging(bool verbose);

} // namespace ssrp::cli
