#pragma once

namespace chkr {

// Command-line entry point, returns the process exit status.
int run_cli(int argc, char** argv);

} // namespace chkr
