#pragma once

namespace execbox::cli {

/// Entry point of the `execbox` binary. Returns the process exit status.
int run_cli(int argc, char **argv);

} // namespace execbox::cli
