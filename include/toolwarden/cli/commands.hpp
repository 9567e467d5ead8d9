#pragma once

namespace toolwarden::cli {

/// Entry point for the `toolwarden` executable. Returns the process exit code:
/// 0 on success, 1 on usage or configuration errors, 2 when a scan found threats.
int run_cli(int argc, char **argv);

} // namespace toolwarden::cli
