#pragma once

namespace codebox::cli {

/// `codebox` entry point.
int run_cli(int argc, char **argv);

/// `codebox-kernel` entry point: the execution kernel that runs inside each sandbox.
int run_kernel_cli(int argc, char **argv);

} // namespace codebox::cli
