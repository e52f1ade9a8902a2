#pragma once

/**
 * knowmap command-line commands
 *
 * Each command takes the arguments after its name and returns the process
 * exit code: 0 on success, 2 when a parameter is invalid, 1 on any other
 * error. Errors are printed to stderr with the offending field.
 */

namespace knowmap::cli {

// Full command line including the program name; global options, then the command
int run(int argc, char* argv[]);

int cmd_flatten(int argc, char* argv[]);
int cmd_stats(int argc, char* argv[]);
int cmd_version(int argc, char* argv[]);
int cmd_help(int argc, char* argv[]);

}  // namespace knowmap::cli
