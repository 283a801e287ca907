#pragma once

// argv[0] is the program name, argv[1] the subcommand; returns the exit code
int dispatch(int argc, char** argv);
