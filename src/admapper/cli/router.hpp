#pragma once

namespace admapper::cli {

// Routes `admapper` subcommands and returns the process exit code:
//   0  => success
//   1  => command failed after valid invocation
//   2  => usage error (unknown command / invalid args)
//   10 => configuration file rejected
//   20 => replay input rejected
int Dispatch(int argc, char** argv);

} // namespace admapper::cli
