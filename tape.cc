#include <iostream>
#include <string>
#include <vector>

// spdlog environment configuration (SPDLOG_LEVEL)
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include "tape.hh"

int main( int argc, char* argv[] ) {
  // stdout carries the YAML result, so diagnostics go to stderr
  spdlog::set_default_logger( spdlog::stderr_color_mt("tape") );
  spdlog::cfg::load_env_levels();

  const std::vector< std::string > args( argv + 1, argv + argc );
  return tape::run_cli( args, std::cin, std::cout, std::cerr );
}
