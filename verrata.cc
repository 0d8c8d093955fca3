#include "verrata_cli.hh"

int main( int argc, char* argv[] ) {
  const std::vector< std::string > args( argv + 1, argv + argc );
  return verrata::cli::run( args, std::cin, std::cout, std::cerr );
}
