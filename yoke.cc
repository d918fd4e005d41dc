#include "yoke.hh"

int main( int argc, char** argv ) {
  return yoke::cli::run( argc, argv, std::cin, std::cout, std::cerr );
}
