#include <fstream>

#include "conftype.hh"

// Merge the YAML/JSON documents named on the command line (or read from
// standard input), decode the result as an untyped value, and print it
int main( int argc, char** argv ) {
  try {
    conftype::Sources sources;
    if ( argc < 2 ) {
      sources.stream( std::cin );
    }
    for ( int i = 1; i < argc; ++i ) {
      std::ifstream in( argv[i] );
      if ( !in ) {
        throw std::runtime_error( std::string( "cannot open " ) + argv[i] );
      }
      sources.stream( in );
    }
    conftype::Value merged = sources.on< conftype::Value >();
    std::cout << conftype::dumps( merged );
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[conftype] error: " << ex.what() << "\n";
    return 1;
  }
}
