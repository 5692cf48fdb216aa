// Standard library includes
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>

#include "elicitor.hh"

namespace {

  void usage( const char* prog ) {
    std::cerr << "usage: " << prog << " [-v] < document.yaml\n";
  }

} // anonymous namespace

int main( int argc, char* argv[] ) {

  bool verbose = false;
  for ( int i = 1; i < argc; ++i ) {
    const std::string arg = argv[ i ];
    if ( arg == "-v" || arg == "--verbose" ) verbose = true;
    else if ( arg == "-h" || arg == "--help" ) {
      usage( argv[0] );
      return 0;
    }
    else {
      std::cerr << "[elicitor] error: unknown option '" << arg << "'\n";
      usage( argv[0] );
      return 1;
    }
  }

  try {
    std::string input( ( std::istreambuf_iterator< char >(std::cin) ),
      std::istreambuf_iterator< char >() );
    elicitor::ordered_node doc = elicitor::ordered_node::deserialize( input );

    elicitor::ordered_node out = elicitor::process_document( doc,
      verbose ? &std::cerr : nullptr );
    std::cout << elicitor::ordered_node::serialize( out );
    return 0;
  }
  catch ( const elicitor::Cancelled& ex ) {
    std::cerr << "[elicitor] error: " << ex.what() << "\n";
    return 2;
  }
  catch ( const std::exception& ex ) {
    std::cerr << "[elicitor] error: " << ex.what() << "\n";
    return 1;
  }
}
