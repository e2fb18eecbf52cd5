// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <fstream>
#include <istream>
#include <sstream>
#include <string>

#include "tape/errors.hh"
#include "tape/value.hh"

namespace tape {

  // Parse YAML (or JSON, which is a subset) text into a node. The origin is
  // only used to label errors.
  inline ordered_node parse_document( const std::string& text,
    const std::string& origin = "<input>" )
  {
    try {
      return ordered_node::deserialize( text );
    }
    catch ( const fkyaml::exception& ex ) {
      throw SpecError( origin + ": invalid YAML", ex.what() );
    }
  }

  // Read from an input stream until end-of-file, then parse the result
  inline ordered_node load_document( std::istream& in,
    const std::string& origin = "<stdin>" )
  {
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_document( ss.str(), origin );
  }

  inline ordered_node load_document_file( const std::string& path ) {
    std::ifstream in( path );
    if ( !in ) throw SpecError( "cannot open file '" + path + "'" );
    return load_document( in, path );
  }

} // namespace tape
