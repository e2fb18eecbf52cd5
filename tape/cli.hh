// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <exception>
#include <istream>
#include <ostream>
#include <string>
#include <vector>

#include "tape/adapter.hh"
#include "tape/document.hh"
#include "tape/library.hh"

namespace tape {

namespace internal {

  inline const std::string USAGE =
    "usage: tape <definition> [source]\n"
    "  <definition> is a built-in format or a YAML/JSON file\n"
    "  [source] is read from standard input when omitted\n";

  inline const std::string ERROR_PREFIX = "[tape] error: ";

} // namespace internal

  // Body of the tape command. The arguments exclude the program name; the
  // source is read from the "in" stream when no file is given. Returns the
  // process exit code: 0 on success, 1 on any error, 2 on bad usage.
  inline int run_cli( const std::vector< std::string >& args,
    std::istream& in, std::ostream& out, std::ostream& err )
  {
    if ( args.empty() || args.size() > 2 ) {
      err << internal::USAGE;
      return 2;
    }

    try {
      const Adapter adapter( load_definition(args[0]) );
      const ordered_node source = args.size() == 2
        ? load_document_file( args[1] )
        : load_document( in );
      out << adapter.convert_tree( source ).to_yaml();
      return 0;
    } catch (const std::exception& ex) {
      err << internal::ERROR_PREFIX << ex.what() << "\n";
      return 1;
    }
  }

} // namespace tape
