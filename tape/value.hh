// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

// fkYAML single-header library
// https://github.com/fktn-k/fkYAML
#include "fkYAML/node.hpp"

// {fmt} formatting library
#include <fmt/format.h>

namespace tape {

  // Specialized version of the fkYAML basic_node template. In particular,
  // the choice of fkyaml::ordered_map preserves the lexical order of the
  // input, which keeps children and mapping-derived results in source order.
  using ordered_node = fkyaml::basic_node<
    std::vector, // sequence container
    fkyaml::ordered_map, // mapping container
    bool,
    std::int64_t,
    double,
    std::string,
    fkyaml::node_value_converter
  >;

  using node_list = std::vector< ordered_node >;

namespace internal {

  // Kind names reported in diagnostics and matched by the 'type' filter
  // operator
  inline constexpr const char* KIND_NULL = "null";
  inline constexpr const char* KIND_BOOL = "bool";
  inline constexpr const char* KIND_INT = "int";
  inline constexpr const char* KIND_FLOAT = "float";
  inline constexpr const char* KIND_STR = "str";
  inline constexpr const char* KIND_LIST = "list";
  inline constexpr const char* KIND_DICT = "dict";

  // Helpers for conversions to/from the ordered_node type

  template < typename T >
  inline T to_native_checked( const ordered_node& n ) {
    T out;
    fkyaml::node_value_converter< T >::from_node( n, out );
    return out;
  }

  template < typename T >
  inline ordered_node make_node_from( const T& value ) {
    ordered_node n;
    fkyaml::node_value_converter< T >::to_node( n, value );
    return n;
  }

  inline ordered_node make_string( const std::string& s ) {
    return make_node_from< std::string >( s );
  }

  inline ordered_node make_int( std::int64_t v ) {
    return make_node_from< std::int64_t >( v );
  }

  inline ordered_node make_float( double v ) {
    return make_node_from< double >( v );
  }

  inline ordered_node make_bool( bool v ) {
    return make_node_from< bool >( v );
  }

  inline std::string kind_name( const ordered_node& n ) {
    if ( n.is_null() ) return KIND_NULL;
    if ( n.is_boolean() ) return KIND_BOOL;
    if ( n.is_integer() ) return KIND_INT;
    if ( n.is_float_number() ) return KIND_FLOAT;
    if ( n.is_string() ) return KIND_STR;
    if ( n.is_sequence() ) return KIND_LIST;
    return KIND_DICT;
  }

  // Booleans are deliberately not numbers here
  inline bool is_number( const ordered_node& n ) {
    return n.is_integer() || n.is_float_number();
  }

  inline double as_double( const ordered_node& n ) {
    if ( n.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(n) );
    }
    return to_native_checked< double >( n );
  }

  // UTF-8 helpers. Lengths and positions seen by users are counted in code
  // points, never in bytes.

  inline bool is_continuation_byte( char c ) {
    return ( static_cast< unsigned char >(c) & 0xC0 ) == 0x80;
  }

  inline std::size_t utf8_length( const std::string& s ) {
    std::size_t count = 0;
    for ( char c : s ) {
      if ( !is_continuation_byte(c) ) ++count;
    }
    return count;
  }

  // Byte offset of the code point with index cp (s.size() if past the end)
  inline std::size_t utf8_offset( const std::string& s, std::size_t cp ) {
    std::size_t seen = 0;
    for ( std::size_t i = 0; i < s.size(); ++i ) {
      if ( is_continuation_byte(s[i]) ) continue;
      if ( seen == cp ) return i;
      ++seen;
    }
    return s.size();
  }

  inline std::string utf8_prefix( const std::string& s, std::size_t cp ) {
    return s.substr( 0, utf8_offset(s, cp) );
  }

  inline std::string utf8_at( const std::string& s, std::size_t cp ) {
    const std::size_t begin = utf8_offset( s, cp );
    const std::size_t end = utf8_offset( s, cp + 1 );
    return s.substr( begin, end - begin );
  }

  // Text form of any value. Strings pass through, null renders as the empty
  // string and collections fall back to YAML serialization.
  inline std::string to_display_string( const ordered_node& n ) {
    if ( n.is_null() ) return "";
    if ( n.is_string() ) return to_native_checked< std::string >( n );
    if ( n.is_integer() ) return std::to_string(
      to_native_checked< std::int64_t >( n )
    );
    if ( n.is_boolean() ) return to_native_checked< bool >( n )
      ? "true" : "false";
    if ( n.is_float_number() ) return fmt::format( "{}",
      to_native_checked< double >( n )
    );

    std::string text = ordered_node::serialize( n );
    while ( !text.empty() && text.back() == '\n' ) text.pop_back();
    return text;
  }

  inline std::string key_string( const ordered_node& key ) {
    return to_display_string( key );
  }

  // Deep equality. Integers and floats compare numerically, booleans only
  // ever equal booleans.
  inline bool nodes_equal( const ordered_node& a, const ordered_node& b ) {
    if ( is_number(a) && is_number(b) ) {
      if ( a.is_integer() && b.is_integer() ) {
        return to_native_checked< std::int64_t >( a )
          == to_native_checked< std::int64_t >( b );
      }
      return as_double( a ) == as_double( b );
    }
    if ( kind_name(a) != kind_name(b) ) return false;
    if ( a.is_null() ) return true;
    if ( a.is_boolean() ) {
      return to_native_checked< bool >( a ) == to_native_checked< bool >( b );
    }
    if ( a.is_string() ) {
      return to_native_checked< std::string >( a )
        == to_native_checked< std::string >( b );
    }
    if ( a.is_sequence() ) {
      if ( a.size() != b.size() ) return false;
      for ( std::size_t i = 0; i < a.size(); ++i ) {
        if ( !nodes_equal(a.at(i), b.at(i)) ) return false;
      }
      return true;
    }

    // Mappings: same keys (order-insensitive) with equal values
    if ( a.size() != b.size() ) return false;
    for ( const auto& [mk, mv] : a.map_items() ) {
      const std::string k = key_string( mk );
      if ( !b.contains(k) ) return false;
      if ( !nodes_equal(mv, b.at(k)) ) return false;
    }
    return true;
  }

  // The single field-access capability of the value model. Missing fields
  // and values without named fields both yield null.
  inline const ordered_node* find_field( const ordered_node& n,
    const std::string& name )
  {
    if ( !n.is_mapping() || !n.contains(name) ) return nullptr;
    return &n.at( name );
  }

  inline ordered_node field_of( const ordered_node& n,
    const std::string& name )
  {
    const ordered_node* found = find_field( n, name );
    return found ? *found : ordered_node();
  }

  // Helper that builds a sequence node from a list of values
  inline ordered_node make_sequence( const node_list& items ) {
    if ( items.empty() ) return ordered_node::sequence();
    return make_node_from( items );
  }

} // namespace tape::internal

} // namespace tape
