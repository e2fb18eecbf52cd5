// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <string>

#include "tape/errors.hh"
#include "tape/path.hh"
#include "tape/value.hh"

namespace tape {

  // Rewrites each item of a sequence into a copy of a template, with
  // ${expr} placeholders bound against {variable: item}
  struct MapSpec {
    ordered_node tmpl;
    std::string variable = "item";
  };

namespace internal {

  inline const std::string TEMPLATE = "template";
  inline const std::string VARIABLE = "variable";
  inline const std::string DEFAULT_VARIABLE = "item";
  inline const std::string OPEN_PLACEHOLDER = "${";
  inline const std::string CLOSE_PLACEHOLDER = "}";

  // A string that is nothing but one placeholder keeps the bound value's
  // kind; returns the expression inside when that is the case
  inline bool whole_placeholder( const std::string& s, std::string& expr ) {
    if ( s.size() < OPEN_PLACEHOLDER.size() + CLOSE_PLACEHOLDER.size() + 1 ) {
      return false;
    }
    if ( s.compare(0, OPEN_PLACEHOLDER.size(), OPEN_PLACEHOLDER) != 0 ) {
      return false;
    }
    const std::size_t close = s.find( CLOSE_PLACEHOLDER );
    if ( close != s.size() - CLOSE_PLACEHOLDER.size() ) return false;
    expr = s.substr( OPEN_PLACEHOLDER.size(),
      close - OPEN_PLACEHOLDER.size() );
    return true;
  }

  // Replace every embedded ${expr} with the display string of its value.
  // An unterminated placeholder is left as literal text.
  inline std::string bind_placeholders( const std::string& s,
    const ordered_node& binding )
  {
    std::string out;
    std::size_t pos = 0;
    while ( true ) {
      const std::size_t open = s.find( OPEN_PLACEHOLDER, pos );
      if ( open == std::string::npos ) break;
      const std::size_t close = s.find( CLOSE_PLACEHOLDER,
        open + OPEN_PLACEHOLDER.size() );
      if ( close == std::string::npos ) break;

      out += s.substr( pos, open - pos );
      const std::string expr = s.substr( open + OPEN_PLACEHOLDER.size(),
        close - open - OPEN_PLACEHOLDER.size() );
      out += to_display_string( evaluate_path(binding, expr) );
      pos = close + CLOSE_PLACEHOLDER.size();
    }
    out += s.substr( pos );
    return out;
  }

  // Recursively bind strings in a template copy. Mappings and sequences are
  // rebuilt structurally, keys are left untouched.
  inline ordered_node bind_template( const ordered_node& tmpl,
    const ordered_node& binding )
  {
    if ( tmpl.is_string() ) {
      const std::string s = to_native_checked< std::string >( tmpl );
      if ( s.find(OPEN_PLACEHOLDER) == std::string::npos ) return tmpl;
      std::string expr;
      if ( whole_placeholder(s, expr) ) return evaluate_path( binding, expr );
      return make_string( bind_placeholders(s, binding) );
    }
    if ( tmpl.is_mapping() ) {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [mk, mv] : tmpl.map_items() ) {
        out[ key_string(mk) ] = bind_template( mv, binding );
      }
      return out;
    }
    if ( tmpl.is_sequence() ) {
      node_list out;
      out.reserve( tmpl.size() );
      for ( const auto& el : tmpl ) out.push_back( bind_template(el, binding) );
      return make_sequence( out );
    }
    // scalars/null: nothing to do
    return tmpl;
  }

} // namespace tape::internal

  inline MapSpec parse_map_spec( const ordered_node& spec ) {
    using namespace internal;
    if ( !spec.is_mapping() || !spec.contains(TEMPLATE) ) {
      throw SpecError( "map requires a '" + TEMPLATE + "' field" );
    }
    MapSpec out{ spec.at( TEMPLATE ), DEFAULT_VARIABLE };
    if ( spec.contains(VARIABLE) ) {
      const ordered_node& var = spec.at( VARIABLE );
      if ( !var.is_string() ) {
        throw SpecError( "map '" + VARIABLE + "' must be a string, got "
          + kind_name(var) );
      }
      out.variable = to_native_checked< std::string >( var );
      if ( out.variable.empty() ) {
        throw SpecError( "map '" + VARIABLE + "' cannot be empty" );
      }
    }
    return out;
  }

  inline ordered_node map_spec_to_node( const MapSpec& spec ) {
    ordered_node out = ordered_node::mapping();
    out[ internal::TEMPLATE ] = spec.tmpl;
    if ( spec.variable != internal::DEFAULT_VARIABLE ) {
      out[ internal::VARIABLE ] = internal::make_string( spec.variable );
    }
    return out;
  }

  inline ordered_node map_collection( const ordered_node& collection,
    const MapSpec& spec )
  {
    if ( !collection.is_sequence() ) {
      throw TypeMismatch( "map", internal::KIND_LIST,
        internal::kind_name(collection) );
    }
    node_list out;
    out.reserve( collection.size() );
    for ( const auto& item : collection ) {
      ordered_node binding = ordered_node::mapping();
      binding[ spec.variable ] = item;
      out.push_back( internal::bind_template(spec.tmpl, binding) );
    }
    return internal::make_sequence( out );
  }

} // namespace tape
