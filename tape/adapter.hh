// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <cerrno>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// spdlog logging library
#include <spdlog/spdlog.h>

#include "tape/definition.hh"
#include "tape/errors.hh"
#include "tape/extraction.hh"
#include "tape/node.hh"
#include "tape/value.hh"

namespace tape {

  // Converts source trees into Node trees according to a Definition. The
  // Definition is copied in and never modified, so one Adapter may be used
  // from several threads at once.
  class Adapter {
  public:
    explicit Adapter( Definition definition )
      : definition_( std::move(definition) ) {}

    // Returns std::nullopt when the source node's type is ignored
    std::optional< Node > convert( const ordered_node& source ) const;

    // Like convert(), but the root itself must survive
    Node convert_tree( const ordered_node& source ) const;

    const Definition& definition() const { return definition_; }

  private:
    // Run one extraction, tagging any failure with the field and type
    ordered_node extract_field( const ordered_node& source,
      const ExtractionSpec& spec, const std::string& field,
      const std::optional< std::string >& node_type ) const;

    std::optional< std::string > node_type_of(
      const ordered_node& source ) const;

    std::optional< std::string > final_type( const ordered_node& source,
      const std::optional< std::string >& node_type ) const;

    std::vector< Node > convert_children( const ordered_node& source,
      const ChildrenSelector& selector,
      const std::optional< std::string >& node_type ) const;

    void collect_by_type( const ordered_node& candidate,
      const TypeFilter& filter, std::vector< Node >& out ) const;

    Definition definition_;
  };

namespace internal {

  inline const std::string UNKNOWN_LABEL = "Unknown";

  // Integers are kept, floats truncate, numeric strings are parsed and
  // everything else counts as one line. Negative counts clamp to zero.
  inline std::int64_t coerce_content_lines( const ordered_node& v ) {
    std::int64_t lines = 1;
    if ( v.is_integer() ) {
      lines = to_native_checked< std::int64_t >( v );
    }
    else if ( v.is_float_number() ) {
      const double d = to_native_checked< double >( v );
      if ( !std::isfinite(d) ) lines = 1;
      else if ( d < 0.0 ) lines = 0;
      // 2^63 is the first double past the int64 range
      else if ( d >= 9223372036854775808.0 ) {
        lines = std::numeric_limits< std::int64_t >::max();
      }
      else lines = static_cast< std::int64_t >( d );
    }
    else if ( v.is_string() ) {
      const std::string s = to_native_checked< std::string >( v );
      const std::string t = trim( s );
      if ( !t.empty() ) {
        char* end = nullptr;
        errno = 0;
        const long long parsed = std::strtoll( t.c_str(), &end, 10 );
        if ( errno == 0 && end && *end == '\0' ) lines = parsed;
      }
    }
    return lines < 0 ? 0 : lines;
  }

} // namespace tape::internal

} // namespace tape

// Adapter member function definitions

inline tape::ordered_node tape::Adapter::extract_field(
  const ordered_node& source, const ExtractionSpec& spec,
  const std::string& field,
  const std::optional< std::string >& node_type ) const
{
  try {
    return tape::extract( source, spec );
  }
  catch ( Error& err ) {
    err.set_context( field, node_type );
    throw;
  }
}

inline std::optional< std::string > tape::Adapter::node_type_of(
  const ordered_node& source ) const
{
  const ordered_node raw = this->extract_field( source,
    *definition_.fields().type, internal::TYPE, std::nullopt );
  if ( raw.is_null() ) return std::nullopt;

  std::string text = internal::to_display_string( raw );
  if ( text.empty() ) return std::nullopt;
  return text;
}

// An override that supplies its own type spec renames the node
inline std::optional< std::string > tape::Adapter::final_type(
  const ordered_node& source,
  const std::optional< std::string >& node_type ) const
{
  if ( !node_type ) return node_type;
  const FieldSet* partial = definition_.override_for( *node_type );
  if ( !partial || !partial->type ) return node_type;

  const ordered_node renamed = this->extract_field( source, *partial->type,
    internal::TYPE, node_type );
  if ( !renamed.is_null() ) {
    const std::string text = internal::to_display_string( renamed );
    if ( !text.empty() ) {
      spdlog::debug( "type override renames '{}' to '{}'", *node_type,
        text );
      return text;
    }
  }
  if ( const auto* simple = std::get_if< SimplePath >(&*partial->type) ) {
    return simple->text;
  }
  return node_type;
}

inline void tape::Adapter::collect_by_type( const ordered_node& candidate,
  const TypeFilter& filter, std::vector< Node >& out ) const
{
  if ( !candidate.is_mapping() ) return;
  const std::optional< std::string > child_type = this->node_type_of(
    candidate );
  if ( !child_type || !filter.matches(*child_type) ) return;

  std::optional< Node > child = this->convert( candidate );
  if ( child ) out.push_back( std::move(*child) );
}

inline std::vector< tape::Node > tape::Adapter::convert_children(
  const ordered_node& source, const ChildrenSelector& selector,
  const std::optional< std::string >& node_type ) const
{
  std::vector< Node > children;

  if ( const auto* filter = std::get_if< TypeFilter >(&selector) ) {
    if ( !source.is_mapping() ) return children;
    for ( const auto& [mk, mv] : source.map_items() ) {
      if ( mv.is_sequence() ) {
        for ( const auto& el : mv ) {
          this->collect_by_type( el, *filter, children );
        }
      }
      else this->collect_by_type( mv, *filter, children );
    }
    return children;
  }

  const ordered_node kids = this->extract_field( source,
    std::get< ExtractionSpec >( selector ), internal::CHILDREN, node_type );
  if ( kids.is_null() ) return children;
  if ( !kids.is_sequence() ) {
    StructuralError err( "children must resolve to a list, got "
      + internal::kind_name(kids) );
    err.set_context( internal::CHILDREN, node_type );
    throw err;
  }

  children.reserve( kids.size() );
  for ( const auto& kid : kids ) {
    std::optional< Node > child = this->convert( kid );
    if ( child ) children.push_back( std::move(*child) );
  }
  return children;
}

inline std::optional< tape::Node > tape::Adapter::convert(
  const ordered_node& source ) const
{
  using namespace internal;

  const std::optional< std::string > node_type = this->node_type_of(
    source );
  if ( node_type && definition_.ignores(*node_type) ) {
    spdlog::debug( "pruning node of ignored type '{}'", *node_type );
    return std::nullopt;
  }

  const FieldSet fields = definition_.effective_fields( node_type );
  const std::optional< std::string > type = this->final_type( source,
    node_type );

  // Label, falling back to the type
  const ordered_node raw_label = this->extract_field( source, *fields.label,
    LABEL, type );
  std::string label;
  if ( !raw_label.is_null() ) label = to_display_string( raw_label );
  else label = type ? *type : UNKNOWN_LABEL;

  // Icon: an explicit non-empty value wins over the icon table
  const ordered_node raw_icon = this->extract_field( source, *fields.icon,
    ICON, type );
  std::string icon = to_display_string( raw_icon );
  if ( icon.empty() ) icon = definition_.resolve_icon( type );

  const std::int64_t content_lines = coerce_content_lines(
    this->extract_field(source, *fields.content_lines, CONTENT_LINES, type) );

  ordered_node source_location = this->extract_field( source,
    *fields.source_location, SOURCE_LOCATION, type );

  ordered_node extra = this->extract_field( source, *fields.extra, EXTRA,
    type );
  if ( extra.is_null() ) extra = ordered_node::mapping();
  else if ( !extra.is_mapping() ) {
    StructuralError err( "extra must resolve to a mapping, got "
      + kind_name(extra) );
    err.set_context( EXTRA, type );
    throw err;
  }

  std::vector< Node > children = this->convert_children( source,
    *fields.children, type );

  return Node( std::move(label), type, std::move(icon), content_lines,
    std::move(source_location), std::move(extra), std::move(children) );
}

inline tape::Node tape::Adapter::convert_tree(
  const ordered_node& source ) const
{
  std::optional< Node > root = this->convert( source );
  if ( !root ) {
    throw StructuralError( "root node was ignored; check that its type is"
      " not listed in ignore_types" );
  }
  return std::move( *root );
}
