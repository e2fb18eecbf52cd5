// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <unordered_set>
#include <utility>
#include <variant>

// spdlog logging library
#include <spdlog/spdlog.h>

#include "tape/errors.hh"
#include "tape/filters.hh"
#include "tape/mapping.hh"
#include "tape/path.hh"
#include "tape/transforms.hh"
#include "tape/value.hh"

namespace tape {

  // Constant value written directly in a definition
  struct Literal {
    ordered_node value;
  };

  // Back-compatible bare path string, e.g. "name" or "items[0].title"
  struct SimplePath {
    std::string text;
    Path path;
  };

  // Extraction computed by user code
  struct Callable {
    std::function< ordered_node( const ordered_node& ) > fn;
  };

  struct PathRef {
    std::string text;
    Path path;
  };

  // The full pipeline. Stages run in a fixed order:
  //   path -> fallback -> default -> transform -> filter -> map
  struct Structured {
    std::optional< PathRef > path;
    std::optional< PathRef > fallback;
    std::optional< ordered_node > default_value;
    std::optional< TransformSpec > transform;
    std::optional< Predicate > filter;
    std::optional< MapSpec > map;
  };

  using ExtractionSpec = std::variant< Literal, SimplePath, Callable,
    Structured >;

namespace internal {

  inline const std::string PATH = "path";
  inline const std::string FALLBACK = "fallback";
  inline const std::string DEFAULT = "default";
  inline const std::string TRANSFORM = "transform";
  inline const std::string FILTER = "filter";
  inline const std::string MAP = "map";

  inline const std::unordered_set< std::string >& pipeline_keys() {
    static const std::unordered_set< std::string > keys = {
      PATH, FALLBACK, DEFAULT, TRANSFORM, FILTER, MAP
    };
    return keys;
  }

  inline bool is_structured_spec( const ordered_node& spec ) {
    if ( !spec.is_mapping() ) return false;
    for ( const auto& [mk, mv] : spec.map_items() ) {
      if ( pipeline_keys().count(key_string(mk)) ) return true;
    }
    return false;
  }

  inline PathRef parse_path_ref( const ordered_node& spec,
    const std::string& key )
  {
    const ordered_node& v = spec.at( key );
    if ( !v.is_string() ) {
      throw SpecError( "'" + key + "' must be a path string, got "
        + kind_name(v) );
    }
    const std::string text = to_native_checked< std::string >( v );
    return PathRef{ text, parse_path_cached( text ) };
  }

  inline Structured parse_structured( const ordered_node& spec ) {
    for ( const auto& [mk, mv] : spec.map_items() ) {
      const std::string k = key_string( mk );
      if ( !pipeline_keys().count(k) ) {
        throw SpecError( "unknown extraction key '" + k + "'",
          "expected one of path, fallback, default, transform, filter, map" );
      }
    }

    Structured out;
    if ( spec.contains(PATH) ) out.path = parse_path_ref( spec, PATH );
    if ( spec.contains(FALLBACK) ) {
      out.fallback = parse_path_ref( spec, FALLBACK );
    }
    if ( spec.contains(DEFAULT) ) out.default_value = spec.at( DEFAULT );
    if ( spec.contains(TRANSFORM) ) {
      out.transform = parse_transform( spec.at(TRANSFORM) );
    }
    if ( spec.contains(FILTER) ) {
      out.filter = parse_predicate( spec.at(FILTER) );
    }
    if ( spec.contains(MAP) ) out.map = parse_map_spec( spec.at(MAP) );
    return out;
  }

  inline ordered_node run_pipeline( const ordered_node& source,
    const Structured& spec )
  {
    // 1) Primary path
    ordered_node value;
    if ( spec.path ) value = evaluate_path( source, spec.path->path );

    // 2) Fallback path
    if ( value.is_null() && spec.fallback ) {
      spdlog::trace( "path '{}' missing, trying fallback '{}'",
        spec.path ? spec.path->text : "", spec.fallback->text );
      value = evaluate_path( source, spec.fallback->path );
    }

    // 3) Default literal
    if ( value.is_null() && spec.default_value ) {
      spdlog::trace( "no value found, using default" );
      value = *spec.default_value;
    }

    // 4) Transform (null is passed through)
    if ( spec.transform ) value = apply_transform( value, *spec.transform );

    // 5) Filter, sequences only
    if ( spec.filter ) {
      if ( value.is_sequence() ) {
        value = filter_collection( value, *spec.filter );
      }
      else if ( !value.is_null() ) {
        spdlog::debug( "filter skipped: value is {}, not a list",
          kind_name(value) );
      }
    }

    // 6) Map, sequences only
    if ( spec.map ) {
      if ( value.is_sequence() ) {
        value = map_collection( value, *spec.map );
      }
      else if ( !value.is_null() ) {
        spdlog::debug( "map skipped: value is {}, not a list",
          kind_name(value) );
      }
    }
    return value;
  }

} // namespace tape::internal

  // Build an extraction spec from its serialized form. A string that is not
  // a valid path is kept as a literal for backward compatibility.
  inline ExtractionSpec parse_extraction_spec( const ordered_node& spec ) {
    if ( spec.is_string() ) {
      const std::string text = internal::to_native_checked< std::string >(
        spec );
      try {
        return SimplePath{ text, parse_path_cached( text ) };
      }
      catch ( const SyntaxError& ex ) {
        spdlog::trace( "'{}' is not a path ({}), treating it as a literal",
          text, ex.reason() );
        return Literal{ spec };
      }
    }
    if ( internal::is_structured_spec(spec) ) {
      return internal::parse_structured( spec );
    }
    return Literal{ spec };
  }

  inline ExtractionSpec literal_spec( const ordered_node& value ) {
    return Literal{ value };
  }

  inline ExtractionSpec callable_spec(
    std::function< ordered_node( const ordered_node& ) > fn )
  {
    return Callable{ std::move(fn) };
  }

  inline ordered_node spec_to_node( const ExtractionSpec& spec ) {
    using namespace internal;
    if ( const auto* lit = std::get_if< Literal >(&spec) ) return lit->value;
    if ( const auto* simple = std::get_if< SimplePath >(&spec) ) {
      return make_string( simple->text );
    }
    if ( std::holds_alternative< Callable >(spec) ) {
      throw SpecError( "callable extraction has no serialized form" );
    }

    const Structured& s = std::get< Structured >( spec );
    ordered_node out = ordered_node::mapping();
    if ( s.path ) out[ PATH ] = make_string( s.path->text );
    if ( s.fallback ) out[ FALLBACK ] = make_string( s.fallback->text );
    if ( s.default_value ) out[ DEFAULT ] = *s.default_value;
    if ( s.transform ) out[ TRANSFORM ] = transform_to_node( *s.transform );
    if ( s.filter ) out[ FILTER ] = predicate_to_node( *s.filter );
    if ( s.map ) out[ MAP ] = map_spec_to_node( *s.map );
    return out;
  }

  // Extract one value from a source node. A null result means "no value".
  inline ordered_node extract( const ordered_node& source,
    const ExtractionSpec& spec )
  {
    return std::visit( [&]( const auto& s ) -> ordered_node {
      using T = std::decay_t< decltype(s) >;
      if constexpr ( std::is_same_v< T, Literal > ) {
        return s.value;
      }
      else if constexpr ( std::is_same_v< T, SimplePath > ) {
        return evaluate_path( source, s.path );
      }
      else if constexpr ( std::is_same_v< T, Callable > ) {
        return s.fn( source );
      }
      else {
        return internal::run_pipeline( source, s );
      }
    }, spec );
  }

} // namespace tape
