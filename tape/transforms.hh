// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// {fmt} formatting library
#include <fmt/format.h>

#include "tape/errors.hh"
#include "tape/value.hh"

namespace tape {

  // Built-in transformation names form a closed set, checked when a spec is
  // parsed rather than when it is applied
  enum class Builtin {
    Upper, Lower, Capitalize, Strip, Truncate, // text
    Abs, Round, Format, // numeric
    Length, Join, First, Last, // collection
    Str, Int, Float // conversion
  };

  // Parameters accepted by the built-ins. Each built-in reads only its own.
  struct TransformParams {
    std::int64_t max_length = 50;
    std::string suffix = "…";
    std::int64_t digits = 0;
    std::string format_spec;
    std::string separator;
  };

  struct BuiltinTransform {
    Builtin op;
    TransformParams params;

    // Authored parameters (everything except "name"), kept for serialization
    ordered_node authored = ordered_node::mapping();
  };

  // User-supplied transformation. Bypasses all kind checking.
  struct CustomTransform {
    std::function< ordered_node( const ordered_node& ) > fn;
    std::string name = "custom";
  };

  using TransformSpec = std::variant< BuiltinTransform, CustomTransform >;

namespace internal {

  inline const std::string TRANSFORM_NAME = "name";
  inline const std::string MAX_LENGTH = "max_length";
  inline const std::string SUFFIX = "suffix";
  inline const std::string DIGITS = "digits";
  inline const std::string FORMAT_SPEC = "format_spec";
  inline const std::string SEPARATOR = "separator";

  inline const std::vector< std::pair< std::string, Builtin > >&
    builtin_table()
  {
    static const std::vector< std::pair< std::string, Builtin > > table = {
      { "upper", Builtin::Upper },
      { "lower", Builtin::Lower },
      { "capitalize", Builtin::Capitalize },
      { "strip", Builtin::Strip },
      { "truncate", Builtin::Truncate },
      { "abs", Builtin::Abs },
      { "round", Builtin::Round },
      { "format", Builtin::Format },
      { "length", Builtin::Length },
      { "join", Builtin::Join },
      { "first", Builtin::First },
      { "last", Builtin::Last },
      { "str", Builtin::Str },
      { "int", Builtin::Int },
      { "float", Builtin::Float },
    };
    return table;
  }

  inline std::string builtin_names() {
    std::string out;
    for ( const auto& entry : builtin_table() ) {
      if ( !out.empty() ) out += ", ";
      out += entry.first;
    }
    return out;
  }

  inline std::optional< Builtin > builtin_from_name( const std::string& n ) {
    for ( const auto& entry : builtin_table() ) {
      if ( entry.first == n ) return entry.second;
    }
    return std::nullopt;
  }

  inline std::string builtin_name( Builtin op ) {
    for ( const auto& entry : builtin_table() ) {
      if ( entry.second == op ) return entry.first;
    }
    return "unknown";
  }

  inline std::int64_t int_param( const ordered_node& params,
    const std::string& key, const std::string& op, std::int64_t fallback )
  {
    if ( !params.contains(key) ) return fallback;
    const ordered_node& v = params.at( key );
    if ( !v.is_integer() ) {
      throw SpecError( "transform '" + op + "' parameter '" + key
        + "' must be an integer, got " + kind_name(v) );
    }
    return to_native_checked< std::int64_t >( v );
  }

  inline std::string string_param( const ordered_node& params,
    const std::string& key, const std::string& op,
    const std::string& fallback )
  {
    if ( !params.contains(key) ) return fallback;
    const ordered_node& v = params.at( key );
    if ( !v.is_string() ) {
      throw SpecError( "transform '" + op + "' parameter '" + key
        + "' must be a string, got " + kind_name(v) );
    }
    return to_native_checked< std::string >( v );
  }

  inline bool is_space( char c ) {
    return std::isspace( static_cast< unsigned char >(c) ) != 0;
  }

  inline std::string trim( const std::string& s ) {
    std::size_t b = 0, e = s.size();
    while ( b < e && is_space(s[b]) ) ++b;
    while ( e > b && is_space(s[e - 1]) ) --e;
    return s.substr( b, e - b );
  }

  inline const std::string& require_string( const ordered_node& v,
    const std::string& op, std::string& holder )
  {
    if ( !v.is_string() ) throw TypeMismatch( op, KIND_STR, kind_name(v) );
    holder = to_native_checked< std::string >( v );
    return holder;
  }

  inline void require_number( const ordered_node& v, const std::string& op ) {
    if ( !is_number(v) ) throw TypeMismatch( op, "numeric", kind_name(v) );
  }

  // Text transformations (ASCII case mapping)

  inline std::string text_upper( std::string s ) {
    for ( char& c : s ) c = static_cast< char >(
      std::toupper(static_cast< unsigned char >(c)) );
    return s;
  }

  inline std::string text_lower( std::string s ) {
    for ( char& c : s ) c = static_cast< char >(
      std::tolower(static_cast< unsigned char >(c)) );
    return s;
  }

  inline std::string text_capitalize( const std::string& s ) {
    std::string out = text_lower( s );
    if ( !out.empty() ) out[0] = static_cast< char >(
      std::toupper(static_cast< unsigned char >(out[0])) );
    return out;
  }

  // Shorten text to at most max_length code points, suffix included. When
  // the suffix alone does not fit, the suffix itself is cut.
  inline std::string truncate_text( const std::string& text,
    std::int64_t max_length, const std::string& suffix )
  {
    if ( max_length <= 0 ) return "";
    const auto limit = static_cast< std::size_t >( max_length );
    if ( utf8_length(text) <= limit ) return text;

    const std::size_t suffix_len = utf8_length( suffix );
    if ( suffix_len >= limit ) return utf8_prefix( suffix, limit );
    return utf8_prefix( text, limit - suffix_len ) + suffix;
  }

  inline ordered_node numeric_abs( const ordered_node& v ) {
    require_number( v, "abs" );
    if ( v.is_integer() ) {
      const auto i = to_native_checked< std::int64_t >( v );
      if ( i == std::numeric_limits< std::int64_t >::min() ) {
        throw TypeMismatch( "abs", "representable integer", KIND_INT,
          "absolute value overflows" );
      }
      return make_int( i < 0 ? -i : i );
    }
    return make_float( std::fabs(to_native_checked< double >(v)) );
  }

  inline std::int64_t pow10( std::int64_t exponent ) {
    std::int64_t r = 1;
    for ( std::int64_t i = 0; i < exponent && i < 18; ++i ) r *= 10;
    return r;
  }

  inline TypeMismatch round_overflow() {
    return TypeMismatch( "round", "representable integer", KIND_INT,
      "rounded value overflows" );
  }

  // Integers round half-to-even to a multiple of 10^-digits without going
  // through double, so every int64 stays exact
  inline std::int64_t round_integer( std::int64_t i, std::int64_t digits ) {
    using limits = std::numeric_limits< std::int64_t >;
    if ( digits < -18 ) {
      // 10^19 is past the int64 range; only values nearer 0 round to it
      const std::int64_t half = 5000000000000000000;
      if ( digits == -19 && (i > half || i < -half) ) throw round_overflow();
      return 0;
    }
    const std::int64_t scale = pow10( -digits );
    std::int64_t q = i / scale;
    const std::int64_t r = i % scale;
    const std::int64_t below = r < 0 ? -r : r;
    const std::int64_t above = scale - below;
    if ( below > above || (below == above && q % 2 != 0) ) {
      q += i < 0 ? -1 : 1;
    }
    if ( q > limits::max() / scale || q < limits::min() / scale ) {
      throw round_overflow();
    }
    return q * scale;
  }

  // Half-to-even rounding, as the default floating point environment does
  inline ordered_node numeric_round( const ordered_node& v,
    std::int64_t digits )
  {
    require_number( v, "round" );
    if ( v.is_integer() ) {
      if ( digits >= 0 ) return v;
      return make_int( round_integer(
        to_native_checked< std::int64_t >(v), digits) );
    }
    const double d = to_native_checked< double >( v );
    if ( !std::isfinite(d) ) return v;
    const double scale = std::pow( 10.0, static_cast< double >(digits) );
    if ( scale == 0.0 ) return make_float( std::copysign(0.0, d) );
    const double scaled = d * scale;
    if ( !std::isfinite(scaled) ) return v;
    return make_float( std::nearbyint(scaled) / scale );
  }

  // Format any scalar with a Python-style format spec, e.g. ".2f" or ">8"
  inline ordered_node format_value( const ordered_node& v,
    const std::string& format_spec )
  {
    const std::string pattern = "{:" + format_spec + "}";
    try {
      if ( v.is_integer() ) {
        return make_string( fmt::format(fmt::runtime(pattern),
          to_native_checked< std::int64_t >(v)) );
      }
      if ( v.is_float_number() ) {
        return make_string( fmt::format(fmt::runtime(pattern),
          to_native_checked< double >(v)) );
      }
      if ( v.is_boolean() ) {
        return make_string( fmt::format(fmt::runtime(pattern),
          to_native_checked< bool >(v)) );
      }
      return make_string( fmt::format(fmt::runtime(pattern),
        to_display_string(v)) );
    }
    catch ( const fmt::format_error& ex ) {
      throw TypeMismatch( "format", "value compatible with format spec '"
        + format_spec + "'", kind_name(v), ex.what() );
    }
  }

  inline ordered_node collection_length( const ordered_node& v ) {
    if ( v.is_string() ) {
      return make_int( static_cast< std::int64_t >(
        utf8_length(to_native_checked< std::string >(v))) );
    }
    if ( v.is_sequence() || v.is_mapping() ) {
      return make_int( static_cast< std::int64_t >(v.size()) );
    }
    throw TypeMismatch( "length", "str, list or dict", kind_name(v) );
  }

  inline ordered_node collection_join( const ordered_node& v,
    const std::string& separator )
  {
    std::string out;
    bool first = true;
    auto append = [&]( const std::string& piece ) {
      if ( !first ) out += separator;
      out += piece;
      first = false;
    };

    if ( v.is_sequence() ) {
      for ( const auto& item : v ) append( to_display_string(item) );
      return make_string( out );
    }
    if ( v.is_mapping() ) {
      for ( const auto& [mk, mv] : v.map_items() ) append( key_string(mk) );
      return make_string( out );
    }
    // Strings are iterable in spirit but joining their characters is never
    // what a definition author means
    throw TypeMismatch( "join", "list or dict", kind_name(v) );
  }

  // first/last: indexed access for sequences and strings, insertion order
  // for mapping keys
  inline ordered_node collection_end( const ordered_node& v, bool last ) {
    const std::string op = last ? "last" : "first";
    if ( v.is_sequence() ) {
      if ( v.size() == 0 ) return ordered_node();
      return v.at( last ? v.size() - 1 : 0 );
    }
    if ( v.is_string() ) {
      const std::string s = to_native_checked< std::string >( v );
      const std::size_t n = utf8_length( s );
      if ( n == 0 ) return ordered_node();
      return make_string( utf8_at(s, last ? n - 1 : 0) );
    }
    if ( v.is_mapping() ) {
      ordered_node found;
      for ( const auto& [mk, mv] : v.map_items() ) {
        found = mk;
        if ( !last ) break;
      }
      return found;
    }
    throw TypeMismatch( op, "str, list or dict", kind_name(v) );
  }

  inline ordered_node convert_to_int( const ordered_node& v ) {
    if ( v.is_integer() ) return v;
    if ( v.is_boolean() ) return make_int( to_native_checked< bool >(v) );
    if ( v.is_float_number() ) {
      const double d = to_native_checked< double >( v );
      if ( !std::isfinite(d) || std::fabs(d) >= 9.2e18 ) {
        throw TypeMismatch( "int", "finite number", KIND_FLOAT,
          "cannot convert " + to_display_string(v) + " to an integer" );
      }
      return make_int( static_cast< std::int64_t >(std::trunc(d)) );
    }
    if ( v.is_string() ) {
      std::string text = trim( to_native_checked< std::string >(v) );
      if ( !text.empty() && text[0] == '+' ) text.erase( 0, 1 );
      std::int64_t out = 0;
      const char* first = text.data();
      const char* last = text.data() + text.size();
      auto [ptr, ec] = std::from_chars( first, last, out );
      if ( text.empty() || ec != std::errc() || ptr != last ) {
        throw TypeMismatch( "int", "integer literal", KIND_STR,
          "invalid literal '" + to_native_checked< std::string >(v) + "'" );
      }
      return make_int( out );
    }
    throw TypeMismatch( "int", "str, int, float or bool", kind_name(v) );
  }

  inline ordered_node convert_to_float( const ordered_node& v ) {
    if ( is_number(v) ) return make_float( as_double(v) );
    if ( v.is_boolean() ) {
      return make_float( to_native_checked< bool >(v) ? 1.0 : 0.0 );
    }
    if ( v.is_string() ) {
      const std::string text = trim( to_native_checked< std::string >(v) );
      char* end = nullptr;
      const double d = std::strtod( text.c_str(), &end );
      if ( text.empty() || end != text.c_str() + text.size() ) {
        throw TypeMismatch( "float", "numeric literal", KIND_STR,
          "invalid literal '" + to_native_checked< std::string >(v) + "'" );
      }
      return make_float( d );
    }
    throw TypeMismatch( "float", "str, int, float or bool", kind_name(v) );
  }

  inline bool is_text_transform( Builtin op ) {
    return op == Builtin::Upper || op == Builtin::Lower
      || op == Builtin::Capitalize || op == Builtin::Strip;
  }

  inline ordered_node apply_builtin( const ordered_node& v,
    const BuiltinTransform& t )
  {
    // Text transforms lift over a list of strings item by item
    if ( v.is_sequence() && is_text_transform(t.op) ) {
      node_list out;
      out.reserve( v.size() );
      for ( const auto& item : v ) out.push_back( apply_builtin(item, t) );
      return make_sequence( out );
    }

    std::string s;
    switch ( t.op ) {
      case Builtin::Upper:
        return make_string( text_upper(require_string(v, "upper", s)) );
      case Builtin::Lower:
        return make_string( text_lower(require_string(v, "lower", s)) );
      case Builtin::Capitalize:
        return make_string(
          text_capitalize(require_string(v, "capitalize", s)) );
      case Builtin::Strip:
        return make_string( trim(require_string(v, "strip", s)) );
      case Builtin::Truncate:
        return make_string( truncate_text(to_display_string(v),
          t.params.max_length, t.params.suffix) );
      case Builtin::Abs:
        return numeric_abs( v );
      case Builtin::Round:
        return numeric_round( v, t.params.digits );
      case Builtin::Format:
        return format_value( v, t.params.format_spec );
      case Builtin::Length:
        return collection_length( v );
      case Builtin::Join:
        return collection_join( v, t.params.separator );
      case Builtin::First:
        return collection_end( v, false );
      case Builtin::Last:
        return collection_end( v, true );
      case Builtin::Str:
        return make_string( to_display_string(v) );
      case Builtin::Int:
        return convert_to_int( v );
      case Builtin::Float:
        return convert_to_float( v );
    }
    throw SpecError( "unhandled transform '" + builtin_name(t.op) + "'" );
  }

} // namespace tape::internal

  // Parse a transform spec: a bare built-in name, or a mapping holding
  // "name" plus that transform's parameters
  inline TransformSpec parse_transform( const ordered_node& spec ) {
    using namespace internal;

    std::string name;
    ordered_node authored = ordered_node::mapping();
    if ( spec.is_string() ) {
      name = to_native_checked< std::string >( spec );
    }
    else if ( spec.is_mapping() ) {
      if ( !spec.contains(TRANSFORM_NAME)
        || !spec.at(TRANSFORM_NAME).is_string() )
      {
        throw SpecError( "transform mapping must include a string '"
          + TRANSFORM_NAME + "' field" );
      }
      name = to_native_checked< std::string >( spec.at(TRANSFORM_NAME) );
      for ( const auto& [mk, mv] : spec.map_items() ) {
        const std::string k = key_string( mk );
        if ( k == TRANSFORM_NAME ) continue;
        authored[ k ] = mv;
      }
    }
    else {
      throw SpecError( "transform must be a name or a mapping, got "
        + kind_name(spec) );
    }

    const std::optional< Builtin > op = builtin_from_name( name );
    if ( !op ) {
      throw SpecError( "unknown transformation '" + name + "'",
        "available: " + builtin_names() );
    }

    BuiltinTransform t{ *op, TransformParams(), authored };
    t.params.max_length = int_param( authored, MAX_LENGTH, name,
      t.params.max_length );
    t.params.suffix = string_param( authored, SUFFIX, name, t.params.suffix );
    t.params.digits = int_param( authored, DIGITS, name, t.params.digits );
    t.params.format_spec = string_param( authored, FORMAT_SPEC, name,
      t.params.format_spec );
    t.params.separator = string_param( authored, SEPARATOR, name,
      t.params.separator );
    return t;
  }

  inline ordered_node transform_to_node( const TransformSpec& spec ) {
    const auto* t = std::get_if< BuiltinTransform >( &spec );
    if ( !t ) {
      throw SpecError( "custom transform '"
        + std::get< CustomTransform >( spec ).name
        + "' has no serialized form" );
    }
    const std::string name = internal::builtin_name( t->op );
    if ( t->authored.size() == 0 ) return internal::make_string( name );

    ordered_node out = ordered_node::mapping();
    out[ internal::TRANSFORM_NAME ] = internal::make_string( name );
    for ( const auto& [mk, mv] : t->authored.map_items() ) {
      out[ internal::key_string(mk) ] = mv;
    }
    return out;
  }

  // Apply one transformation. Null input is passed through untouched, so a
  // missing value never reaches a transform.
  inline ordered_node apply_transform( const ordered_node& value,
    const TransformSpec& spec )
  {
    if ( value.is_null() ) return value;
    if ( const auto* custom = std::get_if< CustomTransform >(&spec) ) {
      return custom->fn( value );
    }
    return internal::apply_builtin( value,
      std::get< BuiltinTransform >( spec ) );
  }

} // namespace tape
