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
#include <cstdint>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

#include "tape/errors.hh"
#include "tape/value.hh"

namespace tape {

  // Access steps produced by the path parser

  // Named field, e.g. "name" in "items.name"
  struct AttributeStep {
    std::string name;
    bool operator==( const AttributeStep& o ) const { return name == o.name; }
  };

  // Signed position, e.g. "[-1]"
  struct IndexStep {
    std::int64_t index;
    bool operator==( const IndexStep& o ) const { return index == o.index; }
  };

  // Bracketed key, e.g. "['key']" or the legacy unquoted "[key]"
  struct KeyStep {
    std::string key;
    bool operator==( const KeyStep& o ) const { return key == o.key; }
  };

  using PathStep = std::variant< AttributeStep, IndexStep, KeyStep >;
  using Path = std::vector< PathStep >;

namespace internal {

  inline constexpr char PATH_DELIMITER = '.';
  inline constexpr char OPEN_BRACKET = '[';
  inline constexpr char CLOSE_BRACKET = ']';

  inline bool is_identifier_start( char c ) {
    return std::isalpha( static_cast< unsigned char >(c) ) || c == '_';
  }

  inline bool is_identifier_char( char c ) {
    return std::isalnum( static_cast< unsigned char >(c) ) || c == '_';
  }

  inline bool is_path_space( char c ) {
    return c == ' ' || c == '\t' || c == '\n';
  }

  inline std::string describe_step( const PathStep& step ) {
    if ( const auto* a = std::get_if< AttributeStep >(&step) ) {
      return "attribute '" + a->name + '\'';
    }
    if ( const auto* i = std::get_if< IndexStep >(&step) ) {
      return "index " + std::to_string( i->index );
    }
    return "key '" + std::get< KeyStep >( step ).key + '\'';
  }

} // namespace tape::internal

  // Recursive-descent parser with one character of lookahead.
  //
  //   path       := accessor+ ('.' part)* | part ('.' part)*
  //   part       := identifier accessor*
  //   accessor   := '[' ws* (signed-int | quoted | bare) ws* ']'
  //   identifier := [A-Za-z_][A-Za-z0-9_]*
  class PathParser {
  public:
    explicit PathParser( const std::string& text ) : text_( text ) {}

    Path parse();

  private:
    void parse_part( Path& steps );
    PathStep parse_accessor();
    std::string parse_identifier();
    std::int64_t parse_number();
    std::string parse_quoted();
    std::string parse_bare();
    void skip_whitespace();
    void consume_close_bracket();

    inline bool at_end() const { return pos_ >= text_.size(); }
    inline char peek() const { return at_end() ? '\0' : text_[ pos_ ]; }

    // Human-readable description of the lookahead character
    std::string lookahead() const;

    [[noreturn]] void fail( const std::string& msg ) const {
      throw SyntaxError( msg, text_, pos_ );
    }

    std::string text_;
    std::size_t pos_ = 0;
  };

  inline Path parse_path( const std::string& text ) {
    return PathParser( text ).parse();
  }

  // Parsing is pure, so successful parses are memoized per thread keyed by
  // the literal expression text. Failures are never cached.
  inline const Path& parse_path_cached( const std::string& text ) {
    thread_local std::unordered_map< std::string, Path > cache;
    auto it = cache.find( text );
    if ( it != cache.end() ) return it->second;
    Path parsed = parse_path( text );
    return cache.emplace( text, std::move(parsed) ).first->second;
  }

  inline ordered_node evaluate_path( const ordered_node& value,
    const Path& path );

  inline ordered_node evaluate_path( const ordered_node& value,
    const std::string& text )
  {
    return evaluate_path( value, parse_path_cached(text) );
  }

  // PathParser member function definitions

  inline Path PathParser::parse() {
    bool blank = true;
    for ( char c : text_ ) {
      if ( !std::isspace(static_cast< unsigned char >(c)) ) {
        blank = false;
        break;
      }
    }
    if ( blank ) fail( "path expression cannot be empty" );

    Path steps;

    // Leading accessors address the value itself, e.g. "[0][1].name"
    if ( peek() == internal::OPEN_BRACKET ) {
      while ( peek() == internal::OPEN_BRACKET ) {
        steps.push_back( this->parse_accessor() );
      }
    }
    else {
      this->parse_part( steps );
    }

    while ( peek() == internal::PATH_DELIMITER ) {
      ++pos_;
      this->parse_part( steps );
    }

    if ( !at_end() ) fail( "unexpected character " + lookahead() );

    return steps;
  }

  inline void PathParser::parse_part( Path& steps ) {
    steps.push_back( AttributeStep{ this->parse_identifier() } );
    while ( peek() == internal::OPEN_BRACKET ) {
      steps.push_back( this->parse_accessor() );
    }
  }

  inline PathStep PathParser::parse_accessor() {
    ++pos_; // '['
    this->skip_whitespace();
    if ( at_end() ) fail( "unclosed bracket" );

    const char c = peek();
    if ( c == '-' || std::isdigit(static_cast< unsigned char >(c)) ) {
      const std::int64_t index = this->parse_number();
      this->skip_whitespace();
      this->consume_close_bracket();
      return IndexStep{ index };
    }

    if ( c == '"' || c == '\'' ) {
      std::string key = this->parse_quoted();
      this->skip_whitespace();
      this->consume_close_bracket();
      return KeyStep{ std::move(key) };
    }

    // Unquoted keys are kept for backward compatibility
    std::string key = this->parse_bare();
    this->skip_whitespace();
    this->consume_close_bracket();
    return KeyStep{ std::move(key) };
  }

  inline std::string PathParser::parse_identifier() {
    if ( !internal::is_identifier_start(peek()) ) {
      fail( "expected identifier, got " + lookahead() );
    }
    const std::size_t start = pos_;
    while ( !at_end() && internal::is_identifier_char(peek()) ) ++pos_;
    return text_.substr( start, pos_ - start );
  }

  inline std::int64_t PathParser::parse_number() {
    const std::size_t start = pos_;
    if ( peek() == '-' ) ++pos_;
    if ( !std::isdigit(static_cast< unsigned char >(peek())) ) {
      fail( "expected digit, got " + lookahead() );
    }
    while ( !at_end() && std::isdigit(static_cast< unsigned char >(peek())) ) {
      ++pos_;
    }

    std::int64_t value = 0;
    const char* first = text_.data() + start;
    const char* last = text_.data() + pos_;
    auto [ptr, ec] = std::from_chars( first, last, value );
    if ( ec != std::errc() || ptr != last ) {
      throw SyntaxError( "index '" + text_.substr(start, pos_ - start)
        + "' is out of range", text_, start );
    }
    return value;
  }

  inline std::string PathParser::parse_quoted() {
    const char quote = peek();
    const std::size_t open = pos_;
    ++pos_;
    const std::size_t start = pos_;
    while ( !at_end() && peek() != quote ) ++pos_;
    if ( at_end() ) {
      throw SyntaxError( "unclosed string", text_, open );
    }
    std::string value = text_.substr( start, pos_ - start );
    ++pos_; // closing quote
    return value;
  }

  inline std::string PathParser::parse_bare() {
    const std::size_t start = pos_;
    while ( !at_end() && peek() != internal::CLOSE_BRACKET
      && !internal::is_path_space(peek()) ) ++pos_;
    if ( pos_ == start ) fail( "empty key in bracket" );
    return text_.substr( start, pos_ - start );
  }

  inline void PathParser::skip_whitespace() {
    while ( !at_end() && internal::is_path_space(peek()) ) ++pos_;
  }

  inline void PathParser::consume_close_bracket() {
    if ( at_end() ) fail( "unclosed bracket" );
    if ( peek() != internal::CLOSE_BRACKET ) {
      fail( "expected ']', got " + lookahead() );
    }
    ++pos_;
  }

  inline std::string PathParser::lookahead() const {
    if ( at_end() ) return "end of input";
    return std::string( "'" ) + peek() + '\'';
  }

  // Path evaluation. Every missing field degrades to null so that fallback
  // chains keep working. The only hard failure is a key step applied to a
  // scalar that has no keyed access at all.
  inline ordered_node evaluate_path( const ordered_node& value,
    const Path& path )
  {
    const ordered_node* current = &value;

    // Holds values synthesized during the walk (characters of a string)
    ordered_node scratch;

    for ( std::size_t i = 0; i < path.size(); ++i ) {
      if ( current->is_null() ) return ordered_node();
      const PathStep& step = path[ i ];

      if ( const auto* attr = std::get_if< AttributeStep >(&step) ) {
        current = internal::find_field( *current, attr->name );
      }
      else if ( const auto* idx = std::get_if< IndexStep >(&step) ) {
        if ( current->is_sequence() ) {
          const auto size = static_cast< std::int64_t >( current->size() );
          const std::int64_t at = idx->index < 0
            ? size + idx->index : idx->index;
          current = ( at >= 0 && at < size )
            ? &current->at( static_cast< std::size_t >(at) ) : nullptr;
        }
        else if ( current->is_string() ) {
          const std::string s
            = internal::to_native_checked< std::string >( *current );
          const auto size
            = static_cast< std::int64_t >( internal::utf8_length(s) );
          const std::int64_t at = idx->index < 0
            ? size + idx->index : idx->index;
          if ( at >= 0 && at < size ) {
            scratch = internal::make_string(
              internal::utf8_at( s, static_cast< std::size_t >(at) ) );
            current = &scratch;
          }
          else {
            current = nullptr;
          }
        }
        else {
          current = nullptr;
        }
      }
      else {
        const std::string& key = std::get< KeyStep >( step ).key;
        if ( current->is_mapping() ) {
          current = internal::find_field( *current, key );
        }
        else if ( current->is_sequence() || current->is_string() ) {
          // Keyed access exists but not by string
          current = nullptr;
        }
        else {
          throw MissingCapability( key, internal::kind_name(*current), i );
        }
      }

      if ( !current ) return ordered_node();
    }
    return *current;
  }

} // namespace tape
