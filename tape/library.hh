// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "tape/definition.hh"
#include "tape/errors.hh"

namespace tape {

namespace internal {

  // Name of the built-in that is just Definition::defaults()
  inline const std::string DEFAULT_FORMAT = "3viz";

  // Universal syntax tree: every node has a type, leaves carry a value
  inline constexpr const char* UNIST_DEFINITION = R"(
label:
  path: value
  fallback: type
  transform:
    name: truncate
    max_length: 60
type: type
children: children
source_location: position.start.line
extra:
  path: data
  default: {}
)";

  // Markdown syntax tree, a unist dialect
  inline constexpr const char* MDAST_DEFINITION = R"(
label:
  path: value
  fallback: type
  transform:
    name: truncate
    max_length: 60
type: type
children: children
source_location: position.start.line
icons:
  root: "⧉"
  heading: "⊤"
  paragraph: "¶"
  blockquote: "❝"
  list: "☰"
  listItem: "•"
  code: "𝒱"
  inlineCode: "ƒ"
  text: "◦"
  emphasis: "𝐼"
  strong: "𝐁"
  link: "↗"
  image: "▣"
  thematicBreak: "―"
  break: "↵"
type_overrides:
  root:
    label:
      default: Document
  heading:
    label:
      path: children[0].value
      fallback: type
      transform:
        name: truncate
        max_length: 60
    extra:
      path: data
      default: {}
  link:
    label:
      path: url
      fallback: title
  image:
    label:
      path: alt
      fallback: url
  code:
    label:
      path: lang
      default: code
  list:
    label:
      path: children
      transform: length
      default: 0
ignore_types:
  - html
)";

} // namespace tape::internal

  // Registry of the definitions shipped with the library, plus any
  // registered by the application at runtime
  class DefinitionLibrary {
  public:
    static const DefinitionLibrary& instance();
    static DefinitionLibrary& mutable_instance();

    bool has( const std::string& name ) const;

    // Sorted list of available names
    std::vector< std::string > names() const;

    // Throws SpecError listing the known names when the name is unknown
    Definition get( const std::string& name ) const;

    // Adds a named definition, replacing a built-in or earlier registration
    // of the same name
    void register_definition( const std::string& name,
      Definition definition );

  private:
    DefinitionLibrary();

    // Serialized form of each built-in, empty for the defaults
    std::map< std::string, std::string > sources_;
    std::map< std::string, Definition > registered_;
    mutable std::mutex mutex_;
  };

  inline DefinitionLibrary::DefinitionLibrary() {
    sources_[ internal::DEFAULT_FORMAT ] = "";
    sources_[ "unist" ] = internal::UNIST_DEFINITION;
    sources_[ "mdast" ] = internal::MDAST_DEFINITION;
  }

  inline DefinitionLibrary& DefinitionLibrary::mutable_instance() {
    static DefinitionLibrary library;
    return library;
  }

  inline const DefinitionLibrary& DefinitionLibrary::instance() {
    return mutable_instance();
  }

  inline bool DefinitionLibrary::has( const std::string& name ) const {
    std::lock_guard< std::mutex > lock( mutex_ );
    return registered_.count( name ) > 0 || sources_.count( name ) > 0;
  }

  inline std::vector< std::string > DefinitionLibrary::names() const {
    std::lock_guard< std::mutex > lock( mutex_ );
    std::set< std::string > unique;
    for ( const auto& entry : sources_ ) unique.insert( entry.first );
    for ( const auto& entry : registered_ ) unique.insert( entry.first );
    return std::vector< std::string >( unique.begin(), unique.end() );
  }

  inline Definition DefinitionLibrary::get( const std::string& name ) const {
    std::optional< std::string > source;
    {
      std::lock_guard< std::mutex > lock( mutex_ );
      auto reg = registered_.find( name );
      if ( reg != registered_.end() ) return reg->second;
      auto it = sources_.find( name );
      if ( it != sources_.end() ) source = it->second;
    }
    if ( !source ) {
      std::string available;
      for ( const auto& n : this->names() ) {
        if ( !available.empty() ) available += ", ";
        available += n;
      }
      throw SpecError( "unknown format '" + name + "'",
        "available formats: " + available );
    }
    if ( source->empty() ) return Definition::defaults();
    return Definition::from_yaml( *source );
  }

  inline void DefinitionLibrary::register_definition( const std::string& name,
    Definition definition )
  {
    if ( name.empty() ) {
      throw SpecError( "a registered definition needs a non-empty name" );
    }
    spdlog::debug( "registering definition '{}'", name );
    std::lock_guard< std::mutex > lock( mutex_ );
    registered_.insert_or_assign( name, std::move(definition) );
  }

  // A built-in name, or else the path of a YAML/JSON definition file
  inline Definition load_definition( const std::string& name_or_path ) {
    const DefinitionLibrary& library = DefinitionLibrary::instance();
    if ( library.has(name_or_path) ) return library.get( name_or_path );
    return Definition::from_file( name_or_path );
  }

} // namespace tape
