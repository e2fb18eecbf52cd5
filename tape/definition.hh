// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <map>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// POSIX shell-style pattern matching
#include <fnmatch.h>

#include "tape/document.hh"
#include "tape/errors.hh"
#include "tape/extraction.hh"
#include "tape/value.hh"

namespace tape {

  // Selects children among the fields of a node by their own type instead of
  // by a path. Patterns use shell wildcards ('*', '?', '[...]').
  struct TypeFilter {
    std::vector< std::string > include = { "*" };
    std::vector< std::string > exclude;

    bool matches( const std::string& node_type ) const;
  };

  using ChildrenSelector = std::variant< ExtractionSpec, TypeFilter >;

  // The extraction rules for one node. A Definition holds a complete set; a
  // type override holds only the fields it replaces.
  struct FieldSet {
    std::optional< ExtractionSpec > label;
    std::optional< ExtractionSpec > type;
    std::optional< ChildrenSelector > children;
    std::optional< ExtractionSpec > icon;
    std::optional< ExtractionSpec > content_lines;
    std::optional< ExtractionSpec > source_location;
    std::optional< ExtractionSpec > extra;

    // Shallow, per-field overlay: fields absent from the overlay keep this
    // set's value
    FieldSet overlaid_with( const FieldSet& overlay ) const;
  };

namespace internal {

  inline const std::string LABEL = "label";
  inline const std::string TYPE = "type";
  inline const std::string CHILDREN = "children";
  inline const std::string ICON = "icon";
  inline const std::string CONTENT_LINES = "content_lines";
  inline const std::string SOURCE_LOCATION = "source_location";
  inline const std::string EXTRA = "extra";
  inline const std::string ICONS = "icons";
  inline const std::string TYPE_OVERRIDES = "type_overrides";
  inline const std::string IGNORE_TYPES = "ignore_types";
  inline const std::string INCLUDE = "include";
  inline const std::string EXCLUDE = "exclude";
  inline const std::string UNKNOWN_TYPE = "unknown";
  inline const std::string FALLBACK_ICON = "?";

  // Baseline icons, merged under whatever a definition supplies
  inline const std::vector< std::pair< std::string, std::string > >&
    baseline_icons()
  {
    static const std::vector< std::pair< std::string, std::string > > icons = {
      // Document structure
      { "document", "⧉" },
      { "session", "§" },
      { "heading", "⊤" },
      { "paragraph", "¶" },
      { "list", "☰" },
      { "listItem", "•" },
      { "verbatim", "𝒱" },
      { "definition", "≔" },
      { "text", "◦" },
      { "textLine", "↵" },
      { "emphasis", "𝐼" },
      { "strong", "𝐁" },
      { "inlineCode", "ƒ" },
      { "contentContainer", "⊡" },
      // Data types (for generic JSON/dict structures)
      { "dict", "{}" },
      { "array", "[]" },
      { "str", "\"" },
      { "int", "#" },
      { "float", "#" },
      { "bool", "?" },
      { "NoneType", "∅" },
      // Fallback
      { UNKNOWN_TYPE, FALLBACK_ICON },
    };
    return icons;
  }

  inline std::vector< std::string > parse_pattern_list(
    const ordered_node& node, const std::string& key )
  {
    std::vector< std::string > out;
    if ( node.is_string() ) {
      out.push_back( to_native_checked< std::string >(node) );
      return out;
    }
    if ( !node.is_sequence() ) {
      throw SpecError( "children '" + key + "' must be a list of patterns,"
        " got " + kind_name(node) );
    }
    for ( const auto& el : node ) {
      if ( !el.is_string() ) {
        throw SpecError( "children '" + key + "' patterns must be strings,"
          " got " + kind_name(el) );
      }
      out.push_back( to_native_checked< std::string >(el) );
    }
    return out;
  }

  inline ordered_node string_list_node( const std::vector< std::string >& v )
  {
    node_list out;
    for ( const auto& s : v ) out.push_back( make_string(s) );
    return make_sequence( out );
  }

  // {include: [...], exclude: [...]} selects children by type; anything else
  // is an ordinary extraction spec
  inline ChildrenSelector parse_children( const ordered_node& spec ) {
    if ( spec.is_mapping() && !is_structured_spec(spec)
      && ( spec.contains(INCLUDE) || spec.contains(EXCLUDE) ) )
    {
      TypeFilter filter;
      for ( const auto& [mk, mv] : spec.map_items() ) {
        const std::string k = key_string( mk );
        if ( k == INCLUDE ) filter.include = parse_pattern_list( mv, k );
        else if ( k == EXCLUDE ) filter.exclude = parse_pattern_list( mv, k );
        else {
          throw SpecError( "unknown children selector key '" + k + "'",
            "expected include and/or exclude" );
        }
      }
      return filter;
    }
    return parse_extraction_spec( spec );
  }

  inline ordered_node children_to_node( const ChildrenSelector& selector ) {
    if ( const auto* spec = std::get_if< ExtractionSpec >(&selector) ) {
      return spec_to_node( *spec );
    }
    const TypeFilter& filter = std::get< TypeFilter >( selector );
    ordered_node out = ordered_node::mapping();
    out[ INCLUDE ] = string_list_node( filter.include );
    out[ EXCLUDE ] = string_list_node( filter.exclude );
    return out;
  }

  // Read whichever of the seven extraction fields are present. Returns false
  // if the key is not a field name.
  inline bool parse_field( FieldSet& fields, const std::string& key,
    const ordered_node& value )
  {
    if ( key == LABEL ) fields.label = parse_extraction_spec( value );
    else if ( key == TYPE ) fields.type = parse_extraction_spec( value );
    else if ( key == CHILDREN ) fields.children = parse_children( value );
    else if ( key == ICON ) fields.icon = parse_extraction_spec( value );
    else if ( key == CONTENT_LINES ) {
      fields.content_lines = parse_extraction_spec( value );
    }
    else if ( key == SOURCE_LOCATION ) {
      fields.source_location = parse_extraction_spec( value );
    }
    else if ( key == EXTRA ) fields.extra = parse_extraction_spec( value );
    else return false;
    return true;
  }

  inline void fields_to_node( const FieldSet& fields, ordered_node& out ) {
    if ( fields.label ) out[ LABEL ] = spec_to_node( *fields.label );
    if ( fields.type ) out[ TYPE ] = spec_to_node( *fields.type );
    if ( fields.children ) {
      out[ CHILDREN ] = children_to_node( *fields.children );
    }
    if ( fields.icon ) out[ ICON ] = spec_to_node( *fields.icon );
    if ( fields.content_lines ) {
      out[ CONTENT_LINES ] = spec_to_node( *fields.content_lines );
    }
    if ( fields.source_location ) {
      out[ SOURCE_LOCATION ] = spec_to_node( *fields.source_location );
    }
    if ( fields.extra ) out[ EXTRA ] = spec_to_node( *fields.extra );
  }

} // namespace tape::internal

  // Declarative description of how to turn source nodes into Nodes. A
  // Definition is never modified once built; type overrides are resolved
  // into a fresh field set for every node.
  class Definition {
  public:
    using IconTable = std::map< std::string, std::string >;
    using OverrideTable = std::map< std::string, FieldSet >;

    Definition( FieldSet fields, IconTable icons, OverrideTable overrides,
      std::set< std::string > ignore_types );

    // label: "label", type: "type", children: "children", content_lines: 1,
    // extra: {}, baseline icons
    static Definition defaults();

    // Keys absent from the serialized form keep their default; icons are
    // merged over the baseline table
    static Definition from_node( const ordered_node& node );
    static Definition from_yaml( const std::string& text );
    static Definition from_file( const std::string& path );

    ordered_node to_node() const;
    std::string to_yaml() const;

    const FieldSet& fields() const { return fields_; }
    const IconTable& icons() const { return icons_; }
    const OverrideTable& type_overrides() const { return overrides_; }
    const std::set< std::string >& ignore_types() const {
      return ignore_types_;
    }

    bool ignores( const std::string& node_type ) const {
      return ignore_types_.count( node_type ) > 0;
    }

    const FieldSet* override_for( const std::string& node_type ) const;

    // Base fields overlaid with the override for this type, if any
    FieldSet effective_fields(
      const std::optional< std::string >& node_type ) const;

    // Table entry for the type, else the "unknown" entry, else "?"
    std::string resolve_icon(
      const std::optional< std::string >& node_type ) const;

    bool operator==( const Definition& other ) const;
    bool operator!=( const Definition& other ) const {
      return !( *this == other );
    }

  private:
    FieldSet fields_;
    IconTable icons_;
    OverrideTable overrides_;
    std::set< std::string > ignore_types_;
  };

  // TypeFilter / FieldSet member function definitions

  inline bool TypeFilter::matches( const std::string& node_type ) const {
    if ( node_type.empty() ) return false;
    auto any_match = [&]( const std::vector< std::string >& patterns ) {
      for ( const auto& p : patterns ) {
        if ( ::fnmatch(p.c_str(), node_type.c_str(), 0) == 0 ) return true;
      }
      return false;
    };
    return any_match( include ) && !any_match( exclude );
  }

  inline FieldSet FieldSet::overlaid_with( const FieldSet& overlay ) const {
    FieldSet out = *this;
    if ( overlay.label ) out.label = overlay.label;
    if ( overlay.type ) out.type = overlay.type;
    if ( overlay.children ) out.children = overlay.children;
    if ( overlay.icon ) out.icon = overlay.icon;
    if ( overlay.content_lines ) out.content_lines = overlay.content_lines;
    if ( overlay.source_location ) {
      out.source_location = overlay.source_location;
    }
    if ( overlay.extra ) out.extra = overlay.extra;
    return out;
  }

  // Definition member function definitions

  inline Definition::Definition( FieldSet fields, IconTable icons,
    OverrideTable overrides, std::set< std::string > ignore_types )
    : fields_( std::move(fields) ), icons_( std::move(icons) ),
    overrides_( std::move(overrides) ),
    ignore_types_( std::move(ignore_types) )
  {
    const auto require = [&]( bool present, const std::string& name ) {
      if ( !present ) {
        throw SpecError( "definition is missing the '" + name + "' field" );
      }
    };
    require( fields_.label.has_value(), internal::LABEL );
    require( fields_.type.has_value(), internal::TYPE );
    require( fields_.children.has_value(), internal::CHILDREN );
    require( fields_.icon.has_value(), internal::ICON );
    require( fields_.content_lines.has_value(), internal::CONTENT_LINES );
    require( fields_.source_location.has_value(),
      internal::SOURCE_LOCATION );
    require( fields_.extra.has_value(), internal::EXTRA );
  }

  inline Definition Definition::defaults() {
    using namespace internal;
    FieldSet fields;
    fields.label = parse_extraction_spec( make_string(LABEL) );
    fields.type = parse_extraction_spec( make_string(TYPE) );
    fields.children = parse_children( make_string(CHILDREN) );
    fields.icon = literal_spec( ordered_node() );
    fields.content_lines = literal_spec( make_int(1) );
    fields.source_location = literal_spec( ordered_node() );
    fields.extra = literal_spec( ordered_node::mapping() );

    IconTable icons;
    for ( const auto& entry : baseline_icons() ) icons.insert( entry );
    return Definition( std::move(fields), std::move(icons), {}, {} );
  }

  inline Definition Definition::from_node( const ordered_node& node ) {
    using namespace internal;
    if ( !node.is_mapping() ) {
      throw SpecError( "definition must be a mapping, got "
        + kind_name(node) );
    }

    const Definition base = Definition::defaults();
    FieldSet fields = base.fields_;
    IconTable icons = base.icons_;
    OverrideTable overrides;
    std::set< std::string > ignore_types;

    for ( const auto& [mk, mv] : node.map_items() ) {
      const std::string key = key_string( mk );
      if ( parse_field(fields, key, mv) ) continue;

      if ( key == ICONS ) {
        if ( mv.is_null() ) continue;
        if ( !mv.is_mapping() ) {
          throw SpecError( "'" + ICONS + "' must map types to icons, got "
            + kind_name(mv) );
        }
        for ( const auto& [ik, iv] : mv.map_items() ) {
          icons[ key_string(ik) ] = to_display_string( iv );
        }
      }
      else if ( key == TYPE_OVERRIDES ) {
        if ( mv.is_null() ) continue;
        if ( !mv.is_mapping() ) {
          throw SpecError( "'" + TYPE_OVERRIDES + "' must be a mapping, got "
            + kind_name(mv) );
        }
        for ( const auto& [tk, tv] : mv.map_items() ) {
          const std::string node_type = key_string( tk );
          if ( !tv.is_mapping() ) {
            throw SpecError( "override for type '" + node_type
              + "' must be a mapping, got " + kind_name(tv) );
          }
          FieldSet partial;
          for ( const auto& [fk, fv] : tv.map_items() ) {
            const std::string field = key_string( fk );
            if ( !parse_field(partial, field, fv) ) {
              throw SpecError( "unknown field '" + field
                + "' in override for type '" + node_type + "'" );
            }
          }
          overrides[ node_type ] = std::move( partial );
        }
      }
      else if ( key == IGNORE_TYPES ) {
        if ( mv.is_null() ) continue;
        if ( !mv.is_sequence() ) {
          throw SpecError( "'" + IGNORE_TYPES + "' must be a list, got "
            + kind_name(mv) );
        }
        for ( const auto& t : mv ) ignore_types.insert( to_display_string(t) );
      }
      else {
        throw SpecError( "unknown definition key '" + key + "'" );
      }
    }

    return Definition( std::move(fields), std::move(icons),
      std::move(overrides), std::move(ignore_types) );
  }

  inline Definition Definition::from_yaml( const std::string& text ) {
    return Definition::from_node( parse_document(text, "<definition>") );
  }

  inline Definition Definition::from_file( const std::string& path ) {
    return Definition::from_node( load_document_file(path) );
  }

  inline ordered_node Definition::to_node() const {
    using namespace internal;
    ordered_node out = ordered_node::mapping();
    fields_to_node( fields_, out );

    ordered_node icons = ordered_node::mapping();
    for ( const auto& [t, icon] : icons_ ) icons[ t ] = make_string( icon );
    out[ ICONS ] = icons;

    ordered_node overrides = ordered_node::mapping();
    for ( const auto& [t, partial] : overrides_ ) {
      ordered_node entry = ordered_node::mapping();
      fields_to_node( partial, entry );
      overrides[ t ] = entry;
    }
    out[ TYPE_OVERRIDES ] = overrides;

    node_list ignored;
    for ( const auto& t : ignore_types_ ) ignored.push_back( make_string(t) );
    out[ IGNORE_TYPES ] = make_sequence( ignored );
    return out;
  }

  inline std::string Definition::to_yaml() const {
    return ordered_node::serialize( this->to_node() );
  }

  inline const FieldSet* Definition::override_for(
    const std::string& node_type ) const
  {
    auto it = overrides_.find( node_type );
    return it == overrides_.end() ? nullptr : &it->second;
  }

  inline FieldSet Definition::effective_fields(
    const std::optional< std::string >& node_type ) const
  {
    if ( !node_type ) return fields_;
    const FieldSet* partial = this->override_for( *node_type );
    return partial ? fields_.overlaid_with( *partial ) : fields_;
  }

  inline std::string Definition::resolve_icon(
    const std::optional< std::string >& node_type ) const
  {
    if ( node_type ) {
      auto it = icons_.find( *node_type );
      if ( it != icons_.end() ) return it->second;
    }
    auto unknown = icons_.find( internal::UNKNOWN_TYPE );
    return unknown != icons_.end() ? unknown->second
      : internal::FALLBACK_ICON;
  }

  // Two definitions are equal when their serialized forms are
  inline bool Definition::operator==( const Definition& other ) const {
    return internal::nodes_equal( this->to_node(), other.to_node() );
  }

} // namespace tape
