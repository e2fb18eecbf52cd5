// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "tape/value.hh"

namespace tape {

  // One node of the adapted output tree. A Node owns its children by value
  // and cannot be changed after construction.
  class Node {
  public:
    Node( std::string label, std::optional< std::string > type,
      std::optional< std::string > icon, std::int64_t content_lines,
      ordered_node source_location, ordered_node extra,
      std::vector< Node > children )
      : label_( std::move(label) ), type_( std::move(type) ),
      icon_( std::move(icon) ),
      content_lines_( content_lines < 0 ? 0 : content_lines ),
      source_location_( std::move(source_location) ),
      extra_( std::move(extra) ), children_( std::move(children) )
    {
      if ( extra_.is_null() ) extra_ = ordered_node::mapping();
    }

    const std::string& label() const { return label_; }
    const std::optional< std::string >& type() const { return type_; }
    const std::optional< std::string >& icon() const { return icon_; }
    std::int64_t content_lines() const { return content_lines_; }

    // Null when the source did not provide a location
    const ordered_node& source_location() const { return source_location_; }
    const ordered_node& extra() const { return extra_; }
    const std::vector< Node >& children() const { return children_; }

    // Number of nodes in this subtree, including this one
    std::size_t tree_size() const {
      std::size_t n = 1;
      for ( const auto& c : children_ ) n += c.tree_size();
      return n;
    }

    ordered_node to_yaml_node() const {
      using namespace internal;
      ordered_node out = ordered_node::mapping();
      out[ "label" ] = make_string( label_ );
      if ( type_ ) out[ "type" ] = make_string( *type_ );
      if ( icon_ ) out[ "icon" ] = make_string( *icon_ );
      out[ "content_lines" ] = make_int( content_lines_ );
      if ( !source_location_.is_null() ) {
        out[ "source_location" ] = source_location_;
      }
      if ( extra_.is_mapping() && extra_.size() > 0 ) {
        out[ "extra" ] = extra_;
      }
      if ( !children_.empty() ) {
        node_list kids;
        kids.reserve( children_.size() );
        for ( const auto& c : children_ ) kids.push_back( c.to_yaml_node() );
        out[ "children" ] = make_sequence( kids );
      }
      return out;
    }

    std::string to_yaml() const {
      return ordered_node::serialize( this->to_yaml_node() );
    }

  private:
    std::string label_;
    std::optional< std::string > type_;
    std::optional< std::string > icon_;
    std::int64_t content_lines_;
    ordered_node source_location_;
    ordered_node extra_;
    std::vector< Node > children_;
  };

} // namespace tape
