// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <algorithm>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "tape/errors.hh"
#include "tape/path.hh"
#include "tape/value.hh"

namespace tape {

  enum class FilterOp {
    In, NotIn, // membership
    StartsWith, EndsWith, Contains, Matches, // string
    Eq, Ne, Gt, Gte, Lt, Lte, // comparison
    IsNone, IsNotNone, Type // discriminant
  };

  struct OperatorTest {
    FilterOp op;
    ordered_node operand;

    // Compiled once for Matches
    std::shared_ptr< const std::regex > pattern;
  };

  // A single field compared either against a literal (exact equality) or
  // against a set of operator tests that must all hold
  struct FieldCondition {
    std::string field;
    Path path;
    std::optional< ordered_node > literal;
    std::vector< OperatorTest > tests;

    // Set when the field is named like an operator, e.g. {startswith: "H"}.
    // Items that are not mappings have no fields, so the operator is
    // applied to the item itself instead.
    std::optional< OperatorTest > item_test;
  };

  struct Predicate;

  struct AllOf {
    std::vector< Predicate > terms;
  };

  struct AnyOf {
    std::vector< Predicate > terms;
  };

  struct Negation {
    std::shared_ptr< const Predicate > term;
  };

  struct Predicate {
    std::variant< FieldCondition, AllOf, AnyOf, Negation > expr;

    // Authored form, kept for serialization
    ordered_node source;
  };

namespace internal {

  inline const std::string AND = "and";
  inline const std::string OR = "or";
  inline const std::string NOT = "not";

  inline const std::vector< std::pair< std::string, FilterOp > >&
    filter_op_table()
  {
    static const std::vector< std::pair< std::string, FilterOp > > table = {
      { "in", FilterOp::In },
      { "not_in", FilterOp::NotIn },
      { "startswith", FilterOp::StartsWith },
      { "endswith", FilterOp::EndsWith },
      { "contains", FilterOp::Contains },
      { "matches", FilterOp::Matches },
      { "eq", FilterOp::Eq },
      { "ne", FilterOp::Ne },
      { "gt", FilterOp::Gt },
      { "gte", FilterOp::Gte },
      { "lt", FilterOp::Lt },
      { "lte", FilterOp::Lte },
      { "is_none", FilterOp::IsNone },
      { "is_not_none", FilterOp::IsNotNone },
      { "type", FilterOp::Type },
    };
    return table;
  }

  inline std::string filter_op_name( FilterOp op ) {
    for ( const auto& entry : filter_op_table() ) {
      if ( entry.second == op ) return entry.first;
    }
    return "unknown";
  }

  inline std::optional< FilterOp > filter_op_from_name(
    const std::string& name )
  {
    for ( const auto& entry : filter_op_table() ) {
      if ( entry.first == name ) return entry.second;
    }
    return std::nullopt;
  }

  inline std::string filter_op_names() {
    std::string out;
    for ( const auto& entry : filter_op_table() ) {
      if ( !out.empty() ) out += ", ";
      out += entry.first;
    }
    return out;
  }

  inline bool operand_fits( FilterOp op, const ordered_node& operand ) {
    switch ( op ) {
      case FilterOp::StartsWith:
      case FilterOp::EndsWith:
      case FilterOp::Contains:
      case FilterOp::Matches:
      case FilterOp::Type:
        return operand.is_string();
      default:
        return true;
    }
  }

  inline OperatorTest parse_operator_test( const std::string& field,
    const std::string& name, const ordered_node& operand )
  {
    const auto& table = filter_op_table();
    auto it = std::find_if( table.begin(), table.end(),
      [&]( const auto& entry ) { return entry.first == name; } );
    if ( it == table.end() ) {
      throw SpecError( "unknown filter operator '" + name + "' on field '"
        + field + "'", "available: " + filter_op_names() );
    }

    OperatorTest test{ it->second, operand, nullptr };
    if ( !operand_fits(test.op, operand) ) {
      throw SpecError( "filter operator '" + name + "' on field '"
        + field + "' requires a string operand, got "
        + kind_name(operand) );
    }

    if ( test.op == FilterOp::Matches ) {
      try {
        test.pattern = std::make_shared< const std::regex >(
          to_native_checked< std::string >(operand) );
      }
      catch ( const std::regex_error& ex ) {
        throw SpecError( "invalid regular expression '"
          + to_native_checked< std::string >( operand ) + "' on field '"
          + field + "'", ex.what() );
      }
    }
    return test;
  }

  // Ordering for gt/gte/lt/lte. Only like kinds compare; anything else is a
  // hard failure rather than an implicit coercion.
  inline int compare_ordered( const ordered_node& a, const ordered_node& b,
    FilterOp op )
  {
    if ( is_number(a) && is_number(b) ) {
      if ( a.is_integer() && b.is_integer() ) {
        const auto x = to_native_checked< std::int64_t >( a );
        const auto y = to_native_checked< std::int64_t >( b );
        return ( x < y ) ? -1 : ( x > y ? 1 : 0 );
      }
      const double x = as_double( a );
      const double y = as_double( b );
      return ( x < y ) ? -1 : ( x > y ? 1 : 0 );
    }
    if ( a.is_string() && b.is_string() ) {
      return to_native_checked< std::string >( a ).compare(
        to_native_checked< std::string >(b) );
    }
    if ( a.is_boolean() && b.is_boolean() ) {
      return static_cast< int >( to_native_checked< bool >(a) )
        - static_cast< int >( to_native_checked< bool >(b) );
    }
    throw TypeMismatch( filter_op_name(op), "value comparable with "
      + kind_name(b), kind_name(a) );
  }

  inline bool membership( const ordered_node& value,
    const ordered_node& container, FilterOp op )
  {
    if ( container.is_sequence() ) {
      for ( const auto& item : container ) {
        if ( nodes_equal(value, item) ) return true;
      }
      return false;
    }
    if ( container.is_mapping() ) {
      if ( !value.is_string() ) return false;
      return container.contains( to_native_checked< std::string >(value) );
    }
    if ( container.is_string() ) {
      if ( !value.is_string() ) {
        throw TypeMismatch( filter_op_name(op), KIND_STR, kind_name(value),
          "substring membership in a string operand" );
      }
      return to_native_checked< std::string >( container ).find(
        to_native_checked< std::string >(value) ) != std::string::npos;
    }
    throw TypeMismatch( filter_op_name(op), "list, dict or str operand",
      kind_name(container) );
  }

  inline bool starts_with( const std::string& s, const std::string& p ) {
    return s.size() >= p.size() && s.compare( 0, p.size(), p ) == 0;
  }

  inline bool ends_with( const std::string& s, const std::string& p ) {
    return s.size() >= p.size()
      && s.compare( s.size() - p.size(), p.size(), p ) == 0;
  }

  inline bool evaluate_operator( const ordered_node& value,
    const OperatorTest& test )
  {
    const ordered_node& operand = test.operand;
    switch ( test.op ) {
      case FilterOp::In:
        return membership( value, operand, test.op );
      case FilterOp::NotIn:
        return !membership( value, operand, test.op );
      // String tests read null as the empty string
      case FilterOp::StartsWith:
        return starts_with( to_display_string(value),
          to_native_checked< std::string >(operand) );
      case FilterOp::EndsWith:
        return ends_with( to_display_string(value),
          to_native_checked< std::string >(operand) );
      case FilterOp::Contains:
        return to_display_string( value ).find(
          to_native_checked< std::string >(operand) ) != std::string::npos;
      case FilterOp::Matches:
        return std::regex_search( to_display_string(value), *test.pattern );
      case FilterOp::Eq:
        return nodes_equal( value, operand );
      case FilterOp::Ne:
        return !nodes_equal( value, operand );
      case FilterOp::Gt:
        return compare_ordered( value, operand, test.op ) > 0;
      case FilterOp::Gte:
        return compare_ordered( value, operand, test.op ) >= 0;
      case FilterOp::Lt:
        return compare_ordered( value, operand, test.op ) < 0;
      case FilterOp::Lte:
        return compare_ordered( value, operand, test.op ) <= 0;
      case FilterOp::IsNone:
      case FilterOp::IsNotNone: {
        // A false operand inverts the test, e.g. {is_none: false}
        bool want = !operand.is_boolean()
          || to_native_checked< bool >( operand );
        if ( test.op == FilterOp::IsNotNone ) want = !want;
        return value.is_null() == want;
      }
      case FilterOp::Type:
        return kind_name( value )
          == to_native_checked< std::string >( operand );
    }
    return false;
  }

  inline bool evaluate_predicate( const ordered_node& item,
    const Predicate& predicate );

  inline bool evaluate_field_condition( const ordered_node& item,
    const FieldCondition& cond )
  {
    if ( cond.item_test && !item.is_mapping() ) {
      return evaluate_operator( item, *cond.item_test );
    }

    const ordered_node value = evaluate_path( item, cond.path );
    if ( cond.literal ) return nodes_equal( value, *cond.literal );

    // All operators must pass; fail fast on the first that does not
    for ( const auto& test : cond.tests ) {
      if ( !evaluate_operator(value, test) ) return false;
    }
    return true;
  }

  inline bool evaluate_predicate( const ordered_node& item,
    const Predicate& predicate )
  {
    if ( const auto* cond = std::get_if< FieldCondition >(&predicate.expr) ) {
      return evaluate_field_condition( item, *cond );
    }
    if ( const auto* all = std::get_if< AllOf >(&predicate.expr) ) {
      for ( const auto& term : all->terms ) {
        if ( !evaluate_predicate(item, term) ) return false;
      }
      return true;
    }
    if ( const auto* any = std::get_if< AnyOf >(&predicate.expr) ) {
      for ( const auto& term : any->terms ) {
        if ( evaluate_predicate(item, term) ) return true;
      }
      return false;
    }
    return !evaluate_predicate( item,
      *std::get< Negation >( predicate.expr ).term );
  }

} // namespace tape::internal

  // Parse a predicate mapping. "and"/"or" hold sequences of predicates,
  // "not" holds one predicate and every other key is a field path. All
  // terms of one mapping are AND-ed in authored order.
  inline Predicate parse_predicate( const ordered_node& spec ) {
    using namespace internal;

    if ( !spec.is_mapping() ) {
      throw SpecError( "filter predicate must be a mapping, got "
        + kind_name(spec) );
    }

    auto parse_terms = [&]( const std::string& key ) {
      const ordered_node& list = spec.at( key );
      if ( !list.is_sequence() ) {
        throw SpecError( "filter '" + key + "' requires a list of predicates,"
          " got " + kind_name(list) );
      }
      std::vector< Predicate > terms;
      terms.reserve( list.size() );
      for ( const auto& sub : list ) terms.push_back( parse_predicate(sub) );
      return terms;
    };

    std::vector< Predicate > terms;
    for ( const auto& [mk, mv] : spec.map_items() ) {
      const std::string key = key_string( mk );
      if ( key == AND ) {
        terms.push_back( Predicate{ AllOf{ parse_terms(key) }, mv } );
      }
      else if ( key == OR ) {
        terms.push_back( Predicate{ AnyOf{ parse_terms(key) }, mv } );
      }
      else if ( key == NOT ) {
        terms.push_back( Predicate{ Negation{
          std::make_shared< const Predicate >( parse_predicate(mv) ) }, mv } );
      }
      else {
        FieldCondition cond{ key, parse_path( key ), std::nullopt, {},
          std::nullopt };
        if ( mv.is_mapping() ) {
          for ( const auto& [ok, ov] : mv.map_items() ) {
            cond.tests.push_back(
              parse_operator_test( key, key_string(ok), ov ) );
          }
        }
        else {
          cond.literal = mv;
          const auto op = filter_op_from_name( key );
          if ( op && operand_fits(*op, mv) ) {
            cond.item_test = parse_operator_test( key, key, mv );
          }
        }
        ordered_node single = ordered_node::mapping();
        single[ key ] = mv;
        terms.push_back( Predicate{ std::move(cond), single } );
      }
    }

    if ( terms.size() == 1 ) {
      Predicate only = std::move( terms.front() );
      only.source = spec;
      return only;
    }
    return Predicate{ AllOf{ std::move(terms) }, spec };
  }

  inline ordered_node predicate_to_node( const Predicate& predicate ) {
    return predicate.source;
  }

  // Keep the items of a sequence that satisfy the predicate. The input is
  // never modified; a new sequence is returned in the original order.
  inline ordered_node filter_collection( const ordered_node& collection,
    const Predicate& predicate )
  {
    if ( !collection.is_sequence() ) {
      throw TypeMismatch( "filter", internal::KIND_LIST,
        internal::kind_name(collection) );
    }
    node_list kept;
    for ( const auto& item : collection ) {
      if ( internal::evaluate_predicate(item, predicate) ) {
        kept.push_back( item );
      }
    }
    return internal::make_sequence( kept );
  }

} // namespace tape
