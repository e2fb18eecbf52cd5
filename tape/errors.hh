// ╺┳╸┏━┓┏━┓┏━╸
//  ┃ ┣━┫┣━┛┣╸
//  ╹ ╹ ╹╹  ┗━╸
//  Tree Adaptation via Path Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 the tape authors
#pragma once

// Standard library includes
#include <cstddef>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>

namespace tape {

  // Base class for every hard failure raised by the engine. The adapter
  // attaches the field and node type being converted exactly once, so the
  // innermost node that failed is the one reported.
  class Error : public std::runtime_error {
  public:
    explicit Error( const std::string& msg )
      : std::runtime_error( msg ), message_( msg ), full_( msg ) {}

    const char* what() const noexcept override { return full_.c_str(); }

    // Message without conversion context
    const std::string& message() const { return message_; }

    bool has_context() const { return !field_.empty(); }
    const std::string& field() const { return field_; }
    const std::optional< std::string >& node_type() const {
      return node_type_;
    }

    // Compose "field 'label' [type special]: message"
    void set_context( const std::string& field,
      const std::optional< std::string >& node_type )
    {
      if ( this->has_context() || field.empty() ) return;
      field_ = field;
      node_type_ = node_type;

      std::ostringstream oss;
      oss << "field '" << field_ << '\'';
      if ( node_type_ ) oss << " [type " << *node_type_ << ']';
      oss << ": " << message_;
      full_ = oss.str();
    }

  private:
    std::string message_;
    std::string full_;
    std::string field_;
    std::optional< std::string > node_type_;
  };

  // Malformed path expression
  class SyntaxError : public Error {
  public:
    SyntaxError( const std::string& msg, const std::string& text,
      std::size_t position )
      : Error( compose(msg, text, position) ), text_( text ),
      position_( position ), reason_( msg ) {}

    const std::string& text() const { return text_; }
    std::size_t position() const { return position_; }
    const std::string& reason() const { return reason_; }

  private:
    static std::string compose( const std::string& msg,
      const std::string& text, std::size_t position )
    {
      std::ostringstream oss;
      oss << "Invalid path expression '" << text << "' at position "
        << position << ": " << msg;
      return oss.str();
    }

    std::string text_;
    std::size_t position_;
    std::string reason_;
  };

  // A keyed access was attempted on a value that supports no keyed access
  // at all. A key that is merely absent is not an error.
  class MissingCapability : public Error {
  public:
    MissingCapability( const std::string& key, const std::string& kind,
      std::size_t step_index )
      : Error( "step " + std::to_string(step_index) + ": cannot access key '"
        + key + "' on a value of kind " + kind ),
      key_( key ), kind_( kind ), step_index_( step_index ) {}

    const std::string& key() const { return key_; }
    const std::string& kind() const { return kind_; }
    std::size_t step_index() const { return step_index_; }

  private:
    std::string key_;
    std::string kind_;
    std::size_t step_index_;
  };

  // A transform or filter operator received a value of the wrong kind
  class TypeMismatch : public Error {
  public:
    TypeMismatch( const std::string& operation, const std::string& expected,
      const std::string& actual, const std::string& detail = "" )
      : Error( "'" + operation + "' requires " + expected + " input, got "
        + actual + ( detail.empty() ? "" : " (" + detail + ")" ) ),
      operation_( operation ), expected_( expected ), actual_( actual ) {}

    const std::string& operation() const { return operation_; }
    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

  private:
    std::string operation_;
    std::string expected_;
    std::string actual_;
  };

  // Malformed declarative configuration
  class SpecError : public Error {
  public:
    explicit SpecError( const std::string& msg,
      const std::optional< std::string >& hint = std::nullopt )
      : Error( hint && !hint->empty() ? msg + " (" + *hint + ')' : msg ) {}
  };

  // The shape of an extracted value does not fit where it is used
  class StructuralError : public Error {
  public:
    explicit StructuralError( const std::string& msg ) : Error( msg ) {}
  };

} // namespace tape
