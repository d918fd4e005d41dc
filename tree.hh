//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common.hh"
#include "expression.hh"
#include "sample.hh"

namespace yoke {

  // A tagged scalar after resolution: one compiled expression bound to the
  // provider of its selector. Every evaluate() pulls a fresh Sample; nothing
  // is cached and nothing is mutated, so concurrent calls are as safe as
  // the provider is.
  class DeferredExpression {
  public:
    inline DeferredExpression( std::string selector, Expression expression,
      Provider provider )
      : selector_( std::move(selector) ), expression_( std::move(expression) ),
      provider_( std::move(provider) ) {}

    Value evaluate() const;

    inline const std::string& selector() const noexcept { return selector_; }
    inline const Expression& expression() const noexcept {
      return expression_;
    }

    // Authored form for diagnostics, e.g. !7 'sin(axis[0])'
    std::string describe() const;

  private:
    std::string selector_;
    Expression expression_;
    Provider provider_;
  };

  // Resolved document tree. Mapping, sequence and scalar nodes mirror the
  // parsed YAML; tagged scalars have been replaced by deferred expressions.
  class Node {
  public:
    // Entries keep their source order
    using Mapping = std::vector< std::pair< std::string, Node > >;
    using Sequence = std::vector< Node >;

    enum class Kind { Mapping, Sequence, Scalar, Deferred };

    // Null scalar
    inline Node() : value_( std::in_place_type< ordered_node > ) {}
    inline explicit Node( Mapping items )
      : value_( std::in_place_type< Mapping >, std::move(items) ) {}
    inline explicit Node( Sequence elements )
      : value_( std::in_place_type< Sequence >, std::move(elements) ) {}
    // Throws std::invalid_argument if the node is a mapping or sequence
    explicit Node( ordered_node scalar );
    inline explicit Node( DeferredExpression expression )
      : value_( std::in_place_type< DeferredExpression >,
        std::move(expression) ) {}

    inline Kind kind() const noexcept {
      return static_cast< Kind >( value_.index() );
    }
    inline bool is_mapping() const noexcept { return kind() == Kind::Mapping; }
    inline bool is_sequence() const noexcept {
      return kind() == Kind::Sequence;
    }
    inline bool is_scalar() const noexcept { return kind() == Kind::Scalar; }
    inline bool is_deferred() const noexcept {
      return kind() == Kind::Deferred;
    }

    // Number of entries of a mapping or sequence
    std::size_t size() const;

    // False for anything but a mapping
    bool contains( const std::string& key ) const;

    // Throw std::out_of_range for a missing key/index and
    // std::logic_error for the wrong node kind
    const Node& at( const std::string& key ) const;
    const Node& at( std::size_t index ) const;

    const Mapping& items() const;
    const Sequence& elements() const;
    const ordered_node& scalar() const;
    const DeferredExpression& deferred() const;

    // True if this node or any descendant is deferred
    bool has_deferred() const;

    // Evaluate every deferred node (each with its own fresh Sample) and
    // return the equivalent plain YAML, key order preserved
    ordered_node materialize() const;

  private:
    // Alternative order must match Kind
    std::variant< Mapping, Sequence, ordered_node, DeferredExpression > value_;

    [[noreturn]] void throw_wrong_kind( const char* wanted ) const;
  };

namespace internal {

  inline const char* kind_name( Node::Kind k ) {
    switch ( k ) {
      case Node::Kind::Mapping: return "mapping";
      case Node::Kind::Sequence: return "sequence";
      case Node::Kind::Scalar: return "scalar";
      case Node::Kind::Deferred: return "deferred expression";
    }
    return "?";
  }

  inline ordered_node value_to_node( const Value& v ) {
    if ( const bool* b = std::get_if< bool >( &v ) ) {
      return make_node_from( *b );
    }
    return make_node_from( std::get< double >( v ) );
  }

} // namespace yoke::internal

} // namespace yoke

// DeferredExpression member function definitions

inline yoke::Value yoke::DeferredExpression::evaluate() const {
  const Sample sample = provider_();
  return expression_.evaluate( sample );
}

inline std::string yoke::DeferredExpression::describe() const {
  std::string quoted;
  quoted.reserve( expression_.text().size() + 2 );
  for ( char c : expression_.text() ) {
    // YAML single-quoted style escapes a quote by doubling it
    if ( c == '\'' ) quoted += '\'';
    quoted += c;
  }
  return "!" + selector_ + " '" + quoted + "'";
}

// Node member function definitions

inline yoke::Node::Node( ordered_node scalar )
  : value_( std::in_place_type< ordered_node >, std::move(scalar) )
{
  const ordered_node& n = std::get< ordered_node >( value_ );
  if ( n.is_mapping() || n.is_sequence() ) {
    throw std::invalid_argument( "Node: expected a YAML scalar, got a "
      + std::string( n.is_mapping() ? "mapping" : "sequence" ) );
  }
}

[[noreturn]] inline void yoke::Node::throw_wrong_kind(
  const char* wanted ) const
{
  throw std::logic_error( std::string("Node: expected a ") + wanted
    + ", got a " + internal::kind_name( kind() ) );
}

inline std::size_t yoke::Node::size() const {
  if ( is_mapping() ) return items().size();
  if ( is_sequence() ) return elements().size();
  throw_wrong_kind( "mapping or sequence" );
}

inline bool yoke::Node::contains( const std::string& key ) const {
  if ( !is_mapping() ) return false;
  for ( const auto& [k, v] : items() ) {
    if ( k == key ) return true;
  }
  return false;
}

inline const yoke::Node& yoke::Node::at( const std::string& key ) const {
  for ( const auto& [k, v] : items() ) {
    if ( k == key ) return v;
  }
  throw std::out_of_range( "Node: no key '" + key + "' in mapping" );
}

inline const yoke::Node& yoke::Node::at( std::size_t index ) const {
  const Sequence& seq = elements();
  if ( index >= seq.size() ) {
    throw std::out_of_range( "Node: index " + std::to_string( index )
      + " out of range for sequence of size "
      + std::to_string( seq.size() ) );
  }
  return seq[ index ];
}

inline const yoke::Node::Mapping& yoke::Node::items() const {
  if ( const Mapping* m = std::get_if< Mapping >( &value_ ) ) return *m;
  throw_wrong_kind( "mapping" );
}

inline const yoke::Node::Sequence& yoke::Node::elements() const {
  if ( const Sequence* s = std::get_if< Sequence >( &value_ ) ) return *s;
  throw_wrong_kind( "sequence" );
}

inline const yoke::ordered_node& yoke::Node::scalar() const {
  if ( const ordered_node* n = std::get_if< ordered_node >( &value_ ) ) {
    return *n;
  }
  throw_wrong_kind( "scalar" );
}

inline const yoke::DeferredExpression& yoke::Node::deferred() const {
  if ( const DeferredExpression* d
    = std::get_if< DeferredExpression >( &value_ ) )
  {
    return *d;
  }
  throw_wrong_kind( "deferred expression" );
}

inline bool yoke::Node::has_deferred() const {
  switch ( kind() ) {
    case Kind::Deferred: return true;
    case Kind::Scalar: return false;
    case Kind::Mapping:
      for ( const auto& [k, v] : items() ) {
        if ( v.has_deferred() ) return true;
      }
      return false;
    case Kind::Sequence:
      for ( const Node& el : elements() ) {
        if ( el.has_deferred() ) return true;
      }
      return false;
  }
  return false;
}

inline yoke::ordered_node yoke::Node::materialize() const {
  switch ( kind() ) {
    case Kind::Mapping: {
      ordered_node out = ordered_node::mapping();
      for ( const auto& [k, v] : items() ) {
        out[ k ] = v.materialize();
      }
      return out;
    }
    case Kind::Sequence: {
      std::vector< ordered_node > out;
      out.reserve( elements().size() );
      for ( const Node& el : elements() ) {
        out.push_back( el.materialize() );
      }
      return internal::make_node_from( out );
    }
    case Kind::Scalar:
      return scalar();
    case Kind::Deferred:
      return internal::value_to_node( deferred().evaluate() );
  }
  return ordered_node();
}
