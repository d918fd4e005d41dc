//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "common.hh"
#include "errors.hh"
#include "expression.hh"
#include "sample.hh"
#include "tree.hh"

namespace yoke {

  class Resolver {
  public:
    // The lookup is consulted once per tagged scalar during resolve(...),
    // never while evaluating. Throws std::invalid_argument if it is empty.
    explicit Resolver( ProviderLookup lookup );

    // Parse YAML text and replace every selector-tagged scalar with a
    // deferred expression bound to its provider
    Node resolve( std::istream& in );
    Node resolve( const std::string& text );

  private:

    // Wraps internal state refreshed upon each call to resolve(...)
    struct ResolveSession {
      // Tracks the path using sequence-element indexing,
      // e.g., ["root", "axes[0]", "gain"]
      std::vector< std::string > path_stack;
    };

    ProviderLookup lookup_;
    ResolveSession session_;

    // Recursive walk over the parsed document
    Node resolve_node( const ordered_node& node );

    // Shape check, compile and bind for a node carrying a selector tag
    Node bind_tagged( const ordered_node& node, const std::string& tag,
      const std::string& selector );

    // "root.a.b[0].c [!tag]" for diagnostics
    std::string location( const std::string& tag ) const;

    [[noreturn]] void throw_structural_at( const std::string& tag,
      const std::string& msg ) const;

  }; // class Resolver

namespace internal {

  // Selector named by a tag, or nothing if the tag is not a selector tag.
  // Only primary-handle local tags qualify: "!7" -> "7". Secondary tags
  // ("!!str"), the non-specific tag "!", named handles ("!h!x") and
  // verbatim global tags ("!<tag:...>") are left to the YAML library.
  inline std::optional< std::string > selector_from_tag(
    const std::string& tag )
  {
    std::string t = tag;

    // Verbatim form: !<...>
    if ( t.size() >= 3 && t.compare(0, 2, "!<") == 0 && t.back() == '>' ) {
      t = t.substr( 2, t.size() - 3 );
    }

    if ( t.size() < 2 || t[0] != '!' ) return std::nullopt;
    const std::string suffix = t.substr( 1 );
    if ( suffix.find('!') != std::string::npos ) return std::nullopt;
    return suffix;
  }

  // Expression source of a tagged scalar. Plain scalars that YAML typed as
  // numbers or booleans are compiled from their textual form.
  inline std::string scalar_source_text( const ordered_node& n ) {
    return to_string_any( n );
  }

} // namespace yoke::internal

} // namespace yoke

// Resolver member function definitions

inline yoke::Resolver::Resolver( ProviderLookup lookup )
  : lookup_( std::move(lookup) ), session_()
{
  if ( !lookup_ ) {
    throw std::invalid_argument( "Resolver requires a provider lookup" );
  }
}

// Read from an input stream until end-of-file, then apply full processing
// on the resulting string
inline yoke::Node yoke::Resolver::resolve( std::istream& in ) {
  std::ostringstream ss;
  ss << in.rdbuf();
  return this->resolve( ss.str() );
}

inline yoke::Node yoke::Resolver::resolve( const std::string& text ) {
  // Rebuild default session state for this call
  session_ = ResolveSession();
  session_.path_stack.push_back( internal::DOC_ROOT );

  const ordered_node dom = ordered_node::deserialize( text );
  return this->resolve_node( dom );
}

inline std::string yoke::Resolver::location( const std::string& tag ) const {
  std::string s = internal::join_path( session_.path_stack );
  if ( !tag.empty() ) s += " [" + tag + ']';
  return s;
}

[[noreturn]] inline void yoke::Resolver::throw_structural_at(
  const std::string& tag, const std::string& msg ) const
{
  throw StructuralError( location(tag) + ": " + msg );
}

inline yoke::Node yoke::Resolver::resolve_node( const ordered_node& node ) {
  if ( node.has_tag_name() ) {
    const std::string& tag = node.get_tag_name();
    if ( auto selector = internal::selector_from_tag(tag) ) {
      return this->bind_tagged( node, tag, *selector );
    }
  }

  if ( node.is_mapping() ) {
    Node::Mapping items;
    items.reserve( node.size() );
    for ( const auto& [mk, mv] : node.map_items() ) {
      const std::string key = internal::to_string_any( mk );
      session_.path_stack.push_back( key );

      // An expression cannot stand in for a key: keys are not re-evaluated
      if ( mk.has_tag_name()
        && internal::selector_from_tag( mk.get_tag_name() ) )
      {
        throw_structural_at( mk.get_tag_name(), "expression tags are not "
          "allowed on mapping keys" );
      }

      items.emplace_back( key, this->resolve_node(mv) );
      session_.path_stack.pop_back();
    }
    return Node( std::move(items) );
  }

  if ( node.is_sequence() ) {
    Node::Sequence elements;
    elements.reserve( node.size() );
    const std::string base = session_.path_stack.back();
    for ( std::size_t i = 0; i < node.size(); ++i ) {
      session_.path_stack.back() = internal::seq_indexed( base, i );
      elements.push_back( this->resolve_node(node.at(i)) );
    }
    session_.path_stack.back() = base;
    return Node( std::move(elements) );
  }

  return Node( node );
}

inline yoke::Node yoke::Resolver::bind_tagged( const ordered_node& node,
  const std::string& tag, const std::string& selector )
{
  // 1) Shape: only scalars carry expressions
  if ( !node.is_scalar() ) {
    std::ostringstream oss;
    oss << "tagged node is not a YAML scalar (got a "
      << ( node.is_mapping() ? "mapping" : "sequence" )
      << "); expression tags apply to scalar values only";
    throw_structural_at( tag, oss.str() );
  }

  // 2) Compile
  const std::string text = internal::scalar_source_text( node );
  std::optional< Expression > expression;
  try {
    expression = compile( text );
  }
  catch ( const CompileError& ex ) {
    throw CompileError( location(tag) + ": " + ex.what(), ex.text(),
      ex.position(), selector );
  }

  // 3) Bind
  std::optional< Provider > provider = lookup_( selector );
  if ( !provider || !*provider ) {
    std::ostringstream oss;
    oss << location( tag ) << ": no controller (input provider) exists for"
      << " selector '" << selector << "'";
    throw BindingError( oss.str(), selector );
  }

  return Node( DeferredExpression( selector, std::move(*expression),
    std::move(*provider) ) );
}
