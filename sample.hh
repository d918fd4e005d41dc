//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <functional>
#include <limits>
#include <map>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "common.hh"
#include "errors.hh"

namespace yoke {

  // Snapshot of external input state at one instant. The tables are sparse:
  // an index that is not present reads as 0.0 (axis) or false (button,
  // toggle).
  struct Sample {
    std::unordered_map< int, double > axis;
    std::unordered_map< int, bool > button;
    std::unordered_map< int, bool > toggle;

    inline double axis_at( int index ) const;
    inline bool button_at( int index ) const;
    inline bool toggle_at( int index ) const;
  };

  // Live input source. Every call returns a fresh Sample and must not throw;
  // a source that cannot be read returns a best-effort Sample instead.
  using Provider = std::function< Sample() >;

  // Selector -> provider binding supplied by the host application.
  // std::nullopt signals that no provider exists for the selector.
  using ProviderLookup
    = std::function< std::optional< Provider >( const std::string& ) >;

  // Simple selector -> provider table for hosts that know their providers
  // up front
  class ProviderRegistry {
  public:
    // Throws std::invalid_argument for an empty selector or provider.
    // Registering a selector again replaces its provider.
    void add( const std::string& selector, Provider provider );

    inline bool contains( const std::string& selector ) const {
      return providers_.count( selector ) != 0;
    }

    std::optional< Provider > find( const std::string& selector ) const;

    // Lookup function for a Resolver. The registry must outlive every
    // resolve(...) call made with it.
    ProviderLookup lookup() const;

  private:
    std::map< std::string, Provider > providers_;
  };

  // Build a Sample from its YAML form:
  //   { axis: {0: 0.5}, button: {2: true}, toggle: {1: false} }
  // Throws StructuralError on malformed input.
  Sample load_sample( const ordered_node& node );

  // Build one Sample per top-level key (the key is the selector)
  std::map< std::string, Sample > load_samples( const ordered_node& doc );

namespace internal {

  // Keys accepted in the YAML form of a Sample
  inline const std::string AXIS = "axis";
  inline const std::string BUTTON = "button";
  inline const std::string TOGGLE = "toggle";

  [[noreturn]] inline void throw_structural_at(
    const std::vector< std::string >& path, const std::string& msg )
  {
    throw StructuralError( join_path(path) + ": " + msg );
  }

  // Table indices are non-negative ints, authored either as integers or as
  // decimal strings
  inline int sample_index( const ordered_node& key,
    const std::vector< std::string >& path )
  {
    std::int64_t index = -1;
    if ( key.is_integer() ) {
      index = to_native_checked< std::int64_t >( key );
    }
    else if ( key.is_string() ) {
      const std::string s = to_native_checked< std::string >( key );
      if ( !s.empty() && s.size() <= 10
        && s.find_first_not_of("0123456789") == std::string::npos )
      {
        index = std::stoll( s );
      }
    }
    if ( index < 0 || index > std::numeric_limits< int >::max() ) {
      std::ostringstream oss;
      oss << "sample index '" << to_string_any( key )
        << "' is not a non-negative integer";
      throw_structural_at( path, oss.str() );
    }
    return static_cast< int >( index );
  }

  inline double sample_axis_value( const ordered_node& v,
    const std::vector< std::string >& path )
  {
    if ( v.is_float_number() ) return to_native_checked< double >( v );
    if ( v.is_integer() ) {
      return static_cast< double >( to_native_checked< std::int64_t >(v) );
    }
    throw_structural_at( path, "axis value '" + to_string_any(v)
      + "' is not a number" );
  }

  inline bool sample_switch_value( const ordered_node& v,
    const std::vector< std::string >& path )
  {
    if ( v.is_boolean() ) return v.get_value< bool >();
    if ( v.is_integer() ) {
      const std::int64_t i = to_native_checked< std::int64_t >( v );
      if ( i == 0 || i == 1 ) return i == 1;
    }
    throw_structural_at( path, "switch value '" + to_string_any(v)
      + "' is not a boolean" );
  }

  // Fill one sparse table from a mapping of index -> value
  template < typename T, typename Convert >
  inline void load_sample_table( const ordered_node& table,
    std::unordered_map< int, T >& out, std::vector< std::string >& path,
    Convert convert )
  {
    if ( table.is_null() ) return; // "axis:" with nothing is an empty table
    if ( !table.is_mapping() ) {
      throw_structural_at( path, "sample table must be a mapping of index "
        "to value" );
    }
    for ( const auto& [mk, mv] : table.map_items() ) {
      path.push_back( to_string_any(mk) );
      const int index = sample_index( mk, path );
      out[ index ] = convert( mv, path );
      path.pop_back();
    }
  }

  inline Sample load_sample_at( const ordered_node& node,
    std::vector< std::string >& path )
  {
    Sample sample;
    if ( node.is_null() ) return sample;
    if ( !node.is_mapping() ) {
      throw_structural_at( path, "sample must be a mapping with '" + AXIS
        + "', '" + BUTTON + "' and/or '" + TOGGLE + "' tables" );
    }
    for ( const auto& [mk, mv] : node.map_items() ) {
      const std::string key = to_string_any( mk );
      path.push_back( key );
      if ( key == AXIS ) {
        load_sample_table( mv, sample.axis, path, sample_axis_value );
      }
      else if ( key == BUTTON ) {
        load_sample_table( mv, sample.button, path, sample_switch_value );
      }
      else if ( key == TOGGLE ) {
        load_sample_table( mv, sample.toggle, path, sample_switch_value );
      }
      else {
        throw_structural_at( path, "unknown sample table '" + key + "'" );
      }
      path.pop_back();
    }
    return sample;
  }

} // namespace yoke::internal

} // namespace yoke

// Sample member function definitions

inline double yoke::Sample::axis_at( int index ) const {
  auto it = axis.find( index );
  return it == axis.end() ? 0.0 : it->second;
}

inline bool yoke::Sample::button_at( int index ) const {
  auto it = button.find( index );
  return it != button.end() && it->second;
}

inline bool yoke::Sample::toggle_at( int index ) const {
  auto it = toggle.find( index );
  return it != toggle.end() && it->second;
}

// ProviderRegistry member function definitions

inline void yoke::ProviderRegistry::add( const std::string& selector,
  Provider provider )
{
  if ( selector.empty() ) {
    throw std::invalid_argument( "Provider selector must not be empty" );
  }
  if ( !provider ) {
    throw std::invalid_argument( "Provider for selector '" + selector
      + "' is empty" );
  }
  providers_[ selector ] = std::move( provider );
}

inline std::optional< yoke::Provider >
  yoke::ProviderRegistry::find( const std::string& selector ) const
{
  auto it = providers_.find( selector );
  if ( it == providers_.end() ) return std::nullopt;
  return it->second;
}

inline yoke::ProviderLookup yoke::ProviderRegistry::lookup() const {
  return [this]( const std::string& selector ) {
    return this->find( selector );
  };
}

inline yoke::Sample yoke::load_sample( const ordered_node& node ) {
  std::vector< std::string > path = { internal::DOC_ROOT };
  return internal::load_sample_at( node, path );
}

inline std::map< std::string, yoke::Sample >
  yoke::load_samples( const ordered_node& doc )
{
  std::map< std::string, Sample > samples;
  std::vector< std::string > path = { internal::DOC_ROOT };
  if ( doc.is_null() ) return samples;
  if ( !doc.is_mapping() ) {
    internal::throw_structural_at( path, "samples document must be a "
      "mapping of selector to sample" );
  }
  for ( const auto& [mk, mv] : doc.map_items() ) {
    const std::string selector = internal::to_string_any( mk );
    path.push_back( selector );
    if ( selector.empty() ) {
      internal::throw_structural_at( path, "selector must not be empty" );
    }
    samples[ selector ] = internal::load_sample_at( mv, path );
    path.pop_back();
  }
  return samples;
}
