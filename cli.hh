//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <chrono>
#include <exception>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <thread>

#include "resolver.hh"
#include "sample.hh"

// Host wiring for the yoke command-line tool:
//
//   yoke [-n COUNT] [-p PERIOD_MS] SAMPLES.yaml < DOCUMENT.yaml

namespace yoke::cli {

  inline constexpr const char* USAGE
    = "usage: yoke [-n COUNT] [-p PERIOD_MS] SAMPLES.yaml < DOCUMENT.yaml";

  struct Options {
    long count = 1;
    long period_ms = 100;
    std::string samples_path;
  };

  // Parse a non-negative integer argument; std::nullopt when malformed
  inline std::optional< long > parse_count( const std::string& s ) {
    if ( s.empty() || s.find_first_not_of("0123456789") != std::string::npos )
      return std::nullopt;
    try {
      return std::stol( s );
    }
    catch ( const std::out_of_range& ) {
      return std::nullopt;
    }
  }

  // std::nullopt for anything but exactly one samples path with optional
  // -n (at least 1) and -p
  inline std::optional< Options > parse_options( int argc,
    const char* const* argv )
  {
    Options opts;
    for ( int i = 1; i < argc; ++i ) {
      const std::string arg = argv[ i ];
      if ( ( arg == "-n" || arg == "-p" ) && i + 1 < argc ) {
        auto v = parse_count( argv[++i] );
        if ( !v ) return std::nullopt;
        ( arg == "-n" ? opts.count : opts.period_ms ) = *v;
      }
      else if ( !arg.empty() && arg[0] != '-' && opts.samples_path.empty() ) {
        opts.samples_path = arg;
      }
      else {
        return std::nullopt;
      }
    }
    if ( opts.samples_path.empty() || opts.count < 1 ) return std::nullopt;
    return opts;
  }

  inline std::string read_file( const std::string& path ) {
    std::ifstream in( path );
    if ( !in ) throw std::runtime_error( "cannot open '" + path + "'" );
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
  }

  // Provider backed by the samples file. The file is read again on every
  // call, so editing it acts as live input. Failures fall back to an empty
  // Sample and are reported once per distinct message.
  class SampleFileProvider {
  public:
    SampleFileProvider( std::string path, std::string selector,
      std::shared_ptr< std::set< std::string > > reported,
      std::ostream& log )
      : path_( std::move(path) ), selector_( std::move(selector) ),
      reported_( std::move(reported) ), log_( &log ) {}

    Sample operator()() const {
      try {
        const auto samples = load_samples(
          ordered_node::deserialize( read_file(path_) ) );
        auto it = samples.find( selector_ );
        if ( it == samples.end() ) {
          throw std::runtime_error( "selector '" + selector_
            + "' is no longer defined in '" + path_ + "'" );
        }
        return it->second;
      }
      catch ( const std::exception& ex ) {
        if ( reported_->insert( ex.what() ).second ) {
          *log_ << "[yoke] warning: " << ex.what()
            << " (using an empty sample)\n";
        }
        return Sample();
      }
    }

  private:
    std::string path_;
    std::string selector_;
    std::shared_ptr< std::set< std::string > > reported_;
    std::ostream* log_;
  };

  // Full command: returns the process exit status (0 success, 1 error,
  // 2 bad arguments)
  inline int run( int argc, const char* const* argv, std::istream& in,
    std::ostream& out, std::ostream& err )
  {
    const std::optional< Options > opts = parse_options( argc, argv );
    if ( !opts ) {
      err << USAGE << "\n";
      return 2;
    }

    try {
      // One provider per selector defined in the samples file
      ProviderRegistry registry;
      auto reported = std::make_shared< std::set< std::string > >();
      const auto initial = load_samples(
        ordered_node::deserialize( read_file(opts->samples_path) ) );
      for ( const auto& entry : initial ) {
        registry.add( entry.first, SampleFileProvider( opts->samples_path,
          entry.first, reported, err ) );
      }

      Resolver yoke( registry.lookup() );
      const Node resolved = yoke.resolve( in );

      // Without deferred expressions every output would be identical
      const long count = resolved.has_deferred() ? opts->count : 1;
      for ( long i = 0; i < count; ++i ) {
        if ( i ) {
          std::this_thread::sleep_for(
            std::chrono::milliseconds( opts->period_ms ) );
          out << "---\n";
        }
        out << ordered_node::serialize( resolved.materialize() );
        out.flush();
      }
      return 0;
    } catch (const std::exception& ex) {
      err << "[yoke] error: " << ex.what() << "\n";
      return 1;
    }
  }

} // namespace yoke::cli
