//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>

namespace yoke {

  // Root of the failures raised while turning tagged document scalars into
  // deferred expressions. All of them abort the document load.
  class ExpressionError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
  };

  // A node has the wrong shape: a tagged node that is not a scalar, a tag
  // on a mapping key, or a malformed sample table
  class StructuralError : public ExpressionError {
  public:
    using ExpressionError::ExpressionError;
  };

  // Expression text that does not belong to the grammar
  class CompileError : public ExpressionError {
  public:
    inline CompileError( const std::string& msg, std::string text,
      std::size_t position, std::string selector = std::string() )
      : ExpressionError( msg ), text_( std::move(text) ),
      position_( position ), selector_( std::move(selector) ) {}

    // Source text of the expression that failed to compile
    inline const std::string& text() const noexcept { return text_; }

    // Character offset into text() where compilation stopped
    inline std::size_t position() const noexcept { return position_; }

    // Selector of the tag, empty when compile() was called directly
    inline const std::string& selector() const noexcept { return selector_; }

  private:
    std::string text_;
    std::size_t position_;
    std::string selector_;
  };

  // No provider is registered for a selector at resolution time
  class BindingError : public ExpressionError {
  public:
    inline BindingError( const std::string& msg, std::string selector )
      : ExpressionError( msg ), selector_( std::move(selector) ) {}

    inline const std::string& selector() const noexcept { return selector_; }

  private:
    std::string selector_;
  };

} // namespace yoke
