//  yoke: YAML Operator Knob Expressions
//  version 0.1.0 | MIT License
//  Copyright (C) 2026 by Steven Gardiner <gardiner \at fnal.gov>
#pragma once

// Standard library includes
#include <algorithm>
#include <cctype>
#include <cmath>
#include <locale>
#include <limits>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "common.hh"
#include "errors.hh"
#include "sample.hh"

namespace yoke {

  // Result of evaluating an expression: a boolean or a number
  using Value = std::variant< bool, double >;

  inline bool is_boolean( const Value& v ) {
    return std::holds_alternative< bool >( v );
  }

  // Numeric view of a value (false -> 0, true -> 1)
  inline double to_number( const Value& v ) {
    if ( const bool* b = std::get_if< bool >( &v ) ) return *b ? 1.0 : 0.0;
    return std::get< double >( v );
  }

  // Truth value: numbers are true when non-zero (NaN included)
  inline bool to_boolean( const Value& v ) {
    if ( const bool* b = std::get_if< bool >( &v ) ) return *b;
    return std::get< double >( v ) != 0.0;
  }

namespace internal {

  // Limit on nesting (parentheses, calls, signs, "not", "**") and on the
  // depth of the resulting tree. Evaluation recurses over the tree, so this
  // also bounds its stack use.
  inline constexpr int MAX_EXPRESSION_DEPTH = 256;

  // The three indexable tables of a Sample
  enum class Table { Axis, Button, Toggle };

  inline const char* table_name( Table t ) {
    switch ( t ) {
      case Table::Axis: return "axis";
      case Table::Button: return "button";
      case Table::Toggle: return "toggle";
    }
    return "?";
  }

  inline std::optional< Table > find_table( const std::string& name ) {
    if ( name == "axis" ) return Table::Axis;
    if ( name == "button" ) return Table::Button;
    if ( name == "toggle" ) return Table::Toggle;
    return std::nullopt;
  }

  enum class UnaryOp { Plus, Minus, Not };

  enum class BinaryOp {
    Add, Sub, Mul, Div, Mod, Pow,
    Lt, Le, Gt, Ge, Eq, Ne,
    And, Or
  };

  // Entry of the fixed allow-list of pure math functions
  struct MathFunction {
    const char* name;
    std::size_t min_args;
    std::size_t max_args;
    Value ( *apply )( const std::vector< double >& args );
  };

  inline constexpr std::size_t VARIADIC = std::numeric_limits<
    std::size_t >::max();

  inline constexpr double PI = 3.141592653589793238462643383279502884;
  inline constexpr double E = 2.718281828459045235360287471352662498;

  // Python-style modulo: the result takes the sign of the divisor
  inline double floored_mod( double a, double b ) {
    double r = std::fmod( a, b );
    if ( r != 0.0 && ( (r < 0.0) != (b < 0.0) ) ) r += b;
    return r;
  }

  inline const std::vector< MathFunction >& math_functions() {
    using Args = const std::vector< double >&;
    static const std::vector< MathFunction > table = {
      { "sin", 1, 1, []( Args a ) -> Value { return std::sin( a[0] ); } },
      { "cos", 1, 1, []( Args a ) -> Value { return std::cos( a[0] ); } },
      { "tan", 1, 1, []( Args a ) -> Value { return std::tan( a[0] ); } },
      { "asin", 1, 1, []( Args a ) -> Value { return std::asin( a[0] ); } },
      { "acos", 1, 1, []( Args a ) -> Value { return std::acos( a[0] ); } },
      { "atan", 1, 1, []( Args a ) -> Value { return std::atan( a[0] ); } },
      { "sinh", 1, 1, []( Args a ) -> Value { return std::sinh( a[0] ); } },
      { "cosh", 1, 1, []( Args a ) -> Value { return std::cosh( a[0] ); } },
      { "tanh", 1, 1, []( Args a ) -> Value { return std::tanh( a[0] ); } },
      { "asinh", 1, 1, []( Args a ) -> Value { return std::asinh( a[0] ); } },
      { "acosh", 1, 1, []( Args a ) -> Value { return std::acosh( a[0] ); } },
      { "atanh", 1, 1, []( Args a ) -> Value { return std::atanh( a[0] ); } },
      { "exp", 1, 1, []( Args a ) -> Value { return std::exp( a[0] ); } },
      { "expm1", 1, 1, []( Args a ) -> Value { return std::expm1( a[0] ); } },
      { "log10", 1, 1, []( Args a ) -> Value { return std::log10( a[0] ); } },
      { "log2", 1, 1, []( Args a ) -> Value { return std::log2( a[0] ); } },
      { "log1p", 1, 1, []( Args a ) -> Value { return std::log1p( a[0] ); } },
      { "sqrt", 1, 1, []( Args a ) -> Value { return std::sqrt( a[0] ); } },
      { "cbrt", 1, 1, []( Args a ) -> Value { return std::cbrt( a[0] ); } },
      { "fabs", 1, 1, []( Args a ) -> Value { return std::fabs( a[0] ); } },
      { "abs", 1, 1, []( Args a ) -> Value { return std::fabs( a[0] ); } },
      { "floor", 1, 1, []( Args a ) -> Value { return std::floor( a[0] ); } },
      { "ceil", 1, 1, []( Args a ) -> Value { return std::ceil( a[0] ); } },
      { "trunc", 1, 1, []( Args a ) -> Value { return std::trunc( a[0] ); } },
      // Halfway cases round to even
      { "round", 1, 1, []( Args a ) -> Value {
        return std::nearbyint( a[0] ); } },
      { "degrees", 1, 1, []( Args a ) -> Value { return a[0] * 180.0 / PI; } },
      { "radians", 1, 1, []( Args a ) -> Value { return a[0] * PI / 180.0; } },
      { "erf", 1, 1, []( Args a ) -> Value { return std::erf( a[0] ); } },
      { "erfc", 1, 1, []( Args a ) -> Value { return std::erfc( a[0] ); } },
      { "gamma", 1, 1, []( Args a ) -> Value { return std::tgamma( a[0] ); } },
      { "lgamma", 1, 1, []( Args a ) -> Value { return std::lgamma( a[0] ); } },
      { "isnan", 1, 1, []( Args a ) -> Value { return std::isnan( a[0] ); } },
      { "isinf", 1, 1, []( Args a ) -> Value { return std::isinf( a[0] ); } },
      { "isfinite", 1, 1, []( Args a ) -> Value {
        return std::isfinite( a[0] ); } },
      { "atan2", 2, 2, []( Args a ) -> Value {
        return std::atan2( a[0], a[1] ); } },
      { "pow", 2, 2, []( Args a ) -> Value { return std::pow( a[0], a[1] ); } },
      { "hypot", 2, 2, []( Args a ) -> Value {
        return std::hypot( a[0], a[1] ); } },
      { "fmod", 2, 2, []( Args a ) -> Value {
        return std::fmod( a[0], a[1] ); } },
      { "copysign", 2, 2, []( Args a ) -> Value {
        return std::copysign( a[0], a[1] ); } },
      // log(x) or log(x, base)
      { "log", 1, 2, []( Args a ) -> Value {
        if ( a.size() == 1 ) return std::log( a[0] );
        return std::log( a[0] ) / std::log( a[1] ); } },
      { "min", 2, VARIADIC, []( Args a ) -> Value {
        return *std::min_element( a.begin(), a.end() ); } },
      { "max", 2, VARIADIC, []( Args a ) -> Value {
        return *std::max_element( a.begin(), a.end() ); } },
    };
    return table;
  }

  inline const MathFunction* find_math_function( const std::string& name ) {
    for ( const auto& f : math_functions() ) {
      if ( name == f.name ) return &f;
    }
    return nullptr;
  }

  inline std::optional< double > find_math_constant( const std::string& name )
  {
    if ( name == "pi" ) return PI;
    if ( name == "e" ) return E;
    if ( name == "tau" ) return 2.0 * PI;
    if ( name == "inf" ) return std::numeric_limits< double >::infinity();
    if ( name == "nan" ) return std::numeric_limits< double >::quiet_NaN();
    return std::nullopt;
  }

  // Abstract syntax tree. The set of node kinds is closed: nothing but
  // these five can appear in a compiled expression.

  struct ExprNode;
  using ExprPtr = std::shared_ptr< const ExprNode >;

  struct Literal { Value value; };
  struct Lookup { Table table; int index; };
  struct Unary { UnaryOp op; ExprPtr operand; };
  // Operators of one precedence level applied left to right:
  // first rest[0].op rest[0].rhs rest[1].op rest[1].rhs ...
  // A flat chain is one node, so its length does not add to the depth.
  struct Operand { BinaryOp op; ExprPtr rhs; };
  struct Binary { ExprPtr first; std::vector< Operand > rest; };
  struct Call { const MathFunction* function; std::vector< ExprPtr > args; };

  struct ExprNode {
    std::variant< Literal, Lookup, Unary, Binary, Call > term;
    int depth; // 1 for leaves
  };

  Value evaluate_node( const ExprNode& node, const Sample& sample );

  enum class TokenKind { Number, Name, Symbol, End };

  struct Token {
    TokenKind kind;
    std::string text;
    std::size_t position;
  };

  // Split expression text into tokens. Throws CompileError on characters
  // outside the grammar.
  std::vector< Token > tokenize( const std::string& text );

  // Recursive-descent parser over the token stream of one expression
  class Parser {
  public:
    explicit Parser( const std::string& text );

    // Parse the whole input; trailing tokens are an error
    ExprPtr parse();

  private:
    const std::string& text_;
    std::vector< Token > tokens_;
    std::size_t pos_ = 0;
    int depth_ = 0;

    // Tracks parser recursion for the lifetime of one rule invocation
    struct DepthGuard {
      Parser& parser;
      explicit DepthGuard( Parser& p );
      ~DepthGuard() { --parser.depth_; }
    };

    // One grammar rule per precedence level, lowest first
    ExprPtr parse_or();
    ExprPtr parse_and();
    ExprPtr parse_not();
    ExprPtr parse_comparison();
    ExprPtr parse_sum();
    ExprPtr parse_term();
    ExprPtr parse_unary();
    ExprPtr parse_power();
    ExprPtr parse_primary();
    ExprPtr parse_name( const Token& name );
    ExprPtr parse_lookup( Table table, const Token& name );
    ExprPtr parse_call( const MathFunction& function, const Token& name );

    const Token& peek() const { return tokens_[ pos_ ]; }
    const Token& advance() { return tokens_[ pos_++ ]; }
    bool accept_symbol( const char* symbol );
    bool accept_keyword( const char* keyword );
    void expect_symbol( const char* symbol, const std::string& context );

    ExprPtr make( std::variant< Literal, Lookup, Unary, Binary, Call > term,
      int child_depth, std::size_t position );

    // The first operand alone when the chain is empty
    ExprPtr make_chain( ExprPtr first, std::vector< Operand > rest,
      std::size_t position );

    [[noreturn]] void fail( const std::string& msg,
      std::size_t position ) const;
  };

} // namespace yoke::internal

  // Compiled form of one expression. Immutable: it can be evaluated any
  // number of times, against any Sample, and copies share the parsed tree.
  class Expression {
  public:
    // Never throws; domain errors follow IEEE floating point semantics
    Value evaluate( const Sample& sample ) const;

    inline const std::string& text() const noexcept { return text_; }

  private:
    friend Expression compile( const std::string& text );

    inline Expression( std::string text, internal::ExprPtr root )
      : text_( std::move(text) ), root_( std::move(root) ) {}

    std::string text_;
    internal::ExprPtr root_;
  };

  // Parse expression text. Throws CompileError on syntax errors, unknown
  // symbols or functions, and table indices that are not integer literals.
  Expression compile( const std::string& text );

} // namespace yoke

// Tokenizer

namespace yoke::internal {

  inline bool is_name_start( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalpha( c ) || c == '_';
  }

  inline bool is_name_char( char ch ) {
    unsigned char c = static_cast< unsigned char >( ch );
    return std::isalnum( c ) || c == '_';
  }

  inline bool is_digit( char ch ) {
    return ch >= '0' && ch <= '9';
  }

  // Value of a number token, independent of the global C locale.
  // Literals beyond the double range read as infinity.
  inline double parse_number( const std::string& text ) {
    std::istringstream iss( text );
    iss.imbue( std::locale::classic() );
    double v = 0.0;
    iss >> v;
    if ( iss.fail() && v == std::numeric_limits< double >::max() ) {
      return std::numeric_limits< double >::infinity();
    }
    return v;
  }

  [[noreturn]] inline void throw_compile_error( const std::string& text,
    const std::string& msg, std::size_t position )
  {
    std::ostringstream oss;
    oss << "Cannot compile expression '" << text << "': " << msg
      << " (at position " << position << ")";
    throw CompileError( oss.str(), text, position );
  }

  inline std::vector< Token > tokenize( const std::string& text ) {
    // Longest operators first so that "**" wins over "*"
    static const char* const SYMBOLS[] = {
      "**", "<=", ">=", "==", "!=",
      "+", "-", "*", "/", "%", "<", ">", "(", ")", "[", "]", ","
    };

    std::vector< Token > tokens;
    std::size_t i = 0;
    while ( i < text.size() ) {
      const char c = text[ i ];
      if ( c == ' ' || c == '\t' || c == '\r' || c == '\n' ) { ++i; continue; }

      // Numbers: digits [. digits] [exponent], or . digits [exponent]
      if ( is_digit(c) || ( c == '.' && i + 1 < text.size()
        && is_digit(text[i + 1]) ) )
      {
        std::size_t j = i;
        while ( j < text.size() && is_digit(text[j]) ) ++j;
        if ( j < text.size() && text[j] == '.' ) {
          ++j;
          while ( j < text.size() && is_digit(text[j]) ) ++j;
        }
        if ( j < text.size() && ( text[j] == 'e' || text[j] == 'E' ) ) {
          std::size_t k = j + 1;
          if ( k < text.size() && ( text[k] == '+' || text[k] == '-' ) ) ++k;
          if ( k < text.size() && is_digit(text[k]) ) {
            while ( k < text.size() && is_digit(text[k]) ) ++k;
            j = k;
          }
          else {
            throw_compile_error( text, "malformed exponent in number", j );
          }
        }
        tokens.push_back( { TokenKind::Number, text.substr(i, j - i), i } );
        i = j;
        continue;
      }

      if ( is_name_start(c) ) {
        std::size_t j = i + 1;
        while ( j < text.size() && is_name_char(text[j]) ) ++j;
        tokens.push_back( { TokenKind::Name, text.substr(i, j - i), i } );
        i = j;
        continue;
      }

      bool matched = false;
      for ( const char* sym : SYMBOLS ) {
        const std::string s( sym );
        if ( text.compare(i, s.size(), s) == 0 ) {
          tokens.push_back( { TokenKind::Symbol, s, i } );
          i += s.size();
          matched = true;
          break;
        }
      }
      if ( matched ) continue;

      std::ostringstream oss;
      oss << "unexpected character '" << c << "'";
      throw_compile_error( text, oss.str(), i );
    }
    tokens.push_back( { TokenKind::End, std::string(), text.size() } );
    return tokens;
  }

} // namespace yoke::internal

// Parser member function definitions

inline yoke::internal::Parser::DepthGuard::DepthGuard( Parser& p )
  : parser( p )
{
  if ( ++parser.depth_ > MAX_EXPRESSION_DEPTH ) {
    parser.fail( "expression is nested too deeply",
      parser.peek().position );
  }
}

inline yoke::internal::Parser::Parser( const std::string& text )
  : text_( text ), tokens_( tokenize(text) ) {}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse() {
  if ( peek().kind == TokenKind::End ) {
    fail( "expression is empty", 0 );
  }
  ExprPtr root = parse_or();
  if ( peek().kind != TokenKind::End ) {
    fail( "unexpected '" + peek().text + "' after complete expression",
      peek().position );
  }
  return root;
}

[[noreturn]] inline void yoke::internal::Parser::fail(
  const std::string& msg, std::size_t position ) const
{
  throw_compile_error( text_, msg, position );
}

inline bool yoke::internal::Parser::accept_symbol( const char* symbol ) {
  if ( peek().kind == TokenKind::Symbol && peek().text == symbol ) {
    ++pos_;
    return true;
  }
  return false;
}

inline bool yoke::internal::Parser::accept_keyword( const char* keyword ) {
  if ( peek().kind == TokenKind::Name && peek().text == keyword ) {
    ++pos_;
    return true;
  }
  return false;
}

inline void yoke::internal::Parser::expect_symbol( const char* symbol,
  const std::string& context )
{
  if ( accept_symbol(symbol) ) return;
  const Token& t = peek();
  std::ostringstream oss;
  oss << "expected '" << symbol << "' " << context << " but found ";
  if ( t.kind == TokenKind::End ) oss << "end of expression";
  else oss << "'" << t.text << "'";
  fail( oss.str(), t.position );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::make(
  std::variant< Literal, Lookup, Unary, Binary, Call > term,
  int child_depth, std::size_t position )
{
  const int depth = child_depth + 1;
  if ( depth > MAX_EXPRESSION_DEPTH ) {
    fail( "expression is nested too deeply", position );
  }
  return std::make_shared< const ExprNode >(
    ExprNode{ std::move(term), depth }
  );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::make_chain(
  ExprPtr first, std::vector< Operand > rest, std::size_t position )
{
  if ( rest.empty() ) return first;
  int d = first->depth;
  for ( const Operand& o : rest ) d = std::max( d, o.rhs->depth );
  return make( Binary{ std::move(first), std::move(rest) }, d, position );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_or() {
  ExprPtr first = parse_and();
  const std::size_t at = peek().position;
  std::vector< Operand > rest;
  while ( accept_keyword("or") ) {
    rest.push_back( { BinaryOp::Or, parse_and() } );
  }
  return make_chain( std::move(first), std::move(rest), at );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_and() {
  ExprPtr first = parse_not();
  const std::size_t at = peek().position;
  std::vector< Operand > rest;
  while ( accept_keyword("and") ) {
    rest.push_back( { BinaryOp::And, parse_not() } );
  }
  return make_chain( std::move(first), std::move(rest), at );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_not() {
  if ( peek().kind == TokenKind::Name && peek().text == "not" ) {
    DepthGuard guard( *this );
    const std::size_t at = advance().position;
    ExprPtr operand = parse_not();
    return make( Unary{ UnaryOp::Not, operand }, operand->depth, at );
  }
  return parse_comparison();
}

// Comparisons chain: "a < b <= c" means "(a < b) and (b <= c)", with the
// middle operand evaluated once
inline yoke::internal::ExprPtr yoke::internal::Parser::parse_comparison() {
  static const std::pair< const char*, BinaryOp > OPS[] = {
    { "<", BinaryOp::Lt }, { "<=", BinaryOp::Le },
    { ">", BinaryOp::Gt }, { ">=", BinaryOp::Ge },
    { "==", BinaryOp::Eq }, { "!=", BinaryOp::Ne }
  };

  ExprPtr first = parse_sum();
  const std::size_t at = peek().position;
  std::vector< Operand > rest;
  while ( peek().kind == TokenKind::Symbol ) {
    const BinaryOp* op = nullptr;
    for ( const auto& [sym, bop] : OPS ) {
      if ( peek().text == sym ) { op = &bop; break; }
    }
    if ( !op ) break;

    advance();
    rest.push_back( { *op, parse_sum() } );
  }
  return make_chain( std::move(first), std::move(rest), at );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_sum() {
  ExprPtr first = parse_term();
  const std::size_t at = peek().position;
  std::vector< Operand > rest;
  while ( true ) {
    BinaryOp op;
    if ( accept_symbol("+") ) op = BinaryOp::Add;
    else if ( accept_symbol("-") ) op = BinaryOp::Sub;
    else break;

    rest.push_back( { op, parse_term() } );
  }
  return make_chain( std::move(first), std::move(rest), at );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_term() {
  ExprPtr first = parse_unary();
  const std::size_t at = peek().position;
  std::vector< Operand > rest;
  while ( true ) {
    BinaryOp op;
    if ( accept_symbol("*") ) op = BinaryOp::Mul;
    else if ( accept_symbol("/") ) op = BinaryOp::Div;
    else if ( accept_symbol("%") ) op = BinaryOp::Mod;
    else break;

    rest.push_back( { op, parse_unary() } );
  }
  return make_chain( std::move(first), std::move(rest), at );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_unary() {
  if ( peek().kind == TokenKind::Symbol
    && ( peek().text == "-" || peek().text == "+" ) )
  {
    DepthGuard guard( *this );
    const Token& sign = advance();
    const UnaryOp op = sign.text == "-" ? UnaryOp::Minus : UnaryOp::Plus;
    ExprPtr operand = parse_unary();
    return make( Unary{ op, operand }, operand->depth, sign.position );
  }
  return parse_power();
}

// "**" binds tighter than a unary sign on its left and is right-associative:
// -2 ** 2 == -4 and 2 ** 3 ** 2 == 512
inline yoke::internal::ExprPtr yoke::internal::Parser::parse_power() {
  ExprPtr base = parse_primary();
  if ( peek().kind == TokenKind::Symbol && peek().text == "**" ) {
    DepthGuard guard( *this );
    const std::size_t at = advance().position;
    std::vector< Operand > rest;
    rest.push_back( { BinaryOp::Pow, parse_unary() } );
    return make_chain( std::move(base), std::move(rest), at );
  }
  return base;
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_primary() {
  const Token& t = peek();
  switch ( t.kind ) {
    case TokenKind::Number: {
      advance();
      const double v = parse_number( t.text );
      return make( Literal{ v }, 0, t.position );
    }
    case TokenKind::Name:
      advance();
      return parse_name( t );
    case TokenKind::Symbol:
      if ( t.text == "(" ) {
        DepthGuard guard( *this );
        advance();
        ExprPtr inner = parse_or();
        expect_symbol( ")", "to close '(' at position "
          + std::to_string(t.position) );
        return inner;
      }
      fail( "unexpected '" + t.text + "'", t.position );
    case TokenKind::End:
      break;
  }
  fail( "unexpected end of expression", t.position );
}

inline yoke::internal::ExprPtr
  yoke::internal::Parser::parse_name( const Token& name )
{
  const std::string& n = name.text;
  if ( n == "true" || n == "True" ) return make( Literal{ true }, 0,
    name.position );
  if ( n == "false" || n == "False" ) return make( Literal{ false }, 0,
    name.position );

  if ( n == "and" || n == "or" || n == "not" ) {
    fail( "unexpected keyword '" + n + "'", name.position );
  }

  if ( auto table = find_table(n) ) return parse_lookup( *table, name );

  if ( const MathFunction* fn = find_math_function(n) ) {
    return parse_call( *fn, name );
  }

  if ( auto constant = find_math_constant(n) ) {
    if ( peek().kind == TokenKind::Symbol && peek().text == "(" ) {
      fail( "'" + n + "' is a constant, not a function", name.position );
    }
    return make( Literal{ *constant }, 0, name.position );
  }

  fail( "unknown name '" + n + "'", name.position );
}

// Only "table[integer literal]" is allowed: no computed or negative indices
inline yoke::internal::ExprPtr yoke::internal::Parser::parse_lookup(
  Table table, const Token& name )
{
  const std::string what = std::string( table_name(table) );
  expect_symbol( "[", "after table '" + what + "'" );

  const Token& idx = peek();
  const bool is_integer_literal = idx.kind == TokenKind::Number
    && idx.text.find_first_not_of( "0123456789" ) == std::string::npos;
  if ( !is_integer_literal ) {
    fail( "index of '" + what + "' must be a non-negative integer literal",
      idx.position );
  }

  // Reject values that do not fit in an int
  std::int64_t index = 0;
  for ( char c : idx.text ) {
    index = index * 10 + ( c - '0' );
    if ( index > std::numeric_limits< int >::max() ) {
      fail( "index of '" + what + "' is out of range", idx.position );
    }
  }
  advance();

  expect_symbol( "]", "to close index of '" + what + "'" );
  return make( Lookup{ table, static_cast< int >(index) }, 0, name.position );
}

inline yoke::internal::ExprPtr yoke::internal::Parser::parse_call(
  const MathFunction& function, const Token& name )
{
  expect_symbol( "(", "after function '" + name.text + "'" );

  DepthGuard guard( *this );
  std::vector< ExprPtr > args;
  int d = 0;
  if ( !accept_symbol(")") ) {
    do {
      ExprPtr arg = parse_or();
      d = std::max( d, arg->depth );
      args.push_back( std::move(arg) );
    } while ( accept_symbol(",") );
    expect_symbol( ")", "to close arguments of '" + name.text + "'" );
  }

  if ( args.size() < function.min_args || args.size() > function.max_args ) {
    std::ostringstream oss;
    oss << "function '" << function.name << "' takes ";
    if ( function.max_args == VARIADIC ) {
      oss << "at least " << function.min_args;
    }
    else if ( function.min_args == function.max_args ) {
      oss << function.min_args;
    }
    else {
      oss << function.min_args << " to " << function.max_args;
    }
    oss << " argument" << ( function.min_args == 1
      && function.max_args == 1 ? "" : "s" )
      << ", got " << args.size();
    fail( oss.str(), name.position );
  }

  return make( Call{ &function, std::move(args) }, d, name.position );
}

// Evaluation: a structural recursion over the closed node set

namespace yoke::internal {

  inline bool is_comparison( BinaryOp op ) {
    switch ( op ) {
      case BinaryOp::Lt: case BinaryOp::Le: case BinaryOp::Gt:
      case BinaryOp::Ge: case BinaryOp::Eq: case BinaryOp::Ne:
        return true;
      default:
        return false;
    }
  }

  inline bool compare( BinaryOp op, double a, double b ) {
    switch ( op ) {
      case BinaryOp::Lt: return a < b;
      case BinaryOp::Le: return a <= b;
      case BinaryOp::Gt: return a > b;
      case BinaryOp::Ge: return a >= b;
      case BinaryOp::Eq: return a == b;
      case BinaryOp::Ne: return a != b;
      default: return false;
    }
  }

  inline double arithmetic( BinaryOp op, double a, double b ) {
    switch ( op ) {
      case BinaryOp::Add: return a + b;
      case BinaryOp::Sub: return a - b;
      case BinaryOp::Mul: return a * b;
      case BinaryOp::Div: return a / b;
      case BinaryOp::Mod: return floored_mod( a, b );
      case BinaryOp::Pow: return std::pow( a, b );
      default: return std::numeric_limits< double >::quiet_NaN();
    }
  }

  struct Evaluator {
    const Sample& sample;

    Value operator()( const Literal& n ) const { return n.value; }

    Value operator()( const Lookup& n ) const {
      switch ( n.table ) {
        case Table::Axis: return sample.axis_at( n.index );
        case Table::Button: return sample.button_at( n.index );
        case Table::Toggle: return sample.toggle_at( n.index );
      }
      return 0.0;
    }

    Value operator()( const Unary& n ) const {
      const Value v = evaluate_node( *n.operand, sample );
      switch ( n.op ) {
        case UnaryOp::Plus: return to_number( v );
        case UnaryOp::Minus: return -to_number( v );
        case UnaryOp::Not: return !to_boolean( v );
      }
      return v;
    }

    Value operator()( const Binary& n ) const {
      const BinaryOp kind = n.rest.front().op;
      if ( kind == BinaryOp::And || kind == BinaryOp::Or ) return logical( n );
      if ( is_comparison(kind) ) return comparison( n );

      double acc = to_number( evaluate_node(*n.first, sample) );
      for ( const Operand& o : n.rest ) {
        acc = arithmetic( o.op, acc, to_number(evaluate_node(*o.rhs, sample)) );
      }
      return acc;
    }

    // Short-circuit forms return the deciding operand unchanged
    Value logical( const Binary& n ) const {
      Value lhs = evaluate_node( *n.first, sample );
      for ( const Operand& o : n.rest ) {
        const bool decided = ( o.op == BinaryOp::And ) ? !to_boolean( lhs )
          : to_boolean( lhs );
        if ( decided ) return lhs;
        lhs = evaluate_node( *o.rhs, sample );
      }
      return lhs;
    }

    Value comparison( const Binary& n ) const {
      double lhs = to_number( evaluate_node(*n.first, sample) );
      for ( const Operand& o : n.rest ) {
        const double rhs = to_number( evaluate_node(*o.rhs, sample) );
        if ( !compare( o.op, lhs, rhs ) ) return false;
        lhs = rhs;
      }
      return true;
    }

    Value operator()( const Call& n ) const {
      std::vector< double > args;
      args.reserve( n.args.size() );
      for ( const ExprPtr& arg : n.args ) {
        args.push_back( to_number(evaluate_node(*arg, sample)) );
      }
      return n.function->apply( args );
    }
  };

  inline Value evaluate_node( const ExprNode& node, const Sample& sample ) {
    return std::visit( Evaluator{ sample }, node.term );
  }

} // namespace yoke::internal

inline yoke::Value yoke::Expression::evaluate( const Sample& sample ) const {
  return internal::evaluate_node( *root_, sample );
}

inline yoke::Expression yoke::compile( const std::string& text ) {
  internal::Parser parser( text );
  internal::ExprPtr root = parser.parse();
  return Expression( text, std::move(root) );
}
