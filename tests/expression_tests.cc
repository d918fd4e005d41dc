#include "expression.hh"

#include <clocale>
#include <cmath>
#include <string>

#include <doctest/doctest.h>

namespace {

  yoke::Sample controls() {
    yoke::Sample s;
    s.axis = { { 0, 0.5 }, { 5, -0.7 } };
    s.button = { { 2, true } };
    s.toggle = { { 1, false } };
    return s;
  }

  yoke::Value eval( const std::string& text,
    const yoke::Sample& sample = yoke::Sample() )
  {
    return yoke::compile( text ).evaluate( sample );
  }

  void test_number( const std::string& text, double expected,
    const yoke::Sample& sample = yoke::Sample() )
  {
    INFO( "Testing ", text );
    const yoke::Value v = eval( text, sample );
    REQUIRE_FALSE( yoke::is_boolean(v) );
    CHECK( std::get< double >(v) == doctest::Approx(expected) );
  }

  void test_boolean( const std::string& text, bool expected,
    const yoke::Sample& sample = yoke::Sample() )
  {
    INFO( "Testing ", text );
    const yoke::Value v = eval( text, sample );
    REQUIRE( yoke::is_boolean(v) );
    CHECK_EQ( std::get< bool >(v), expected );
  }

  void test_compile_error( const std::string& text ) {
    INFO( "Testing error ", text );
    CHECK_THROWS_AS( yoke::compile(text), yoke::CompileError );
  }

} // namespace

TEST_SUITE("Expressions")
{
  TEST_CASE("Constants")
  {
    test_number( "1", 1.0 );
    test_number( " 12 ", 12.0 );
    test_number( "12.5", 12.5 );
    test_number( ".5", 0.5 );
    test_number( "1e3", 1000.0 );
    test_number( "2.5E-1", 0.25 );
    test_number( "pi", 3.141592653589793 );
    test_number( "tau", 2.0 * 3.141592653589793 );
    test_number( "e", 2.718281828459045 );
    test_boolean( "true", true );
    test_boolean( "True", true );
    test_boolean( "false", false );
    test_boolean( "False", false );
    CHECK( std::isinf(std::get< double >( eval("inf") )) );
    CHECK( std::isnan(std::get< double >( eval("nan") )) );
  }

  TEST_CASE("Arithmetic")
  {
    test_number( "1 + 2 * 3", 7.0 );
    test_number( "(1 + 2) * 3", 9.0 );
    test_number( "10 - 2 - 3", 5.0 );
    test_number( "3 / 2", 1.5 );
    test_number( "1 / 3 * 6", 2.0 );
    test_number( "7 % 3", 1.0 );
    test_number( "7 % -3", -2.0 );
    test_number( "-7 % 3", 2.0 );
    test_number( "2 ** 10", 1024.0 );
    test_number( "2 ** 3 ** 2", 512.0 );
    test_number( "-2 ** 2", -4.0 );
    test_number( "2 ** -1", 0.5 );
    test_number( "--1", 1.0 );
    test_number( "+-+3", -3.0 );
    test_number( "true + true", 2.0 );
    test_number( "-true", -1.0 );
  }

  TEST_CASE("Division by zero follows floating point")
  {
    const double pos = std::get< double >( eval("1 / 0") );
    CHECK( std::isinf(pos) );
    CHECK( pos > 0.0 );
    CHECK( std::get< double >( eval("-1 / 0") ) < 0.0 );
    CHECK( std::isnan(std::get< double >( eval("0 / 0") )) );
    CHECK( std::isnan(std::get< double >( eval("5 % 0") )) );
  }

  TEST_CASE("Comparisons")
  {
    test_boolean( "1 < 2", true );
    test_boolean( "2 < 2", false );
    test_boolean( "2 <= 2", true );
    test_boolean( "3 > 2", true );
    test_boolean( "2 >= 3", false );
    test_boolean( "1 == 1.0", true );
    test_boolean( "1 != 1", false );
    test_boolean( "true == 1", true );
    test_boolean( "1 < 2 < 3", true );
    test_boolean( "3 > 2 > 2", false );
    test_boolean( "1 < 3 > 2", true );
    test_boolean( "1 + 1 == 2", true );
  }

  TEST_CASE("Logical")
  {
    test_boolean( "not 0", true );
    test_boolean( "not 2", false );
    test_boolean( "not not true", true );
    test_boolean( "true and false", false );
    test_boolean( "false or true", true );
    test_boolean( "not 1 == 2", true );

    // and/or yield the deciding operand
    test_number( "2 and 3", 3.0 );
    test_number( "0 and 3", 0.0 );
    test_number( "0 or 3", 3.0 );
    test_number( "2 or 3", 2.0 );
    test_boolean( "0 or false", false );
    test_number( "1 or 2 and 0", 1.0 );
    test_boolean( "nan and true", true );
  }

  TEST_CASE("Functions")
  {
    test_number( "sin(pi / 2)", 1.0 );
    test_number( "cos(0)", 1.0 );
    test_number( "atan2(1, 1)", 3.141592653589793 / 4.0 );
    test_number( "sqrt(16)", 4.0 );
    test_number( "hypot(3, 4)", 5.0 );
    test_number( "pow(2, 8)", 256.0 );
    test_number( "exp(0)", 1.0 );
    test_number( "log(e)", 1.0 );
    test_number( "log(8, 2)", 3.0 );
    test_number( "log10(1000)", 3.0 );
    test_number( "abs(-2.5)", 2.5 );
    test_number( "floor(-1.5)", -2.0 );
    test_number( "ceil(1.2)", 2.0 );
    test_number( "round(2.5)", 2.0 );
    test_number( "round(3.5)", 4.0 );
    test_number( "degrees(pi)", 180.0 );
    test_number( "radians(180)", 3.141592653589793 );
    test_number( "copysign(2, -0.0)", -2.0 );
    test_number( "min(3, 1, 2)", 1.0 );
    test_number( "max(1, 4)", 4.0 );
    test_number( "sin(cos(0) - 1)", 0.0 );
    test_boolean( "isnan(nan)", true );
    test_boolean( "isinf(1 / 0)", true );
    test_boolean( "isfinite(1)", true );
  }

  TEST_CASE("Table lookups")
  {
    const yoke::Sample s = controls();
    test_number( "axis[0]", 0.5, s );
    test_number( "axis[5]", -0.7, s );
    test_boolean( "button[2]", true, s );
    test_boolean( "toggle[1]", false, s );
    test_number( "sin(axis[0] + 1.0)", std::sin(1.5), s );
    test_boolean( "toggle[1] and button[2]", false, s );
    test_boolean( "toggle[1] or button[2]", true, s );
    test_number( "axis[ 5 ] * 10", -7.0, s );
  }

  TEST_CASE("Absent indices read as defaults")
  {
    const yoke::Sample s = controls();
    test_number( "axis[3]", 0.0, s );
    test_boolean( "button[0]", false, s );
    test_boolean( "toggle[7]", false, s );
    test_number( "axis[0] or 3", 3.0 );
    test_boolean( "not button[99]", true );
    test_number( "axis[2147483647]", 0.0, s );
  }

  TEST_CASE("Compiled expression is reusable")
  {
    const yoke::Expression expr = yoke::compile( "axis[0] * 2" );
    CHECK_EQ( expr.text(), "axis[0] * 2" );

    yoke::Sample a;
    a.axis[0] = 1.0;
    yoke::Sample b;
    b.axis[0] = -3.0;
    CHECK( std::get< double >( expr.evaluate(a) ) == doctest::Approx(2.0) );
    CHECK( std::get< double >( expr.evaluate(b) ) == doctest::Approx(-6.0) );
    CHECK( std::get< double >( expr.evaluate(a) ) == doctest::Approx(2.0) );

    const yoke::Expression copy = expr;
    CHECK( std::get< double >( copy.evaluate(b) ) == doctest::Approx(-6.0) );
  }

  TEST_CASE("Syntax errors")
  {
    test_compile_error( "" );
    test_compile_error( "   " );
    test_compile_error( "0syntax error" );
    test_compile_error( "1 +" );
    test_compile_error( "(1 + 2" );
    test_compile_error( "1 + 2)" );
    test_compile_error( "* 2" );
    test_compile_error( "1 2" );
    test_compile_error( "1e" );
    test_compile_error( "and 1" );
    test_compile_error( "1 if 2 else 3" );
    test_compile_error( "x = 1" );
    test_compile_error( "1; 2" );
  }

  TEST_CASE("Symbols outside the allow-list")
  {
    test_compile_error( "foo" );
    test_compile_error( "foo(1)" );
    test_compile_error( "__import__('os')" );
    test_compile_error( "axis.clear()" );
    test_compile_error( "sin" );
    test_compile_error( "pi(1)" );
    test_compile_error( "lambda: 1" );
    test_compile_error( "\"text\"" );
  }

  TEST_CASE("Arity")
  {
    test_compile_error( "sin()" );
    test_compile_error( "sin(1, 2)" );
    test_compile_error( "atan2(1)" );
    test_compile_error( "log(1, 2, 3)" );
    test_compile_error( "min(1)" );
  }

  TEST_CASE("Indices must be integer literals")
  {
    test_compile_error( "axis" );
    test_compile_error( "axis[]" );
    test_compile_error( "axis[1.5]" );
    test_compile_error( "axis[1e2]" );
    test_compile_error( "axis[-1]" );
    test_compile_error( "axis[i]" );
    test_compile_error( "axis[0 + 1]" );
    test_compile_error( "button[axis[0]]" );
    test_compile_error( "toggle[2147483648]" );
    test_compile_error( "axis(0)" );
  }

  TEST_CASE("Nesting is bounded")
  {
    const std::string ok = std::string( 200, '(' ) + "1"
      + std::string( 200, ')' );
    test_number( ok, 1.0 );

    test_compile_error( std::string(300, '(') + "1" + std::string(300, ')') );
    test_compile_error( std::string(300, '-') + "1" );
    test_compile_error( std::string(300, '(') + "sin(" + "1"
      + std::string(300, ')') + ")" );
  }

  TEST_CASE("Long flat chains are not nesting")
  {
    std::string long_sum = "1";
    for ( int i = 0; i < 300; ++i ) long_sum += " + 1";
    test_number( long_sum, 301.0 );

    yoke::Sample s;
    std::string axes = "axis[0]";
    for ( int i = 1; i < 300; ++i ) {
      s.axis[i] = 1.0;
      axes += " + axis[" + std::to_string( i ) + "]";
    }
    s.axis[0] = 0.5;
    test_number( axes, 299.5, s );

    std::string product = "2";
    std::string conjunction = "true";
    std::string disjunction = "0";
    std::string ascending = "0";
    for ( int i = 1; i <= 1000; ++i ) {
      product += ( i % 2 ) ? " * 2" : " / 2";
      conjunction += " and 1";
      disjunction += " or 0";
      ascending += " < " + std::to_string( i );
    }
    test_number( product, 2.0 );
    test_number( conjunction, 1.0 );
    test_number( disjunction, 0.0 );
    test_boolean( ascending, true );
    test_boolean( ascending + " < 0", false );
  }

  TEST_CASE("Mixed chains keep precedence and order")
  {
    test_number( "10 - 2 - 3 - 4", 1.0 );
    test_number( "64 / 4 / 2 * 3 % 5", 4.0 );
    test_number( "1 + 2 * 3 - 4 / 2", 5.0 );
    test_boolean( "1 < 2 == true", false );
    test_number( "0 and 1 or 5", 5.0 );
    test_number( "3 or 0 and 0", 3.0 );
  }

  TEST_CASE("Number literals ignore the C locale")
  {
    test_number( "0.5", 0.5 );
    CHECK( std::isinf(std::get< double >( eval("1e999") )) );
    test_number( "1e-999", 0.0 );

    // Only checked where a comma-decimal locale is installed
    for ( const char* name : { "de_DE.UTF-8", "de_DE.utf8", "fr_FR.UTF-8" } ) {
      const std::string saved = std::setlocale( LC_NUMERIC, nullptr );
      if ( std::setlocale(LC_NUMERIC, name) ) {
        INFO( "Locale ", name );
        test_number( "0.5", 0.5 );
        test_number( "2.5E-1 + .25", 0.5 );
        std::setlocale( LC_NUMERIC, saved.c_str() );
        break;
      }
      std::setlocale( LC_NUMERIC, saved.c_str() );
    }
  }

  TEST_CASE("Error details")
  {
    try {
      yoke::compile( "1 + foo" );
      FAIL( "expected a CompileError" );
    }
    catch ( const yoke::CompileError& ex ) {
      CHECK_EQ( ex.text(), "1 + foo" );
      CHECK_EQ( ex.position(), 4u );
      CHECK( ex.selector().empty() );
      const std::string what = ex.what();
      CHECK( what.find("compile") != std::string::npos );
      CHECK( what.find("foo") != std::string::npos );
    }
  }
}
