#include "sample.hh"

#include <string>

#include <doctest/doctest.h>

namespace {

  yoke::ordered_node yaml( const std::string& text ) {
    return yoke::ordered_node::deserialize( text );
  }

} // namespace

TEST_SUITE("Samples")
{
  TEST_CASE("Absent indices read as defaults")
  {
    yoke::Sample s;
    s.axis[1] = 0.25;
    s.button[3] = true;
    s.toggle[4] = true;

    CHECK_EQ( s.axis_at(1), 0.25 );
    CHECK_EQ( s.axis_at(0), 0.0 );
    CHECK( s.button_at(3) );
    CHECK_FALSE( s.button_at(2) );
    CHECK( s.toggle_at(4) );
    CHECK_FALSE( s.toggle_at(0) );
  }

  TEST_CASE("Load sample")
  {
    const yoke::Sample s = yoke::load_sample( yaml(
      "axis: {0: 0.5, 5: -1}\n"
      "button: {2: true, 3: 0}\n"
      "toggle: {1: false}\n" ) );

    REQUIRE_EQ( s.axis.size(), 2u );
    CHECK_EQ( s.axis_at(0), 0.5 );
    CHECK_EQ( s.axis_at(5), -1.0 );
    CHECK( s.button_at(2) );
    CHECK_EQ( s.button.count(3), 1u );
    CHECK_FALSE( s.button_at(3) );
    CHECK_EQ( s.toggle.count(1), 1u );
    CHECK_FALSE( s.toggle_at(1) );
  }

  TEST_CASE("Load sample with string indices and empty tables")
  {
    const yoke::Sample s = yoke::load_sample( yaml(
      "axis: {'4': 1.5}\n"
      "button:\n" ) );
    CHECK_EQ( s.axis_at(4), 1.5 );
    CHECK( s.button.empty() );
    CHECK( s.toggle.empty() );
  }

  TEST_CASE("Malformed samples")
  {
    CHECK_THROWS_AS( yoke::load_sample(yaml("[1, 2]")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("axis: [0.5]")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("axis: {-1: 0.5}")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("axis: {x: 0.5}")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("axis: {0: fast}")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("button: {0: 2}")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("toggle: {0: 0.5}")),
      yoke::StructuralError );
    CHECK_THROWS_AS( yoke::load_sample(yaml("knob: {0: 1}")),
      yoke::StructuralError );
  }

  TEST_CASE("Errors name the offending entry")
  {
    try {
      yoke::load_samples( yaml("'7': {axis: {0: fast}}") );
      FAIL( "expected a StructuralError" );
    }
    catch ( const yoke::StructuralError& ex ) {
      const std::string what = ex.what();
      CHECK( what.find("root.7.axis.0") != std::string::npos );
    }
  }

  TEST_CASE("Load samples by selector")
  {
    const auto samples = yoke::load_samples( yaml(
      "'7': {axis: {0: 0.5}}\n"
      "pad: {toggle: {1: true}}\n"
      "idle:\n" ) );

    REQUIRE_EQ( samples.size(), 3u );
    CHECK_EQ( samples.at("7").axis_at(0), 0.5 );
    CHECK( samples.at("pad").toggle_at(1) );
    CHECK( samples.at("idle").axis.empty() );

    CHECK_THROWS_AS( yoke::load_samples(yaml("[a, b]")),
      yoke::StructuralError );
  }

  TEST_CASE("Registry")
  {
    yoke::ProviderRegistry registry;
    int calls = 0;
    registry.add( "7", [&calls]() {
      ++calls;
      yoke::Sample s;
      s.axis[0] = calls;
      return s;
    } );

    CHECK( registry.contains("7") );
    CHECK_FALSE( registry.contains("8") );
    CHECK_FALSE( registry.find("8").has_value() );

    const yoke::ProviderLookup lookup = registry.lookup();
    std::optional< yoke::Provider > p = lookup( "7" );
    REQUIRE( p.has_value() );
    CHECK_EQ( calls, 0 );
    CHECK_EQ( (*p)().axis_at(0), 1.0 );
    CHECK_EQ( (*p)().axis_at(0), 2.0 );
    CHECK_FALSE( lookup("nope").has_value() );

    CHECK_THROWS_AS( registry.add("", []() { return yoke::Sample(); }),
      std::invalid_argument );
    CHECK_THROWS_AS( registry.add("9", yoke::Provider()),
      std::invalid_argument );
  }
}
