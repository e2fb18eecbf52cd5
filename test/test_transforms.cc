#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

#include "test_support.hh"

namespace tape_test {

using tape::apply_transform;
using tape::parse_transform;
using tape::internal::make_float;
using tape::internal::make_int;
using tape::internal::make_string;
using tape::internal::utf8_length;

namespace {

  ordered_node run( const ordered_node& value, const std::string& spec ) {
    return apply_transform( value, parse_transform(yaml(spec)) );
  }

  std::string truncated( const std::string& text, int max_length,
    const std::string& suffix = "…" )
  {
    ordered_node spec = ordered_node::mapping();
    spec[ "name" ] = make_string( "truncate" );
    spec[ "max_length" ] = make_int( max_length );
    spec[ "suffix" ] = make_string( suffix );
    return str( apply_transform(make_string(text), parse_transform(spec)) );
  }

  ordered_node rounded( const ordered_node& value, std::int64_t digits ) {
    ordered_node spec = ordered_node::mapping();
    spec[ "name" ] = make_string( "round" );
    spec[ "digits" ] = make_int( digits );
    return apply_transform( value, parse_transform(spec) );
  }

} // namespace

TEST(Transforms, TextCase) {
  EXPECT_EQ(str(run(make_string("hello"), "upper")), "HELLO");
  EXPECT_EQ(str(run(make_string("HeLLo"), "lower")), "hello");
  EXPECT_EQ(str(run(make_string("hELLO wORLD"), "capitalize")),
    "Hello world");
  EXPECT_EQ(str(run(make_string("  padded \t"), "strip")), "padded");
}

TEST(Transforms, TextRejectsNonStrings) {
  EXPECT_THROW(run(make_int(3), "upper"), tape::TypeMismatch);
  EXPECT_THROW(run(yaml("[a, 1]"), "lower"), tape::TypeMismatch);
}

TEST(Transforms, TextLiftsOverLists) {
  const ordered_node out = run( yaml("[hello, world]"), "upper" );
  EXPECT_TRUE(same(out, yaml("[HELLO, WORLD]")));
}

TEST(Transforms, NullPassesThrough) {
  EXPECT_TRUE(run(ordered_node(), "upper").is_null());
  EXPECT_TRUE(run(ordered_node(), "length").is_null());
}

TEST(Transforms, TruncateExamples) {
  EXPECT_EQ(truncated("short", 10), "short");
  EXPECT_EQ(truncated("LONG TITLE HERE", 10), "LONG TITL…");
  EXPECT_EQ(truncated("abcdef", 4, "..."), "a...");
  EXPECT_EQ(truncated("abcdef", 2, "..."), "..");
  EXPECT_EQ(truncated("abcdef", 0), "");
}

TEST(Transforms, TruncateBoundAndIdempotence) {
  const std::vector< std::string > inputs = { "", "a", "exactly ten",
    "a considerably longer line of text", "ünïcödé characters here" };
  for ( const auto& s : inputs ) {
    for ( int n = 1; n < 20; ++n ) {
      const std::string once = truncated( s, n );
      EXPECT_LE(utf8_length(once), static_cast< std::size_t >(n));
      EXPECT_EQ(truncated(once, n), once);
    }
  }
}

TEST(Transforms, TruncateDefaults) {
  const std::string text( 80, 'x' );
  const std::string out = str( run(make_string(text), "truncate") );
  EXPECT_EQ(utf8_length(out), 50u);
  EXPECT_EQ(out.substr(out.size() - std::string("…").size()), "…");
}

TEST(Transforms, Numeric) {
  EXPECT_EQ(integer(run(make_int(-4), "abs")), 4);
  EXPECT_DOUBLE_EQ(real(run(make_float(-2.5), "abs")), 2.5);
  EXPECT_THROW(run(yaml("true"), "abs"), tape::TypeMismatch);
  EXPECT_THROW(run(make_string("1"), "abs"), tape::TypeMismatch);

  EXPECT_DOUBLE_EQ(real(run(make_float(2.5), "round")), 2.0);
  EXPECT_DOUBLE_EQ(real(run(make_float(3.5), "round")), 4.0);
  EXPECT_DOUBLE_EQ(real(run(make_float(1.2345), "{name: round, digits: 2}")),
    1.23);
  EXPECT_EQ(integer(run(make_int(17), "round")), 17);
  EXPECT_EQ(integer(run(make_int(1234), "{name: round, digits: -2}")), 1200);
}

TEST(Transforms, RoundIntegersExactly) {
  using limits = std::numeric_limits< std::int64_t >;
  EXPECT_EQ(integer(rounded(make_int(25), -1)), 20);
  EXPECT_EQ(integer(rounded(make_int(35), -1)), 40);
  EXPECT_EQ(integer(rounded(make_int(-25), -1)), -20);
  EXPECT_EQ(integer(rounded(make_int(-36), -1)), -40);
  EXPECT_EQ(integer(rounded(make_int(9007199254740993), -1)),
    9007199254740990);
  EXPECT_EQ(integer(rounded(make_int(limits::max()), -18)),
    9000000000000000000);

  EXPECT_THROW(rounded(make_int(limits::max()), -1), tape::TypeMismatch);
  EXPECT_THROW(rounded(make_int(limits::min()), -1), tape::TypeMismatch);
  EXPECT_THROW(rounded(make_int(limits::max()), -19), tape::TypeMismatch);
  EXPECT_EQ(integer(rounded(make_int(4000000000000000000), -19)), 0);
  EXPECT_EQ(integer(rounded(make_int(limits::max()), limits::min())), 0);
  EXPECT_EQ(integer(rounded(make_int(-7), -400)), 0);
}

TEST(Transforms, RoundFloatsAtExtremeDigits) {
  const ordered_node zero = rounded( make_float(123.5), -400 );
  ASSERT_TRUE(zero.is_float_number());
  EXPECT_DOUBLE_EQ(real(zero), 0.0);
  EXPECT_TRUE(std::signbit(real(rounded(make_float(-8.0), -400))));
  EXPECT_DOUBLE_EQ(real(rounded(make_float(1.5), 400)), 1.5);
  EXPECT_DOUBLE_EQ(real(rounded(make_float(1250.0), -2)), 1200.0);
}

TEST(Transforms, Format) {
  EXPECT_EQ(str(run(make_float(3.14159), "{name: format, format_spec: .2f}")),
    "3.14");
  EXPECT_EQ(str(run(make_int(7), "{name: format, format_spec: '>3'}")), "  7");
  EXPECT_EQ(str(run(make_string("x"), "format")), "x");
  EXPECT_THROW(run(make_string("x"), "{name: format, format_spec: .2f}"),
    tape::TypeMismatch);
}

TEST(Transforms, Collections) {
  EXPECT_EQ(integer(run(yaml("[1, 2, 3]"), "length")), 3);
  EXPECT_EQ(integer(run(make_string("héllo"), "length")), 5);
  EXPECT_EQ(integer(run(yaml("{a: 1, b: 2}"), "length")), 2);
  EXPECT_THROW(run(make_int(3), "length"), tape::TypeMismatch);

  EXPECT_EQ(str(run(yaml("[a, 1, true]"), "{name: join, separator: ', '}")),
    "a, 1, true");
  EXPECT_EQ(str(run(yaml("{x: 1, y: 2}"), "join")), "xy");
  EXPECT_THROW(run(make_string("abc"), "join"), tape::TypeMismatch);

  EXPECT_EQ(integer(run(yaml("[4, 5, 6]"), "first")), 4);
  EXPECT_EQ(integer(run(yaml("[4, 5, 6]"), "last")), 6);
  EXPECT_EQ(str(run(make_string("abc"), "last")), "c");
  EXPECT_EQ(str(run(yaml("{z: 1, a: 2}"), "first")), "z");
  EXPECT_TRUE(run(yaml("[]"), "first").is_null());
}

TEST(Transforms, Conversions) {
  EXPECT_EQ(str(run(make_int(12), "str")), "12");
  EXPECT_EQ(str(run(yaml("true"), "str")), "true");
  EXPECT_EQ(integer(run(make_string(" 42 "), "int")), 42);
  EXPECT_EQ(integer(run(make_float(-3.9), "int")), -3);
  EXPECT_EQ(integer(run(yaml("true"), "int")), 1);
  EXPECT_THROW(run(make_string("4x"), "int"), tape::TypeMismatch);
  EXPECT_DOUBLE_EQ(real(run(make_string("2.5"), "float")), 2.5);
  EXPECT_DOUBLE_EQ(real(run(make_int(2), "float")), 2.0);
  EXPECT_THROW(run(yaml("[1]"), "float"), tape::TypeMismatch);
}

TEST(Transforms, SpecErrors) {
  EXPECT_THROW(parse_transform(make_string("shout")), tape::SpecError);
  EXPECT_THROW(parse_transform(yaml("{max_length: 3}")), tape::SpecError);
  EXPECT_THROW(parse_transform(yaml("{name: truncate, max_length: ten}")),
    tape::SpecError);
  EXPECT_THROW(parse_transform(make_int(1)), tape::SpecError);

  try {
    parse_transform( make_string("shout") );
  }
  catch ( const tape::SpecError& ex ) {
    EXPECT_NE(std::string(ex.what()).find("truncate"), std::string::npos);
  }
}

TEST(Transforms, CustomBypassesChecks) {
  const tape::TransformSpec custom = tape::CustomTransform{
    []( const ordered_node& v ) {
      return make_int( tape::internal::kind_name(v).size() );
    }, "kind_width" };
  EXPECT_EQ(integer(apply_transform(yaml("[1]"), custom)), 4);
  EXPECT_THROW(tape::transform_to_node(custom), tape::SpecError);
}

TEST(Transforms, SerializedFormIsPreserved) {
  EXPECT_EQ(str(tape::transform_to_node(parse_transform(make_string("upper")))),
    "upper");
  const ordered_node spec = yaml( "{name: truncate, max_length: 5}" );
  EXPECT_TRUE(same(tape::transform_to_node(parse_transform(spec)), spec));
}

} // namespace tape_test
