#include <gtest/gtest.h>

#include <string>
#include <variant>

#include "test_support.hh"

namespace tape_test {

using tape::extract;
using tape::parse_extraction_spec;

namespace {

  ordered_node extracted( const ordered_node& source,
    const std::string& spec )
  {
    return extract( source, parse_extraction_spec(yaml(spec)) );
  }

} // namespace

TEST(Extraction, SpecKinds) {
  EXPECT_TRUE(std::holds_alternative< tape::SimplePath >(
    parse_extraction_spec(yaml("items[0].name"))));
  EXPECT_TRUE(std::holds_alternative< tape::Literal >(
    parse_extraction_spec(yaml("'not a path!'"))));
  EXPECT_TRUE(std::holds_alternative< tape::Literal >(
    parse_extraction_spec(yaml("3"))));
  EXPECT_TRUE(std::holds_alternative< tape::Literal >(
    parse_extraction_spec(yaml("{a: 1}"))));
  EXPECT_TRUE(std::holds_alternative< tape::Structured >(
    parse_extraction_spec(yaml("{path: a, default: 1}"))));
}

TEST(Extraction, SimpleAndLiteral) {
  const ordered_node source = yaml( "{name: root, n: 3}" );
  EXPECT_EQ(str(extracted(source, "name")), "root");
  EXPECT_TRUE(extracted(source, "missing").is_null());
  EXPECT_EQ(str(extracted(source, "'123 not a path'")), "123 not a path");
  EXPECT_EQ(integer(extracted(source, "7")), 7);
}

TEST(Extraction, FallbackAndDefault) {
  const ordered_node source = yaml( "{title: T, name: N}" );
  EXPECT_EQ(str(extracted(source, "{path: heading, fallback: title}")), "T");
  EXPECT_EQ(str(extracted(source, "{path: name, fallback: title}")), "N");
  EXPECT_EQ(str(extracted(source,
    "{path: a, fallback: b, default: none}")), "none");
  EXPECT_EQ(str(extracted(source, "{default: fixed}")), "fixed");
}

TEST(Extraction, TransformBeforeFilter) {
  const ordered_node source = yaml( "{words: [hello, world]}" );
  const ordered_node out = extracted( source,
    "{path: words, transform: upper, filter: {startswith: H}}" );
  EXPECT_TRUE(same(out, yaml("[HELLO]")));
}

TEST(Extraction, FilterThenMap) {
  const ordered_node source = yaml( R"(
items:
  - {name: a, keep: true}
  - {name: b, keep: false}
  - {name: c, keep: true}
)" );
  const ordered_node out = extracted( source, R"(
path: items
filter: {keep: true}
map:
  template: {label: '${item.name}'}
)" );
  EXPECT_TRUE(same(out, yaml("[{label: a}, {label: c}]")));
}

TEST(Extraction, FilterAndMapSkipNonLists) {
  const ordered_node source = yaml( "{name: solo}" );
  EXPECT_EQ(str(extracted(source,
    "{path: name, filter: {x: 1}, map: {template: 1}}")), "solo");
}

TEST(Extraction, DefaultFeedsTransform) {
  const ordered_node source = yaml( "{}" );
  EXPECT_EQ(integer(extracted(source,
    "{path: items, default: [1, 2, 3], transform: length}")), 3);
}

TEST(Extraction, CallableSpec) {
  const tape::ExtractionSpec spec = tape::callable_spec(
    []( const ordered_node& n ) {
      return tape::internal::make_int( static_cast< std::int64_t >(n.size()) );
    } );
  EXPECT_EQ(integer(extract(yaml("{a: 1, b: 2}"), spec)), 2);
  EXPECT_THROW(tape::spec_to_node(spec), tape::SpecError);
}

TEST(Extraction, Errors) {
  EXPECT_THROW(parse_extraction_spec(yaml("{path: a, trasnform: upper}")),
    tape::SpecError);
  EXPECT_THROW(parse_extraction_spec(yaml("{path: 'items['}")),
    tape::SyntaxError);
  EXPECT_THROW(parse_extraction_spec(yaml("{path: 3}")), tape::SpecError);
  EXPECT_THROW(extracted(yaml("{n: 3}"), "{path: n, transform: upper}"),
    tape::TypeMismatch);
}

TEST(Extraction, SerializedFormIsPreserved) {
  for ( const std::string text : { "name", "42",
    "{path: a, fallback: b, default: c, transform: upper}",
    "{path: xs, filter: {k: 1}, map: {template: '${item}', variable: it}}" } )
  {
    const ordered_node spec = yaml( text );
    EXPECT_TRUE(same(tape::spec_to_node(parse_extraction_spec(spec)), spec))
      << text;
  }
}

} // namespace tape_test
