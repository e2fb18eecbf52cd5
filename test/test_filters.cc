#include <gtest/gtest.h>

#include <string>

#include "test_support.hh"

namespace tape_test {

using tape::filter_collection;
using tape::parse_predicate;

namespace {

  ordered_node filtered( const ordered_node& items,
    const std::string& predicate )
  {
    return filter_collection( items, parse_predicate(yaml(predicate)) );
  }

  const char* PEOPLE = R"(
- {name: ada, age: 36, role: admin, tags: [math, code]}
- {name: bob, age: 17, role: user}
- {name: cy, age: 52, role: user, nick: null}
- {name: dee, age: 29, role: guest, tags: []}
)";

  std::string names( const ordered_node& list ) {
    std::string out;
    for ( const auto& item : list ) {
      if ( !out.empty() ) out += ",";
      out += str( item.at("name") );
    }
    return out;
  }

} // namespace

TEST(Filters, LiteralEquality) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{role: user}")), "bob,cy");
  EXPECT_EQ(names(filtered(people, "{role: user, age: 52}")), "cy");
}

TEST(Filters, ComparisonOperators) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{age: {gte: 29, lt: 52}}")), "ada,dee");
  EXPECT_EQ(names(filtered(people, "{age: {gt: 50}}")), "cy");
  EXPECT_EQ(names(filtered(people, "{name: {ne: bob, lte: cy}}")), "ada,cy");
  EXPECT_THROW(filtered(people, "{age: {gt: ten}}"), tape::TypeMismatch);
}

TEST(Filters, StringOperators) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{name: {startswith: b}}")), "bob");
  EXPECT_EQ(names(filtered(people, "{name: {endswith: e}}")), "dee");
  EXPECT_EQ(names(filtered(people, "{role: {contains: se}}")), "bob,cy");
  EXPECT_EQ(names(filtered(people, "{name: {matches: '^[ab]'}}")), "ada,bob");
  EXPECT_EQ(names(filtered(people, "{age: {startswith: '1'}}")), "bob");
}

TEST(Filters, Membership) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{role: {in: [admin, guest]}}")),
    "ada,dee");
  EXPECT_EQ(names(filtered(people, "{role: {not_in: [admin, guest]}}")),
    "bob,cy");
  EXPECT_EQ(names(filtered(people, "{name: {in: 'bobcat'}}")), "bob");
  EXPECT_EQ(names(filtered(people, "{role: {in: {user: 1}}}")), "bob,cy");
  EXPECT_THROW(filtered(people, "{role: {in: 3}}"), tape::TypeMismatch);
}

TEST(Filters, Discriminants) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{tags: {is_none: true}}")), "bob,cy");
  EXPECT_EQ(names(filtered(people, "{tags: {is_not_none: true}}")), "ada,dee");
  EXPECT_EQ(names(filtered(people, "{tags: {is_none: false}}")), "ada,dee");
  EXPECT_EQ(names(filtered(people, "{tags: {type: list}}")), "ada,dee");
  EXPECT_EQ(names(filtered(people, "{age: {type: int}}")),
    "ada,bob,cy,dee");
}

TEST(Filters, BooleanCombinators) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people,
    "{or: [{role: admin}, {age: {lt: 20}}]}")), "ada,bob");
  EXPECT_EQ(names(filtered(people,
    "{and: [{role: user}, {not: {name: bob}}]}")), "cy");
  EXPECT_EQ(names(filtered(people, "{not: {role: user}}")), "ada,dee");
}

TEST(Filters, OperatorOnItemItself) {
  const ordered_node words = yaml( "[Hello, world, Hi]" );
  EXPECT_TRUE(same(filtered(words, "{startswith: H}"), yaml("[Hello, Hi]")));

  const ordered_node odd = yaml( "[{startswith: x}, {startswith: y}]" );
  EXPECT_EQ(filtered(odd, "{\"['startswith']\": y}").size(), 1u);
  EXPECT_EQ(filtered(odd, "{startswith: y}").size(), 1u);
}

TEST(Filters, OperatorNamedFieldsOnMappings) {
  const ordered_node nodes = yaml( R"(
- {type: a, n: 1}
- {type: b, n: 2}
- {type: comment, n: 3}
)" );
  const ordered_node kept = filtered( nodes, "{type: a}" );
  ASSERT_EQ(kept.size(), 1u);
  EXPECT_EQ(integer(kept[0].at("n")), 1);

  EXPECT_EQ(filtered(nodes, "{type: {not_in: [b, comment]}}").size(), 1u);
  EXPECT_EQ(filtered(nodes, "{type: {in: [a, b]}, n: {gt: 1}}").size(), 1u);
  EXPECT_EQ(filtered(nodes, "{type: {startswith: c}}").size(), 1u);

  // Scalars have no fields, so the same key still tests the item's kind
  const ordered_node mixed = yaml( "[1, two, 3.0]" );
  EXPECT_TRUE(same(filtered(mixed, "{type: int}"), yaml("[1]")));
}

TEST(Filters, StringOperatorsSeeNullAsEmpty) {
  const ordered_node people = yaml( PEOPLE );
  EXPECT_EQ(names(filtered(people, "{nick: {startswith: N}}")), "");
  EXPECT_EQ(names(filtered(people, "{nick: {contains: one}}")), "");
  EXPECT_EQ(names(filtered(people, "{nick: {matches: '^$'}}")),
    "ada,bob,cy,dee");
}

TEST(Filters, IsPure) {
  const ordered_node people = yaml( PEOPLE );
  const ordered_node before = people;
  const ordered_node out = filtered( people, "{role: user}" );

  EXPECT_TRUE(same(people, before));
  EXPECT_LE(out.size(), people.size());
  const tape::Predicate pred = parse_predicate( yaml("{role: user}") );
  for ( const auto& item : out ) {
    EXPECT_TRUE(tape::internal::evaluate_predicate(item, pred));
  }
}

TEST(Filters, RejectsBadSpecs) {
  EXPECT_THROW(parse_predicate(yaml("{age: {between: [1, 2]}}")),
    tape::SpecError);
  EXPECT_THROW(parse_predicate(yaml("{name: {matches: '('}}")),
    tape::SpecError);
  EXPECT_THROW(parse_predicate(yaml("{name: {startswith: 3}}")),
    tape::SpecError);
  EXPECT_THROW(parse_predicate(yaml("{and: {role: user}}")), tape::SpecError);
  EXPECT_THROW(parse_predicate(yaml("[1]")), tape::SpecError);
  EXPECT_THROW(parse_predicate(yaml("{'items[': 1}")), tape::SyntaxError);
}

TEST(Filters, RequiresList) {
  const tape::Predicate pred = parse_predicate( yaml("{a: 1}") );
  EXPECT_THROW(filter_collection(yaml("{a: 1}"), pred), tape::TypeMismatch);
}

TEST(Filters, SerializedFormIsPreserved) {
  const ordered_node spec = yaml( "{role: user, age: {gt: 3}}" );
  EXPECT_TRUE(same(tape::predicate_to_node(parse_predicate(spec)), spec));
}

} // namespace tape_test
