#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

#include "test_support.hh"

namespace tape_test {

using tape::Adapter;
using tape::DefinitionLibrary;
using tape::Node;

TEST(Library, ListsBuiltinsSorted) {
  const std::vector< std::string > names = DefinitionLibrary::instance()
    .names();
  EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
  for ( const std::string builtin : { "3viz", "mdast", "unist" } ) {
    EXPECT_NE(std::find(names.begin(), names.end(), builtin), names.end())
      << builtin;
  }
  EXPECT_TRUE(DefinitionLibrary::instance().has("mdast"));
  EXPECT_FALSE(DefinitionLibrary::instance().has("json"));
}

TEST(Library, DefaultFormatIsDefaults) {
  EXPECT_TRUE(DefinitionLibrary::instance().get("3viz")
    == tape::Definition::defaults());
}

TEST(Library, UnknownNameListsAvailable) {
  try {
    DefinitionLibrary::instance().get( "asciidoc" );
    FAIL() << "expected SpecError";
  }
  catch ( const tape::SpecError& ex ) {
    const std::string what = ex.what();
    EXPECT_NE(what.find("asciidoc"), std::string::npos);
    EXPECT_NE(what.find("mdast"), std::string::npos);
  }
}

TEST(Library, AdaptsMdast) {
  const Adapter adapter( DefinitionLibrary::instance().get("mdast") );
  const Node root = adapter.convert_tree( yaml(R"(
type: root
children:
  - type: heading
    depth: 1
    children: [{type: text, value: Title}]
  - type: html
    value: "<br>"
  - type: paragraph
    children:
      - {type: text, value: "Some text", position: {start: {line: 3}}}
      - type: link
        url: "https://example.org"
        children: [{type: text, value: here}]
)") );

  EXPECT_EQ(root.label(), "Document");
  EXPECT_EQ(*root.icon(), "⧉");
  ASSERT_EQ(root.children().size(), 2u);

  const Node& heading = root.children()[0];
  EXPECT_EQ(heading.label(), "Title");
  EXPECT_EQ(*heading.icon(), "⊤");

  const Node& paragraph = root.children()[1];
  EXPECT_EQ(paragraph.label(), "paragraph");
  ASSERT_EQ(paragraph.children().size(), 2u);
  EXPECT_EQ(paragraph.children()[0].label(), "Some text");
  EXPECT_EQ(integer(paragraph.children()[0].source_location()), 3);
  EXPECT_EQ(paragraph.children()[1].label(), "https://example.org");
}

TEST(Library, AdaptsUnist) {
  const Adapter adapter( DefinitionLibrary::instance().get("unist") );
  const Node root = adapter.convert_tree( yaml(R"(
type: root
children:
  - {type: leaf, value: "a leaf", data: {k: v}}
)") );
  EXPECT_EQ(root.label(), "root");
  ASSERT_EQ(root.children().size(), 1u);
  EXPECT_EQ(root.children()[0].label(), "a leaf");
  EXPECT_EQ(str(root.children()[0].extra().at("k")), "v");
}

TEST(Library, LoadDefinitionFallsBackToFiles) {
  EXPECT_TRUE(tape::load_definition("unist")
    == DefinitionLibrary::instance().get("unist"));
  EXPECT_THROW(tape::load_definition("no/such/file.yaml"), tape::SpecError);
}

TEST(Library, RegistersDefinitionsAtRuntime) {
  DefinitionLibrary& library = DefinitionLibrary::mutable_instance();
  const tape::Definition custom = tape::Definition::from_yaml(
    "{label: title, icons: {slide: S}}" );
  library.register_definition( "slides", custom );

  EXPECT_TRUE(DefinitionLibrary::instance().has("slides"));
  EXPECT_TRUE(DefinitionLibrary::instance().get("slides") == custom);
  EXPECT_TRUE(tape::load_definition("slides") == custom);
  const std::vector< std::string > names = library.names();
  EXPECT_NE(std::find(names.begin(), names.end(), "slides"), names.end());

  const Node node = Adapter( tape::load_definition("slides") )
    .convert_tree( yaml("{type: slide, title: Intro}") );
  EXPECT_EQ(node.label(), "Intro");
  EXPECT_EQ(*node.icon(), "S");

  EXPECT_THROW(library.register_definition("", custom), tape::SpecError);
}

} // namespace tape_test
