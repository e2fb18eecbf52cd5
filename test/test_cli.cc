#include <gtest/gtest.h>

#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "test_support.hh"

namespace tape_test {

using tape::run_cli;

namespace {

  struct CliRun {
    int status;
    std::string out;
    std::string err;
  };

  CliRun run( const std::vector< std::string >& args,
    const std::string& input = "" )
  {
    std::istringstream in( input );
    std::ostringstream out;
    std::ostringstream err;
    const int status = run_cli( args, in, out, err );
    return CliRun{ status, out.str(), err.str() };
  }

} // namespace

TEST(Cli, WrongArgumentCountPrintsUsage) {
  const CliRun none = run( {} );
  EXPECT_EQ(none.status, 2);
  EXPECT_TRUE(none.out.empty());
  EXPECT_EQ(none.err.rfind("usage: tape", 0), 0u);

  EXPECT_EQ(run({ "3viz", "a.yaml", "extra" }).status, 2);
}

TEST(Cli, ConvertsStandardInput) {
  const CliRun ok = run( { "3viz" },
    "{type: doc, label: Top, children: [{type: text, label: leaf}]}" );
  ASSERT_EQ(ok.status, 0) << ok.err;
  EXPECT_TRUE(ok.err.empty());
  EXPECT_NE(ok.out.find("Top"), std::string::npos);
  EXPECT_NE(ok.out.find("leaf"), std::string::npos);
  EXPECT_NE(ok.out.find("children"), std::string::npos);
}

TEST(Cli, ReadsSourceFile) {
  const std::string path = ::testing::TempDir() + "tape_cli_source.yaml";
  {
    std::ofstream file( path );
    file << "type: root\nchildren:\n  - {type: leaf, value: leafvalue}\n";
  }
  const CliRun ok = run( { "unist", path } );
  ASSERT_EQ(ok.status, 0) << ok.err;
  EXPECT_NE(ok.out.find("leafvalue"), std::string::npos);
}

TEST(Cli, ErrorsExitWithStatusOne) {
  const CliRun missing = run( { "no/such/definition.yaml" }, "{}" );
  EXPECT_EQ(missing.status, 1);
  EXPECT_TRUE(missing.out.empty());
  EXPECT_EQ(missing.err.rfind("[tape] error: ", 0), 0u);

  const CliRun bad_source = run( { "3viz" }, "[unclosed" );
  EXPECT_EQ(bad_source.status, 1);
  EXPECT_EQ(bad_source.err.rfind("[tape] error: ", 0), 0u);

  const CliRun bad_tree = run( { "3viz" }, "{type: a, children: {x: 1}}" );
  EXPECT_EQ(bad_tree.status, 1);
  EXPECT_NE(bad_tree.err.find("children"), std::string::npos);
}

} // namespace tape_test
