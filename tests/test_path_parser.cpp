#include "gtest/gtest.h"
#include "jsonkeyspace/path_parser.h"
#include "jsonkeyspace/exceptions.h"

using namespace jsonkeyspace;
using Type = PathParser::PathElement::Type;

TEST(PathParserTest, RootPath) {
    PathParser parser;
    auto elements = parser.parse("$");
    EXPECT_TRUE(elements.empty());
    EXPECT_TRUE(parser.is_valid_path("$"));
}

TEST(PathParserTest, DotSeparatedKeys) {
    PathParser parser;
    auto elements = parser.parse("$.key1.key2");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[0].type, Type::KEY);
    EXPECT_EQ(elements[0].key_name, "key1");
    EXPECT_EQ(elements[1].type, Type::KEY);
    EXPECT_EQ(elements[1].key_name, "key2");
    EXPECT_FALSE(elements[1].recursive);
}

TEST(PathParserTest, KeyThenArrayIndex) {
    PathParser parser;
    auto elements = parser.parse("$.object[0]");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[0].type, Type::KEY);
    EXPECT_EQ(elements[0].key_name, "object");
    EXPECT_EQ(elements[1].type, Type::INDEX);
    EXPECT_EQ(elements[1].index, 0);
}

TEST(PathParserTest, NegativeArrayIndex) {
    PathParser parser;
    auto elements = parser.parse("$.arr[-1]");
    ASSERT_EQ(elements.size(), 2);
    EXPECT_EQ(elements[1].type, Type::INDEX);
    EXPECT_EQ(elements[1].index, -1);
}

TEST(PathParserTest, QuotedKeyInBrackets) {
    PathParser parser;
    auto elements = parser.parse("$['key with spaces']");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].type, Type::KEY);
    EXPECT_EQ(elements[0].key_name, "key with spaces");
}

TEST(PathParserTest, DoubleQuotedKeyInBrackets) {
    PathParser parser;
    auto elements = parser.parse("$[\"key.with.dots\"]");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].type, Type::KEY);
    EXPECT_EQ(elements[0].key_name, "key.with.dots");
}

TEST(PathParserTest, EscapedQuoteInKey) {
    PathParser parser;
    auto elements = parser.parse("$['it\\'s']");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].key_name, "it's");
}

TEST(PathParserTest, Wildcards) {
    PathParser parser;
    auto dotted = parser.parse("$.a.*");
    ASSERT_EQ(dotted.size(), 2);
    EXPECT_EQ(dotted[1].type, Type::WILDCARD);

    auto bracketed = parser.parse("$.a[*]");
    ASSERT_EQ(bracketed.size(), 2);
    EXPECT_EQ(bracketed[1].type, Type::WILDCARD);
}

TEST(PathParserTest, RecursiveDescent) {
    PathParser parser;
    auto elements = parser.parse("$..name");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].type, Type::KEY);
    EXPECT_EQ(elements[0].key_name, "name");
    EXPECT_TRUE(elements[0].recursive);

    auto any = parser.parse("$..*");
    ASSERT_EQ(any.size(), 1);
    EXPECT_EQ(any[0].type, Type::WILDCARD);
    EXPECT_TRUE(any[0].recursive);

    auto bracket = parser.parse("$..[0]");
    ASSERT_EQ(bracket.size(), 1);
    EXPECT_EQ(bracket[0].type, Type::INDEX);
    EXPECT_TRUE(bracket[0].recursive);
}

TEST(PathParserTest, Slices) {
    PathParser parser;
    auto full = parser.parse("$.arr[1:5:2]");
    ASSERT_EQ(full.size(), 2);
    EXPECT_EQ(full[1].type, Type::SLICE);
    EXPECT_EQ(full[1].start, 1);
    EXPECT_EQ(full[1].end, 5);
    EXPECT_EQ(full[1].step, 2);

    auto open = parser.parse("$.arr[:-1]");
    EXPECT_FALSE(open[1].start.has_value());
    EXPECT_EQ(open[1].end, -1);
    EXPECT_EQ(open[1].step, 1);

    EXPECT_THROW(parser.parse("$.arr[0:2:0]"), InvalidPathException);
    EXPECT_THROW(parser.parse("$.arr[1:2:3:4]"), InvalidPathException);
}

TEST(PathParserTest, Unions) {
    PathParser parser;
    auto indices = parser.parse("$.arr[0, 2,-1]");
    ASSERT_EQ(indices.size(), 2);
    EXPECT_EQ(indices[1].type, Type::UNION);
    EXPECT_EQ(indices[1].union_indices, (std::vector<long long>{0, 2, -1}));

    auto keys = parser.parse("$['a','b c']");
    ASSERT_EQ(keys.size(), 1);
    EXPECT_EQ(keys[0].type, Type::UNION);
    EXPECT_EQ(keys[0].union_keys, (std::vector<std::string>{"a", "b c"}));
}

TEST(PathParserTest, FilterExpression) {
    PathParser parser;
    auto elements = parser.parse("$.items[?(@.price < 10 && @.tags[0] == 'sale' || @.free)]");
    ASSERT_EQ(elements.size(), 2);
    ASSERT_EQ(elements[1].type, Type::FILTER);
    ASSERT_TRUE(elements[1].filter);

    const FilterExpression& filter = *elements[1].filter;
    ASSERT_EQ(filter.any_of.size(), 2);
    ASSERT_EQ(filter.any_of[0].size(), 2);
    ASSERT_EQ(filter.any_of[1].size(), 1);

    const FilterTerm& price = filter.any_of[0][0];
    ASSERT_EQ(price.relative_path.size(), 1);
    EXPECT_EQ(price.relative_path[0].key_name, "price");
    EXPECT_EQ(price.op, FilterTerm::Op::LT);
    EXPECT_EQ(price.literal, json(10));

    const FilterTerm& tag = filter.any_of[0][1];
    ASSERT_EQ(tag.relative_path.size(), 2);
    EXPECT_EQ(tag.relative_path[1].type, Type::INDEX);
    EXPECT_EQ(tag.op, FilterTerm::Op::EQ);
    EXPECT_EQ(tag.literal, json("sale"));

    EXPECT_EQ(filter.any_of[1][0].op, FilterTerm::Op::EXISTS);
}

TEST(PathParserTest, FilterWithJsonLiterals) {
    PathParser parser;
    auto elements = parser.parse("$[?(@.ok == true)]");
    ASSERT_EQ(elements.size(), 1);
    EXPECT_EQ(elements[0].filter->any_of[0][0].literal, json(true));

    auto quoted = parser.parse("$[?(@.name != \"x\")]");
    EXPECT_EQ(quoted[0].filter->any_of[0][0].op, FilterTerm::Op::NE);
    EXPECT_EQ(quoted[0].filter->any_of[0][0].literal, json("x"));
}

TEST(PathParserTest, InvalidPaths) {
    PathParser parser;
    EXPECT_THROW(parser.parse("key"), InvalidPathException);      // Not rooted
    EXPECT_THROW(parser.parse("$."), InvalidPathException);       // Trailing dot
    EXPECT_THROW(parser.parse("$.a[0"), InvalidPathException);    // Unclosed bracket
    EXPECT_THROW(parser.parse("$.a]"), InvalidPathException);     // Stray bracket
    EXPECT_THROW(parser.parse("$.a[]"), InvalidPathException);    // Empty brackets
    EXPECT_THROW(parser.parse("$.a[abc]"), InvalidPathException); // Non-numeric index
    EXPECT_THROW(parser.parse("$.a[1.5]"), InvalidPathException);
    EXPECT_THROW(parser.parse("$['open]"), InvalidPathException);
    EXPECT_THROW(parser.parse("$.a...b"), InvalidPathException);
    EXPECT_THROW(parser.parse("$[?(@.a <> 1)]"), InvalidPathException);
    EXPECT_THROW(parser.parse("$[?(a == 1)]"), InvalidPathException);
    EXPECT_FALSE(parser.is_valid_path("$.a["));
}

TEST(PathParserTest, LegacyRewrite) {
    EXPECT_EQ(PathParser::normalize_path("."), "$");
    EXPECT_EQ(PathParser::normalize_path(""), "$");
    EXPECT_EQ(PathParser::normalize_path(".a.b"), "$.a.b");
    EXPECT_EQ(PathParser::normalize_path("a.b"), "$.a.b");
    EXPECT_EQ(PathParser::normalize_path("[0]"), "$[0]");
    EXPECT_EQ(PathParser::normalize_path("$.a"), "$.a");

    EXPECT_TRUE(PathParser::is_root_path("."));
    EXPECT_TRUE(PathParser::is_root_path("$"));
    EXPECT_FALSE(PathParser::is_root_path("$.a"));
}

TEST(PathParserTest, CompileMarksLegacyPaths) {
    PathParser parser;
    auto legacy = parser.compile(".foo");
    EXPECT_TRUE(legacy.legacy);
    EXPECT_EQ(legacy.original, ".foo");
    EXPECT_EQ(legacy.normalized, "$.foo");
    ASSERT_EQ(legacy.elements.size(), 1);

    auto multi = parser.compile("$.foo");
    EXPECT_FALSE(multi.legacy);

    EXPECT_TRUE(parser.compile(".").is_root());
    EXPECT_THROW(parser.compile("$.foo["), InvalidPathException);
}

TEST(PathParserTest, StaticPathsAndParent) {
    PathParser parser;
    auto path = parser.compile("$.a[2].b");
    EXPECT_TRUE(path.is_static());
    EXPECT_TRUE(path.ends_with_key());

    auto parent = path.parent();
    EXPECT_EQ(parent.normalized, "$.a[2]");
    EXPECT_FALSE(parent.ends_with_key());
    EXPECT_EQ(parent.parent().normalized, "$.a");

    EXPECT_FALSE(parser.compile("$.a.*").is_static());
    EXPECT_FALSE(parser.compile("$..a").is_static());
    EXPECT_FALSE(parser.compile("$..a").ends_with_key());
    EXPECT_THROW(parser.compile("$").parent(), InvalidPathException);
}

TEST(PathParserTest, ReconstructPath) {
    PathParser parser;
    EXPECT_EQ(PathParser::reconstruct_path(parser.parse("$.a[0]['b c']")), "$.a[0]['b c']");
    EXPECT_EQ(PathParser::reconstruct_path(parser.parse("$..x.*")), "$..x.*");
    EXPECT_EQ(PathParser::reconstruct_path(parser.parse("$.a[1:3]")), "$.a[1:3]");
    EXPECT_EQ(PathParser::reconstruct_path(parser.parse("$.a[0,2]")), "$.a[0,2]");
    EXPECT_EQ(PathParser::reconstruct_path(parser.parse("$.a[?(@.b > 1)]")), "$.a[?(@.b > 1)]");
    EXPECT_EQ(PathParser::reconstruct_path({}), "$");
}

TEST(PathParserTest, EscapeKeyIfNeeded) {
    EXPECT_EQ(PathParser::escape_key_if_needed("simple"), "simple");
    EXPECT_EQ(PathParser::escape_key_if_needed("a.b"), "['a.b']");
    EXPECT_EQ(PathParser::escape_key_if_needed("it's"), "['it\\'s']");
    EXPECT_EQ(PathParser::escape_key_if_needed(""), "['']");
}
