#include "gtest/gtest.h"
#include "jsonkeyspace/path_evaluator.h"
#include "jsonkeyspace/exceptions.h"

using namespace jsonkeyspace;

class PathEvaluatorTest : public ::testing::Test {
protected:
    PathParser parser;
    PathEvaluator evaluator;
    json doc;

    void SetUp() override {
        doc = json::parse(R"({
            "name": "store",
            "books": [
                {"title": "A", "price": 8, "tags": ["sale"]},
                {"title": "B", "price": 12.5},
                {"title": "C", "price": 5, "tags": []}
            ],
            "meta": {"name": "inner", "count": 3}
        })");
    }

    std::vector<std::string> matches(const std::string& path) {
        std::vector<std::string> out;
        for (const auto& location : evaluator.evaluate(doc, parser.compile(path))) {
            out.push_back(location.to_string());
        }
        return out;
    }
};

TEST_F(PathEvaluatorTest, RootMatchesWholeDocument) {
    EXPECT_EQ(matches("$"), (std::vector<std::string>{""}));
    EXPECT_EQ(matches("."), (std::vector<std::string>{""}));
}

TEST_F(PathEvaluatorTest, KeysAndIndices) {
    EXPECT_EQ(matches("$.name"), (std::vector<std::string>{"/name"}));
    EXPECT_EQ(matches("$.books[1].title"), (std::vector<std::string>{"/books/1/title"}));
    EXPECT_EQ(matches("$.books[-1]"), (std::vector<std::string>{"/books/2"}));
}

TEST_F(PathEvaluatorTest, MissingOrMistypedStepsMatchNothing) {
    EXPECT_TRUE(matches("$.nope").empty());
    EXPECT_TRUE(matches("$.books[7]").empty());
    EXPECT_TRUE(matches("$.books[-4]").empty());
    EXPECT_TRUE(matches("$.name.inner").empty()); // name is a string
    EXPECT_TRUE(matches("$.meta[0]").empty());    // meta is an object
}

TEST_F(PathEvaluatorTest, WildcardFollowsDocumentOrder) {
    EXPECT_EQ(matches("$.meta.*"), (std::vector<std::string>{"/meta/name", "/meta/count"}));
    EXPECT_EQ(matches("$.books[*].title"),
              (std::vector<std::string>{"/books/0/title", "/books/1/title", "/books/2/title"}));
}

TEST_F(PathEvaluatorTest, RecursiveDescent) {
    EXPECT_EQ(matches("$..name"), (std::vector<std::string>{"/name", "/meta/name"}));
    EXPECT_EQ(matches("$..tags[0]"), (std::vector<std::string>{"/books/0/tags/0"}));
}

TEST_F(PathEvaluatorTest, SlicesAndUnions) {
    EXPECT_EQ(matches("$.books[0:2]"), (std::vector<std::string>{"/books/0", "/books/1"}));
    EXPECT_EQ(matches("$.books[::2]"), (std::vector<std::string>{"/books/0", "/books/2"}));
    EXPECT_EQ(matches("$.books[-2:]"), (std::vector<std::string>{"/books/1", "/books/2"}));
    EXPECT_EQ(matches("$.books[2,0]"), (std::vector<std::string>{"/books/2", "/books/0"}));
    EXPECT_EQ(matches("$.meta['count','missing','name']"),
              (std::vector<std::string>{"/meta/count", "/meta/name"}));
}

TEST_F(PathEvaluatorTest, SliceWithHugeStepStopsAfterFirstElement) {
    EXPECT_EQ(matches("$.books[1:5:9223372036854775807]"), (std::vector<std::string>{"/books/1"}));
    EXPECT_EQ(matches("$.books[0:3:2]"), (std::vector<std::string>{"/books/0", "/books/2"}));
}

TEST_F(PathEvaluatorTest, Filters) {
    EXPECT_EQ(matches("$.books[?(@.price < 10)].title"),
              (std::vector<std::string>{"/books/0/title", "/books/2/title"}));
    EXPECT_EQ(matches("$.books[?(@.tags)]"), (std::vector<std::string>{"/books/0", "/books/2"}));
    EXPECT_EQ(matches("$.books[?(@.title == 'B' || @.price >= 8 && @.tags[0] == 'sale')]"),
              (std::vector<std::string>{"/books/0", "/books/1"}));
    // Ordering between a string and a number never holds
    EXPECT_TRUE(matches("$.books[?(@.title > 1)]").empty());
}

TEST_F(PathEvaluatorTest, LegacyPathReturnsFirstMatchOnly) {
    EXPECT_EQ(matches("books[*].title"), (std::vector<std::string>{"/books/0/title"}));
    EXPECT_EQ(matches("$.books[*].title").size(), 3);
    EXPECT_TRUE(matches("..missing").empty());
}

TEST_F(PathEvaluatorTest, EvaluationDoesNotModifyDocument) {
    json before = doc;
    matches("$..*");
    matches("$.books[?(@.price > 100)]");
    EXPECT_EQ(doc, before);
}

TEST_F(PathEvaluatorTest, InvalidPathThrows) {
    EXPECT_THROW(matches("$.books[?(@.price <)]"), InvalidPathException);
}
