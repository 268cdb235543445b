#include <algorithm>
#include <core/util/wordlist.h>
#include <gtest/gtest.h>

using namespace wormhole::core;

TEST(WordlistTest, GeneratedCodesAreValid) {
    auto wordlist = Wordlist::Default(3);
    for (int i = 0; i < 20; ++i) {
        auto code = GenerateCode(17, wordlist);
        EXPECT_TRUE(IsValidCode(code)) << code;
        EXPECT_EQ(ParseNameplate(code), 17);
        EXPECT_EQ(std::count(code.begin(), code.end(), '-'), 3);
    }
}

TEST(WordlistTest, WordPositionsAlternateLists) {
    Wordlist wordlist(4, {{"even"}, {"odd"}});
    EXPECT_EQ(wordlist.ChooseWords(), "even-odd-even-odd");
}

TEST(WordlistTest, RejectsEmptyLists) {
    EXPECT_THROW(Wordlist(2, {}), std::invalid_argument);
    EXPECT_THROW(Wordlist(2, {{"a"}, {}}), std::invalid_argument);
}

TEST(WordlistTest, ValidatesCodes) {
    EXPECT_TRUE(IsValidCode("7-crossover-clockwork"));
    EXPECT_TRUE(IsValidCode("12-a"));
    EXPECT_FALSE(IsValidCode(""));
    EXPECT_FALSE(IsValidCode("crossover-clockwork"));
    EXPECT_FALSE(IsValidCode("7"));
    EXPECT_FALSE(IsValidCode("7-"));
    EXPECT_FALSE(IsValidCode("7--clockwork"));
    EXPECT_FALSE(IsValidCode("7-crossover-"));
    EXPECT_FALSE(IsValidCode("0-crossover"));
    EXPECT_FALSE(IsValidCode("-3-crossover"));
    EXPECT_FALSE(IsValidCode("7-cross over"));
}

TEST(WordlistTest, ParsesNameplate) {
    EXPECT_EQ(ParseNameplate("42-apple"), 42);
    EXPECT_FALSE(ParseNameplate("x1-apple"));
    EXPECT_FALSE(ParseNameplate("-apple"));
}

TEST(WordlistTest, CompletesWordUnderCursor) {
    auto wordlist = Wordlist::Default();
    EXPECT_EQ(wordlist.GetCompletions("7-crosso"), std::vector<std::string>{"7-crossover"});
    EXPECT_EQ(wordlist.GetCompletions("7-crossover-clockw"),
              std::vector<std::string>{"7-crossover-clockwork"});
    EXPECT_TRUE(wordlist.GetCompletions("7").empty());
    EXPECT_TRUE(wordlist.GetCompletions("7-zzz").empty());
}

TEST(WordlistTest, SelectsListByPosition) {
    Wordlist wordlist(2, {{"even"}, {"odd"}});
    EXPECT_EQ(wordlist.GetWordlist("7-"), wordlist.words()[0]);
    EXPECT_EQ(wordlist.GetWordlist("7-even-"), wordlist.words()[1]);
    EXPECT_EQ(wordlist.GetWordlist("7-even-od", 3), wordlist.words()[0]);
}

// Completion draws the word at position i from the list generation uses for it, so the first
// word never completes from the odd list.
TEST(WordlistTest, CompletionFollowsGenerationOrder) {
    auto wordlist = Wordlist::Default(2);
    EXPECT_TRUE(wordlist.GetCompletions("22-chisel").empty());
    EXPECT_EQ(wordlist.GetCompletions("22-crossover-chis"),
              std::vector<std::string>{"22-crossover-chisel"});
    for (int i = 0; i < 20; ++i) {
        auto code = wordlist.ChooseWords();
        auto first = code.substr(0, code.find('-'));
        auto hits = wordlist.GetCompletions("1-" + first);
        EXPECT_NE(std::find(hits.begin(), hits.end(), "1-" + first), hits.end()) << code;
    }
}

TEST(WordlistTest, ExtractsPartialWord) {
    EXPECT_EQ(ExtractPartialFromPrefix("7-crossover-clock", 17), "clock");
    EXPECT_EQ(ExtractPartialFromPrefix("7-crossover-clock", 5), "crossover");
    EXPECT_EQ(ExtractPartialFromPrefix("7", 1), "7");
}

TEST(WordlistTest, CompleteCodeExpandsUnambiguousPrefixes) {
    auto wordlist = Wordlist::Default();
    EXPECT_EQ(CompleteCode("7-cros-clockw", wordlist), "7-crossover-clockwork");
    EXPECT_EQ(CompleteCode("7-cros-cl", wordlist), "7-crossover-cl");
    EXPECT_EQ(CompleteCode("7-crossover-clockwork", wordlist), "7-crossover-clockwork");
    EXPECT_EQ(CompleteCode("7", wordlist), "7");
}
