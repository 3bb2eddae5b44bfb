#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>

#include "GitCfg/Document.h"
#include "GitCfg/Parser.h"

using namespace GitCfg;
using namespace testing;

class ParserTest : public Test {
protected:
    static std::vector<FormatIssue> ExpectFormatError(const Parser &parser, const std::string &content) {
        try {
            parser.ParseString(content);
        } catch (const FormatError &e) {
            EXPECT_EQ(GITCFG_ERROR_FORMAT, e.code());
            return e.issues();
        }
        ADD_FAILURE() << "Expected FormatError for: " << content;
        return {};
    }

    Parser parser;
};

TEST_F(ParserTest, EmptyInputGivesEmptyDocument) {
    EXPECT_TRUE(parser.ParseString("").IsEmpty());
    EXPECT_TRUE(parser.ParseString("# only a comment\n\n").IsEmpty());
}

TEST_F(ParserTest, ReadsSectionsInOrder) {
    Document doc = parser.ParseString("[core]\n\tbare = false\n[remote \"origin\"]\n\turl = x\n[alias]\n");
    EXPECT_THAT(doc.Sections(), ElementsAre("core", "remote \"origin\"", "alias"));
    EXPECT_EQ("x", doc.GetString("remote \"origin\"", "url"));
}

TEST_F(ParserTest, RepeatedHeaderReusesSection) {
    Document doc = parser.ParseString("[core]\n\ta = 1\n[alias]\n\tst = status\n[core]\n\tb = 2\n");
    EXPECT_THAT(doc.Sections(), ElementsAre("core", "alias"));
    EXPECT_THAT(doc.Options("core"), ElementsAre("a", "b"));
}

TEST_F(ParserTest, RepeatedKeysBecomeMultivar) {
    Document doc = parser.ParseString("[remote \"origin\"]\n\tfetch = a\n\turl = u\n\tfetch = b\n\tFETCH = c\n");
    const OptionValue &fetch = doc.Get("remote \"origin\"", "fetch");
    EXPECT_TRUE(fetch.IsMultivar());
    EXPECT_THAT(fetch.AsList(), ElementsAre("a", "b", "c"));
    EXPECT_THAT(doc.Options("remote \"origin\""), ElementsAre("fetch", "url"));
}

TEST_F(ParserTest, AcceptsMixedIndentation) {
    Document doc = parser.ParseString("[user]\n        name = Артём Анисимов\n\temail = foo@bar.com\nsigningkey = ABC\n");
    EXPECT_EQ("Артём Анисимов", doc.GetString("user", "name"));
    EXPECT_EQ("foo@bar.com", doc.GetString("user", "email"));
    EXPECT_EQ("ABC", doc.GetString("user", "signingkey"));
}

TEST_F(ParserTest, StripsBomAndNormalizesLineEndings) {
    Document doc = parser.ParseString("\xef\xbb\xbf[core]\r\n\tpager = less -R\r\n\tbare = false\r[http]\n");
    EXPECT_EQ("less -R", doc.GetString("core", "pager"));
    EXPECT_EQ("false", doc.GetString("core", "bare"));
    EXPECT_TRUE(doc.HasSection("http"));
}

TEST_F(ParserTest, BareKeyReadsTrue) {
    Document doc = parser.ParseString("[core]\n\tbare\n");
    const OptionValue &value = doc.Get("core", "bare");
    EXPECT_EQ("true", value.GetString());
    EXPECT_TRUE(value.GetItems()[0].implicit);
}

TEST_F(ParserTest, DefaultHeaderFillsDefaults) {
    Document doc = parser.ParseString("[DEFAULT]\n\tcolor = auto\n[core]\n\tbare = false\n");
    EXPECT_THAT(doc.Sections(), ElementsAre("core"));
    EXPECT_TRUE(doc.GetDefaults().HasOption(OptionKey("color")));
    EXPECT_EQ("auto", doc.GetString("core", "color"));
}

TEST_F(ParserTest, OptionBeforeHeaderIsRejected) {
    auto issues = ExpectFormatError(parser, "bare = true\n[core]\n");
    ASSERT_EQ(1u, issues.size());
    EXPECT_EQ(1u, issues[0].lineNumber);
    EXPECT_EQ("bare = true", issues[0].line);
    EXPECT_EQ("option before any section header", issues[0].reason);
}

TEST_F(ParserTest, CollectsEveryBadLine) {
    auto issues = ExpectFormatError(parser, "[core]\n\t= nokey\n\tok = 1\n[broken\n\tok2 = 2\n[]\n");
    ASSERT_EQ(3u, issues.size());
    EXPECT_EQ(2u, issues[0].lineNumber);
    EXPECT_EQ("missing option name", issues[0].reason);
    EXPECT_EQ(4u, issues[1].lineNumber);
    EXPECT_EQ("[broken", issues[1].line);
    EXPECT_EQ(6u, issues[2].lineNumber);
}

TEST_F(ParserTest, ErrorMessageListsLines) {
    try {
        parser.ParseString("[core]\n\t= nokey\n", "test.cfg");
        FAIL() << "Expected FormatError";
    } catch (const FormatError &e) {
        EXPECT_EQ("test.cfg", e.source());
        EXPECT_THAT(e.what(), HasSubstr("test.cfg"));
        EXPECT_THAT(e.what(), HasSubstr("[line 2]"));
        EXPECT_THAT(e.what(), HasSubstr("= nokey"));
    }
}

TEST_F(ParserTest, RejectsInvalidUtf8ByDefault) {
    auto issues = ExpectFormatError(parser, "[core]\n\tname = \xff\xfe\n");
    ASSERT_EQ(1u, issues.size());
    EXPECT_EQ(2u, issues[0].lineNumber);
    EXPECT_EQ("invalid UTF-8", issues[0].reason);
}

TEST_F(ParserTest, AcceptsInvalidUtf8WhenNotStrict) {
    ParseOptions options;
    options.strictUtf8 = false;
    Document doc = Parser(options).ParseString("[core]\n\tname = \xff\xfe\n");
    EXPECT_EQ("\xff\xfe", doc.GetString("core", "name"));
}

TEST_F(ParserTest, RejectsEmbeddedNulEvenWhenNotStrict) {
    const char raw[] = "[core]\n\tname = a\0b\n\tok = 1\n";
    const std::string content(raw, sizeof(raw) - 1);

    auto strictIssues = ExpectFormatError(parser, content);
    ASSERT_EQ(1u, strictIssues.size());
    EXPECT_EQ(2u, strictIssues[0].lineNumber);
    EXPECT_EQ("embedded NUL byte", strictIssues[0].reason);

    ParseOptions options;
    options.strictUtf8 = false;
    auto lenientIssues = ExpectFormatError(Parser(options), content);
    ASSERT_EQ(1u, lenientIssues.size());
    EXPECT_EQ("embedded NUL byte", lenientIssues[0].reason);
}

TEST_F(ParserTest, BareKeyIsIssueWhenValuesRequired) {
    ParseOptions options;
    options.allowNoValue = false;
    auto issues = ExpectFormatError(Parser(options), "[core]\n\tbare\n");
    ASSERT_EQ(1u, issues.size());
    EXPECT_EQ("option has no value", issues[0].reason);
}

TEST_F(ParserTest, ReadsFromStream) {
    std::istringstream in("[http]\n\tsslverify = false\n");
    Document doc = parser.Parse(in, "stream");
    EXPECT_EQ("false", doc.GetString("http", "sslverify"));
}

TEST_F(ParserTest, FailedReadLeavesDocumentUntouched) {
    Document doc;
    doc.ReadString("[core]\n\tbare = false\n");
    Document before = doc;

    EXPECT_THROW(doc.ReadString("orphan = 1\n"), FormatError);
    EXPECT_EQ(before, doc);
}

TEST_F(ParserTest, ReadReplacesContents) {
    Document doc;
    doc.ReadString("[core]\n\tbare = false\n");
    doc.ReadString("[http]\n\tsslverify = false\n");
    EXPECT_THAT(doc.Sections(), ElementsAre("http"));
}
