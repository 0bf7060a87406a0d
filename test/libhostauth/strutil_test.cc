#include <config.h>

#include <hostauth/strutl.h>

#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

TEST(StrUtilTest,StringStrip)
{
   EXPECT_EQ("", HostAuth::String::Strip(""));
   EXPECT_EQ("foobar", HostAuth::String::Strip("foobar"));
   EXPECT_EQ("foo bar", HostAuth::String::Strip("foo bar"));

   EXPECT_EQ("", HostAuth::String::Strip("  "));
   EXPECT_EQ("", HostAuth::String::Strip(" \r\n   \t "));

   EXPECT_EQ("foo bar", HostAuth::String::Strip("foo bar "));
   EXPECT_EQ("foo bar", HostAuth::String::Strip("foo bar \r\n \t "));
   EXPECT_EQ("foo bar", HostAuth::String::Strip("\r\n \t foo bar"));
   EXPECT_EQ("bar foo", HostAuth::String::Strip("\r\n \t bar foo \r\n \t "));
   EXPECT_EQ("bar \t\r\n foo", HostAuth::String::Strip("\r\n \t bar \t\r\n foo \r\n \t "));
}
TEST(StrUtilTest,StartsWith)
{
   using HostAuth::String::Startswith;
   EXPECT_TRUE(Startswith("abcd", "a"));
   EXPECT_TRUE(Startswith("abcd", "ab"));
   EXPECT_TRUE(Startswith("abcd", "abcd"));
   EXPECT_FALSE(Startswith("abcd", "x"));
   EXPECT_FALSE(Startswith("abcd", "abcndefg"));
   EXPECT_TRUE(Startswith("~/.netrc", "~/"));
}
TEST(StrUtilTest,SubstVar)
{
   EXPECT_EQ("", SubstVar("", "fails", "passes"));
   EXPECT_EQ("test ", SubstVar("test fails", "fails", ""));
   EXPECT_EQ("test passes", SubstVar("test passes", "", "fails"));

   EXPECT_EQ("test passes", SubstVar("test passes", "fails", "passes"));
   EXPECT_EQ("test passes", SubstVar("test fails", "fails", "passes"));

   EXPECT_EQ("starts with", SubstVar("beginnt with", "beginnt", "starts"));
   EXPECT_EQ("is in middle", SubstVar("is in der middle", "in der", "in"));
   EXPECT_EQ("does end", SubstVar("does enden", "enden", "end"));

   EXPECT_EQ("bb", SubstVar("bb", "aa", "a"));
   EXPECT_EQ("aa", SubstVar("aaaa", "aa", "a"));
   EXPECT_EQ("aaaa", SubstVar("aa", "a", "aa"));
   EXPECT_EQ("a a a a ", SubstVar("aaaa", "a", "a "));
   EXPECT_EQ(" bb a bb a bb a bb ", SubstVar(" aaa a aaa a aaa a aaa ", "aaa", "bb"));

   EXPECT_EQ("line one\nline two", SubstVar("line one\r\nline two", "\r\n", "\n"));
}
TEST(StrUtilTest,DeQuoteString)
{
   EXPECT_EQ("", DeQuoteString(""));
   EXPECT_EQ("K\xc3\xb6ln", DeQuoteString("K%c3%b6ln"));
   EXPECT_EQ("K\xc3\xb6ln", DeQuoteString("K%C3%B6ln"));
   EXPECT_EQ("p:s/s%", DeQuoteString("p%3as%2fs%25"));
   EXPECT_EQ("al@ice", DeQuoteString("al%40ice"));
   EXPECT_EQ("with space", DeQuoteString("with%20space"));
   // broken escapes are kept as they are
   EXPECT_EQ("100%", DeQuoteString("100%"));
   EXPECT_EQ("%4", DeQuoteString("%4"));
   EXPECT_EQ("%zz", DeQuoteString("%zz"));
   EXPECT_EQ("%%41", DeQuoteString("%%2541"));
}
TEST(StrUtilTest,StringToBool)
{
   EXPECT_EQ(1, StringToBool("1"));
   EXPECT_EQ(0, StringToBool("0"));
   EXPECT_EQ(1, StringToBool("yes"));
   EXPECT_EQ(1, StringToBool("TRUE"));
   EXPECT_EQ(1, StringToBool("Enable"));
   EXPECT_EQ(0, StringToBool("no"));
   EXPECT_EQ(0, StringToBool("Off"));
   EXPECT_EQ(0, StringToBool("without"));
   EXPECT_EQ(-1, StringToBool("2"));
   EXPECT_EQ(-1, StringToBool("maybe"));
   EXPECT_EQ(0, StringToBool("1x", 0));
   EXPECT_EQ(-1, StringToBool(""));
   EXPECT_EQ(1, StringToBool("", 1));
}
TEST(StrUtilTest,VectorizeString)
{
   EXPECT_TRUE(VectorizeString("", ',').empty());

   auto vec = VectorizeString("foo", ',');
   ASSERT_EQ(1u, vec.size());
   EXPECT_EQ("foo", vec[0]);

   vec = VectorizeString("foo,bar,,baz", ',');
   ASSERT_EQ(4u, vec.size());
   EXPECT_EQ("foo", vec[0]);
   EXPECT_EQ("bar", vec[1]);
   EXPECT_EQ("", vec[2]);
   EXPECT_EQ("baz", vec[3]);

   vec = VectorizeString("Dir::Auth::Netrc", ':');
   ASSERT_EQ(5u, vec.size());
   EXPECT_EQ("Dir", vec[0]);
   EXPECT_EQ("", vec[1]);
   EXPECT_EQ("Netrc", vec[4]);
}
TEST(StrUtilTest,ioprintf)
{
   std::ostringstream out;
   ioprintf(out, "%s:%d", "example.com", 8443);
   EXPECT_EQ("example.com:8443", out.str());
   std::string const longText(5000, 'x');
   out.str("");
   ioprintf(out, "No credentials for %s", longText.c_str());
   EXPECT_EQ("No credentials for " + longText, out.str());
   out.str("");
   ioprintf(out, "%s", "");
   EXPECT_EQ("", out.str());
}
