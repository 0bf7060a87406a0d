#include <config.h>

#include <hostauth/error.h>

#include <sstream>
#include <string>
#include <errno.h>
#include <stddef.h>
#include <string.h>

#include <gtest/gtest.h>

TEST(GlobalErrorTest,BasicDiscard)
{
   GlobalError e;
   EXPECT_TRUE(e.empty());
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.Notice("%s skipped", ".netrc"));
   EXPECT_TRUE(e.empty());
   EXPECT_FALSE(e.empty(GlobalError::DEBUG));
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.Error("Reading %s failed after %d lines", ".git-credentials", 2));
   EXPECT_TRUE(e.PendingError());

   std::string text;
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_TRUE(e.PendingError());
   EXPECT_EQ(".netrc skipped", text);
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_EQ("Reading .git-credentials failed after 2 lines", text);
   EXPECT_TRUE(e.empty(GlobalError::DEBUG));
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.Insert(GlobalError::FATAL, "Reading %s failed after %d lines", ".git-credentials", 2));
   EXPECT_TRUE(e.PendingError());
   EXPECT_FALSE(e.empty(GlobalError::FATAL));
   e.Discard();

   EXPECT_TRUE(e.empty());
   EXPECT_FALSE(e.PendingError());
}
TEST(GlobalErrorTest,DebugMessages)
{
   GlobalError e;
   EXPECT_FALSE(e.Insert(GlobalError::DEBUG, "Reading %s", ".netrc"));
   EXPECT_TRUE(e.empty());
   EXPECT_TRUE(e.empty(GlobalError::NOTICE));
   EXPECT_FALSE(e.empty(GlobalError::DEBUG));
   EXPECT_FALSE(e.PendingError());

   EXPECT_FALSE(e.Insert(GlobalError::NOTICE, "Skipping line %d of %s", 3, ".git-credentials"));
   std::ostringstream out;
   e.DumpErrors(out, GlobalError::DEBUG);
   EXPECT_EQ("D: Reading .netrc\nN: Skipping line 3 of .git-credentials\n", out.str());
   EXPECT_TRUE(e.empty(GlobalError::DEBUG));

   // below the threshold is dropped silently
   EXPECT_FALSE(e.Insert(GlobalError::DEBUG, "Reading %s", ".netrc"));
   std::ostringstream hidden;
   e.DumpErrors(hidden, GlobalError::NOTICE, false);
   EXPECT_EQ("", hidden.str());
   EXPECT_TRUE(e.empty(GlobalError::DEBUG));
}
TEST(GlobalErrorTest,StackPushing)
{
   GlobalError e;
   EXPECT_FALSE(e.Notice("%s skipped", ".netrc"));
   EXPECT_FALSE(e.Error("Reading %s failed after %d lines", ".git-credentials", 2));
   EXPECT_TRUE(e.PendingError());
   EXPECT_FALSE(e.empty(GlobalError::NOTICE));
   e.PushToStack();
   EXPECT_EQ(1u, e.StackCount());
   EXPECT_TRUE(e.empty(GlobalError::NOTICE));
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.Warning("%s is world readable", ".netrc"));
   EXPECT_TRUE(e.empty(GlobalError::ERROR));
   EXPECT_FALSE(e.PendingError());
   e.RevertToStack();
   EXPECT_EQ(0u, e.StackCount());
   EXPECT_FALSE(e.empty(GlobalError::ERROR));
   EXPECT_TRUE(e.PendingError());

   std::string text;
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_TRUE(e.PendingError());
   EXPECT_EQ(".netrc skipped", text);
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_EQ("Reading .git-credentials failed after 2 lines", text);
   EXPECT_FALSE(e.PendingError());
   EXPECT_TRUE(e.empty());

   EXPECT_FALSE(e.Notice("%s skipped", ".netrc"));
   EXPECT_FALSE(e.Error("Reading %s failed after %d lines", ".git-credentials", 2));
   e.PushToStack();
   EXPECT_FALSE(e.Warning("%s is world readable", ".netrc"));
   e.MergeWithStack();
   EXPECT_EQ(0u, e.StackCount());
   EXPECT_FALSE(e.empty(GlobalError::ERROR));
   EXPECT_TRUE(e.PendingError());
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_EQ(".netrc skipped", text);
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_EQ("Reading .git-credentials failed after 2 lines", text);
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.empty());
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_EQ(".netrc is world readable", text);
   EXPECT_TRUE(e.empty());
}
TEST(GlobalErrorTest,StackWithoutPush)
{
   GlobalError e;
   EXPECT_FALSE(e.Error("stray %s", "error"));
   e.RevertToStack();
   EXPECT_TRUE(e.empty(GlobalError::DEBUG));
   EXPECT_FALSE(e.PendingError());

   EXPECT_FALSE(e.Warning("stray %s", "warning"));
   e.MergeWithStack();
   std::string text;
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_EQ("stray warning", text);
}
TEST(GlobalErrorTest,DumpWithStack)
{
   GlobalError e;
   EXPECT_FALSE(e.Warning("outer"));
   e.PushToStack();
   EXPECT_FALSE(e.Error("inner"));

   std::ostringstream inner;
   e.DumpErrors(inner, GlobalError::DEBUG, false);
   EXPECT_EQ("E: inner\n", inner.str());
   EXPECT_TRUE(e.empty(GlobalError::DEBUG));

   e.RevertToStack();
   std::ostringstream outer;
   e.DumpErrors(outer);
   EXPECT_EQ("W: outer\n", outer.str());
}
TEST(GlobalErrorTest,Errno)
{
   GlobalError e;
   std::string const textOfENOENT(strerror(ENOENT));
   errno = ENOENT;
   EXPECT_FALSE(e.Errno("open", "Could not open file %s", "/home/tester/.netrc"));
   EXPECT_FALSE(e.empty());
   EXPECT_TRUE(e.PendingError());
   std::string text;
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_FALSE(e.PendingError());
   EXPECT_EQ(std::string("Could not open file /home/tester/.netrc - open (2: ").append(textOfENOENT).append(")"), text);
   EXPECT_TRUE(e.empty());

   errno = ENOENT;
   EXPECT_FALSE(e.WarningE("open", "Could not open file %s", "/home/tester/.netrc"));
   EXPECT_FALSE(e.PendingError());
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_EQ(std::string("Could not open file /home/tester/.netrc - open (2: ").append(textOfENOENT).append(")"), text);
}
TEST(GlobalErrorTest,LongMessage)
{
   GlobalError e;
   std::string const textOfErrnoZero(strerror(0));
   errno = 0;
   std::string text, longText;
   for (size_t i = 0; i < 500; ++i)
      longText.append("a");
   EXPECT_FALSE(e.Error("%s could not be read in %d tries", longText.c_str(), 2));
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_EQ(longText + " could not be read in 2 tries", text);

   EXPECT_FALSE(e.Errno("read", "%s could not be read in %d tries", longText.c_str(), 2));
   EXPECT_TRUE(e.PopMessage(text));
   EXPECT_EQ(longText + " could not be read in 2 tries - read (0: " + textOfErrnoZero + ")", text);

   EXPECT_FALSE(e.Error("%s could not be read in %d tries", longText.c_str(), 2));
   std::ostringstream out;
   e.DumpErrors(out);
   EXPECT_EQ(std::string("E: ").append(longText).append(" could not be read in 2 tries\n"), out.str());
}
TEST(GlobalErrorTest,MultiLineMessage)
{
   GlobalError e;
   std::string text;

   EXPECT_FALSE(e.Warning("No credentials found.\nChecked %s\r\nand %s", ".git-credentials", ".netrc"));
   EXPECT_FALSE(e.PopMessage(text));
   EXPECT_EQ("No credentials found.\nChecked .git-credentials\r\nand .netrc", text);

   EXPECT_FALSE(e.Warning("No credentials found.\nChecked %s\r\nand %s\n", ".git-credentials", ".netrc"));
   std::ostringstream out;
   e.DumpErrors(out);
   EXPECT_EQ("W: No credentials found.\n   Checked .git-credentials\n   and .netrc\n", out.str());
}
