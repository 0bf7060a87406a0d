#include <config.h>

#include <hostauth/credential.h>

#include <sstream>
#include <string>

#include <gtest/gtest.h>

using HostAuth::Credential;

static std::string Printed(Credential const &cred)
{
   std::ostringstream out;
   out << cred;
   return out.str();
}

TEST(CredentialTest, Empty)
{
   Credential const none;
   EXPECT_TRUE(none.empty());
   EXPECT_EQ("", none.Scope());
   EXPECT_EQ("", none.Username());
   EXPECT_EQ("", none.Password());

   EXPECT_FALSE(Credential("example.com", "", "").empty());
   EXPECT_FALSE(Credential("", "anon", "").empty());
   EXPECT_FALSE(Credential("", "", "token").empty());
}
TEST(CredentialTest, Equality)
{
   Credential const cred("example.com", "alice", "secret");
   EXPECT_EQ(cred, Credential("example.com", "alice", "secret"));
   EXPECT_NE(cred, Credential("example.org", "alice", "secret"));
   EXPECT_NE(cred, Credential("example.com", "bob", "secret"));
   EXPECT_NE(cred, Credential("example.com", "alice", "hunter2"));
   EXPECT_NE(cred, Credential());
   EXPECT_EQ(Credential(), Credential("", "", ""));
}
TEST(CredentialTest, PasswordIsMasked)
{
   EXPECT_EQ("example.com alice:****", Printed(Credential("example.com", "alice", "secret")));
   EXPECT_EQ("(default) anon:****", Printed(Credential("", "anon", "anon")));
   EXPECT_EQ("example.org:8443 bob", Printed(Credential("example.org:8443", "bob", "")));
   EXPECT_EQ(std::string::npos, Printed(Credential("example.com", "alice", "secret")).find("secret"));
}
