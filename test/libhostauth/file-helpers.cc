#include <hostauth/fileutl.h>

#include <string>
#include <utility>

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static std::string temporaryDirectory()
{
   char const * const tmpdir = getenv("TMPDIR");
   if (tmpdir != nullptr && strlen(tmpdir) != 0)
      return tmpdir;
   return "/tmp";
}
// write all of content to fd, as the library has no writing code
static bool writeContent(int const fd, char const * const content)
{
   if (content == nullptr)
      return true;
   size_t todo = strlen(content);
   char const * data = content;
   while (todo != 0)
   {
      ssize_t const res = write(fd, data, todo);
      if (res < 0)
	 return false;
      todo -= res;
      data += res;
   }
   return true;
}

std::string combinePath(std::string const &dir, std::string const &name)
{
   if (dir.empty() || dir.back() == '/')
      return dir + name;
   return dir + '/' + name;
}
void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = temporaryDirectory().append("/hostauth-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/hostauth-tests-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_EQ(0, system(std::string("rm -rf ").append(dir).c_str()));
}
void helperCreateFile(std::string const &dir, std::string const &name, char const * const content)
{
   int const fd = open(combinePath(dir, name).c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600);
   ASSERT_NE(-1, fd);
   EXPECT_TRUE(writeContent(fd, content));
   ASSERT_EQ(0, close(fd));
}

static std::string writeTemporaryFile(std::string const &id, char const * const content)
{
   std::string const strtempfile = temporaryDirectory().append("/hostauth-").append(id).append(".XXXXXX");
   char * tempfile = strdup(strtempfile.c_str());
   int const fd = mkstemp(tempfile);
   std::string const filename = tempfile;
   free(tempfile);
   EXPECT_NE(-1, fd);
   if (fd == -1)
      return "";
   EXPECT_TRUE(writeContent(fd, content));
   EXPECT_EQ(0, close(fd));
   return filename;
}
void openTemporaryFile(std::string const &id, FileFd &fd, char const * const content, bool const ImmediateUnlink)
{
   std::string const filename = writeTemporaryFile(id, content);
   EXPECT_FALSE(filename.empty());
   EXPECT_TRUE(fd.Open(filename));
   if (ImmediateUnlink)
      EXPECT_EQ(0, unlink(filename.c_str()));
}
ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) : _filename{std::move(sfd._filename)}
{
   sfd._filename.clear();
}
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd)
{
   std::swap(_filename, sfd._filename);
   return *this;
}
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      unlink(_filename.c_str());
}
[[nodiscard]] ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content)
{
   std::string const filename = writeTemporaryFile(id, content);
   EXPECT_FALSE(filename.empty());
   return ScopedFileDeleter{filename};
}
