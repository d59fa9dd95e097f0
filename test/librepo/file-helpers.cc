#include <repo-pkg/fileutl.h>

#include <string>

#include <fcntl.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <gtest/gtest.h>

#include "file-helpers.h"

static std::string tempDir()
{
   char const * const tmpdir = getenv("TMPDIR");
   if (tmpdir != nullptr && *tmpdir != '\0' && DirectoryExists(tmpdir) == true)
      return tmpdir;
   return "/tmp";
}
void helperCreateTemporaryDirectory(std::string const &id, std::string &dir)
{
   std::string const strtempdir = tempDir().append("/repo-tests-").append(id).append(".XXXXXX");
   char * tempdir = strdup(strtempdir.c_str());
   ASSERT_STREQ(tempdir, mkdtemp(tempdir));
   dir = tempdir;
   free(tempdir);
}
void helperRemoveDirectory(std::string const &dir)
{
   // basic sanity check to avoid removing random directories based on earlier failures
   if (dir.find("/repo-tests-") == std::string::npos || dir.find_first_of("*?") != std::string::npos)
      FAIL() << "Directory '" << dir << "' seems invalid. It is therefore not removed!";
   else
      ASSERT_TRUE(RemoveDirectoryTree("helperRemoveDirectory", dir));
}
void helperCreateFile(std::string const &dir, std::string const &name)
{
   std::string file = dir;
   file.append("/");
   file.append(name);
   int const fd = creat(file.c_str(), 0600);
   ASSERT_NE(-1, fd);
   close(fd);
}
void helperCreateFileWithContent(std::string const &dir, std::string const &name, std::string const &content)
{
   FileFd fd;
   ASSERT_TRUE(fd.Open(flCombine(dir, name), FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644));
   ASSERT_TRUE(fd.Write(content.data(), content.size()));
   ASSERT_TRUE(fd.Close());
}
void helperCreateDirectory(std::string const &dir, std::string const &name)
{
   std::string file = dir;
   file.append("/");
   file.append(name);
   ASSERT_TRUE(CreateDirectory(dir, file));
}

std::string readFile(std::string const &file)
{
   std::string content;
   FileFd fd;
   if (fd.Open(file, FileFd::ReadOnly, FileFd::Extension) == false)
      return content;
   char buffer[4096];
   unsigned long long actual = 0;
   while (fd.Read(buffer, sizeof(buffer), &actual) == true && actual != 0)
      content.append(buffer, actual);
   fd.Close();
   return content;
}

ScopedFileDeleter::ScopedFileDeleter(std::string const &filename) : _filename{filename} {}
ScopedFileDeleter::ScopedFileDeleter(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter& ScopedFileDeleter::operator=(ScopedFileDeleter &&sfd) = default;
ScopedFileDeleter::~ScopedFileDeleter() {
   if (not _filename.empty())
      RemoveFile("ScopedFileDeleter", _filename.c_str());
}
ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content)
{
   std::string name = tempDir().append("/repo-tests-").append(id).append(".XXXXXX");
   int const fd = mkstemp(&name[0]);
   EXPECT_NE(-1, fd);
   if (fd == -1)
      return ScopedFileDeleter{""};
   if (content != nullptr)
      EXPECT_TRUE(FileFd::Write(fd, content, strlen(content)));
   EXPECT_EQ(0, close(fd));
   return ScopedFileDeleter{name};
}
