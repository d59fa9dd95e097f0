#include <config.h>

#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>

#include <string>
#include <vector>

#include "contents.h"
#include "file-helpers.h"

#include <gtest/gtest.h>

TEST(ContentsTest,FormatRow)
{
   ContentsWriter contents("/dev/null");
   std::string const path = "data/data/com.termux/files/usr/bin/foo";
   std::string const row = contents.FormatRow(path, "foo");
   EXPECT_EQ(80u + 1 + 3 + 1, row.length());
   EXPECT_EQ(path + std::string(80 - path.length(), ' ') + " foo\n", row);

   EXPECT_EQ(row, contents.FormatRow("./" + path, "foo"));

   ContentsWriter narrow("/dev/null", 10);
   EXPECT_EQ("usr/bin/a  a\n", narrow.FormatRow("usr/bin/a", "a"));
   // longer paths are not cut
   EXPECT_EQ("usr/share/doc/a/copyright a\n", narrow.FormatRow("usr/share/doc/a/copyright", "a"));
}
TEST(ContentsTest,Append)
{
   std::string tempdir;
   createTemporaryDirectory("contents", tempdir);
   std::string const file = tempdir + "/Contents-arm";

   ContentsWriter contents(file, 20);
   EXPECT_TRUE(contents.Append("foo", {"./", "usr/", "usr/bin/", "usr/bin/foo", "./usr/share/foo.txt"}));
   EXPECT_EQ("usr/bin/foo          foo\n"
	     "usr/share/foo.txt    foo\n", readFile(file));

   // nothing is merged, adding the same package twice gives the rows twice
   EXPECT_TRUE(contents.Append("bar", {"usr/bin/foo"}));
   EXPECT_TRUE(contents.Append("foo", {"usr/bin/foo"}));
   EXPECT_EQ("usr/bin/foo          foo\n"
	     "usr/share/foo.txt    foo\n"
	     "usr/bin/foo          bar\n"
	     "usr/bin/foo          foo\n", readFile(file));

   // a package without files still creates the file
   std::string const empty = tempdir + "/Contents-all";
   ContentsWriter nofiles(empty);
   EXPECT_TRUE(nofiles.Append("meta", {"./", "usr/"}));
   EXPECT_TRUE(RealFileExists(empty));
   EXPECT_EQ("", readFile(empty));

   removeDirectory(tempdir);
   EXPECT_TRUE(_error->empty());
}
TEST(ContentsTest,Unwritable)
{
   ContentsWriter contents("/nonexistent-repo-dir/Contents-arm");
   EXPECT_FALSE(contents.Append("foo", {"usr/bin/foo"}));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
}
