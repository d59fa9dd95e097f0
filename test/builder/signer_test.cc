#include <config.h>

#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>

#include <string>
#include <vector>

#include <sys/stat.h>

#include "builder-helpers.h"
#include "file-helpers.h"
#include "signer.h"

#include <gtest/gtest.h>

TEST(SignerTest,CommandLine)
{
   std::vector<std::string> args = SignCommandLine("/repo/Release", "/repo/InRelease", false);
   EXPECT_EQ(std::vector<std::string>({"gpg", "--yes", "--pinentry-mode", "loopback",
	    "--digest-algo", "SHA256", "--clearsign", "--armor",
	    "-o", "/repo/InRelease", "/repo/Release"}), args);

   ScopedConfig config;
   config.Set("Dir::Bin::gpg", "/usr/local/bin/gpg2");
   config.Set("Repo::Sign::Key", "0xDEADBEEF");
   config.Set("Repo::Sign::DigestAlgo", "SHA512");
   args = SignCommandLine("/repo/Release", "/repo/Release.gpg", true);
   EXPECT_EQ(std::vector<std::string>({"/usr/local/bin/gpg2", "--yes", "--pinentry-mode", "loopback",
	    "--digest-algo", "SHA512", "--local-user", "0xDEADBEEF", "--detach-sign", "--armor",
	    "-o", "/repo/Release.gpg", "/repo/Release"}), args);
}
TEST(SignerTest,MissingSigner)
{
   std::string tempdir;
   createTemporaryDirectory("signer", tempdir);
   createFileWithContent(tempdir, "Release", "Suite: termux\n");

   ScopedConfig config;
   config.Set("Dir::Bin::gpg", tempdir + "/no-such-gpg");
   std::string signedFile = "unset";
   EXPECT_FALSE(SignRelease(tempdir + "/Release", signedFile));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_EQ("unset", signedFile);
   EXPECT_FALSE(FileExists(tempdir + "/InRelease"));
   EXPECT_EQ("Suite: termux\n", readFile(tempdir + "/Release"));

   removeDirectory(tempdir);
}
TEST(SignerTest,FakeSigner)
{
   std::string tempdir;
   createTemporaryDirectory("signer", tempdir);
   createFileWithContent(tempdir, "Release", "Suite: termux\n");
   // copies the input to the -o argument, enough to stand in for gpg here
   createFileWithContent(tempdir, "fake-gpg",
	 "#!/bin/sh\n"
	 "while [ \"$1\" != \"-o\" ]; do shift; done\n"
	 "cp \"$3\" \"$2\"\n");
   ASSERT_EQ(0, chmod((tempdir + "/fake-gpg").c_str(), 0755));

   ScopedConfig config;
   config.Set("Dir::Bin::gpg", tempdir + "/fake-gpg");
   config.Set("Repo::Sign::Detached", "true");
   std::string signedFile;
   EXPECT_TRUE(SignRelease(tempdir + "/Release", signedFile));
   EXPECT_EQ(tempdir + "/InRelease", signedFile);
   EXPECT_EQ("Suite: termux\n", readFile(tempdir + "/InRelease"));
   EXPECT_EQ("Suite: termux\n", readFile(tempdir + "/Release.gpg"));

   removeDirectory(tempdir);
   EXPECT_TRUE(_error->empty());
}
TEST(SignerTest,DetachedFailureDropsInRelease)
{
   std::string tempdir;
   createTemporaryDirectory("signer", tempdir);
   createFileWithContent(tempdir, "Release", "Suite: termux\n");
   // clear-signs like the signer above, but refuses detached signatures
   createFileWithContent(tempdir, "fake-gpg",
	 "#!/bin/sh\n"
	 "case \"$*\" in *--detach-sign*) exit 1;; esac\n"
	 "while [ \"$1\" != \"-o\" ]; do shift; done\n"
	 "cp \"$3\" \"$2\"\n");
   ASSERT_EQ(0, chmod((tempdir + "/fake-gpg").c_str(), 0755));

   ScopedConfig config;
   config.Set("Dir::Bin::gpg", tempdir + "/fake-gpg");
   config.Set("Repo::Sign::Detached", "true");
   std::string signedFile = "unset";
   EXPECT_FALSE(SignRelease(tempdir + "/Release", signedFile));
   EXPECT_TRUE(_error->PendingError());
   _error->Discard();
   EXPECT_EQ("unset", signedFile);
   EXPECT_FALSE(FileExists(tempdir + "/InRelease"));
   EXPECT_FALSE(FileExists(tempdir + "/Release.gpg"));
   EXPECT_EQ("Suite: termux\n", readFile(tempdir + "/Release"));

   removeDirectory(tempdir);
}
