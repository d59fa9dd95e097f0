#include <config.h>

#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/hashes.h>
#include <repo-pkg/strutl.h>
#include <repo-pkg/tagfile.h>

#include <string>
#include <vector>

#include "builder-helpers.h"
#include "context.h"
#include "deb-helpers.h"
#include "file-helpers.h"
#include "inspector.h"
#include "writer.h"

#include <gtest/gtest.h>

static std::string hashOf(std::string const &file, char const * const type)
{
   FileFd fd(file, FileFd::ReadOnly);
   Hashes hashes;
   EXPECT_TRUE(hashes.AddFD(fd));
   HashStringList const list = hashes.GetHashStringList();
   HashString const * const hs = list.find(type);
   if (hs == nullptr)
      return "";
   return hs->HashValue();
}
static std::string sizeOf(std::string const &file)
{
   FileFd fd(file, FileFd::ReadOnly);
   return std::to_string(fd.FileSize());
}

class WriterTest : public ::testing::Test
{
   protected:
   std::string tempdir;
   RepoBuildContext context;
   DebInspector inspector;
   std::string foo, bar;

   virtual void SetUp() override
   {
      createTemporaryDirectory("writer", tempdir);
      setupContext(tempdir, context);
      ASSERT_TRUE(CreateDirectory(context.OutputDir, context.ArchPath("main", "arm")));
      ASSERT_TRUE(CreateDirectory(context.OutputDir, context.ArchPath("main", "all")));
      foo = context.ArchPath("main", "arm") + "/foo_1.0_arm.deb";
      bar = context.ArchPath("main", "arm") + "/bar_2.0_arm.deb";
      createDeb(foo, controlFile("foo", "1.0", "arm"), std::vector<TarMember>({tarFile("./usr/bin/foo", "foo")}), "xz");
      createDeb(bar, controlFile("bar", "2.0", "arm") + "\n\n", std::vector<TarMember>({tarFile("./usr/bin/bar", "bar")}), "gzip");
      createFileWithContent(context.ComponentPath("main"), "Contents-arm", "usr/bin/foo foo\nusr/bin/bar bar\n");
      context.AddComponent("main");
      context.AddArchitecture("arm");
   }
   virtual void TearDown() override
   {
      removeDirectory(tempdir);
   }
};

TEST_F(WriterTest,PackageStanza)
{
   PackagesWriter writer(context, inspector);
   std::string stanza;
   EXPECT_TRUE(writer.DoPackage(foo, "main", "arm", stanza));
   std::string const expected = controlFile("foo", "1.0", "arm") +
      "Filename: dists/termux/main/binary-arm/foo_1.0_arm.deb\n"
      "Size: " + sizeOf(foo) + "\n"
      "MD5Sum: " + hashOf(foo, "MD5Sum") + "\n"
      "SHA1: " + hashOf(foo, "SHA1") + "\n"
      "SHA256: " + hashOf(foo, "SHA256") + "\n"
      "SHA512: " + hashOf(foo, "SHA512") + "\n";
   EXPECT_EQ(expected, stanza);
   EXPECT_EQ(32u, hashOf(foo, "MD5Sum").length());
   EXPECT_EQ(128u, hashOf(foo, "SHA512").length());

   // trailing empty lines of the control file are dropped
   EXPECT_TRUE(writer.DoPackage(bar, "main", "arm", stanza));
   EXPECT_TRUE(REPO::String::Startswith(stanza, controlFile("bar", "2.0", "arm") + "Filename: "));
   EXPECT_TRUE(_error->empty());
}
TEST_F(WriterTest,PackageStanzaSelectedHashes)
{
   ScopedConfig config;
   config.Set("Repo::Packages::MD5", "false");
   config.Set("Repo::Packages::SHA1", "false");
   PackagesWriter writer(context, inspector);
   std::string stanza;
   EXPECT_TRUE(writer.DoPackage(foo, "main", "arm", stanza));
   EXPECT_EQ(std::string::npos, stanza.find("MD5Sum:"));
   EXPECT_EQ(std::string::npos, stanza.find("SHA1:"));
   EXPECT_NE(std::string::npos, stanza.find("\nSHA256: " + hashOf(foo, "SHA256") + "\n"));
   EXPECT_NE(std::string::npos, stanza.find("\nSHA512: "));
   EXPECT_TRUE(_error->empty());
}
TEST_F(WriterTest,PackagesFile)
{
   PackagesWriter writer(context, inspector);
   EXPECT_TRUE(writer.GenerateComponent("main"));

   std::string fooStanza, barStanza;
   EXPECT_TRUE(writer.DoPackage(foo, "main", "arm", fooStanza));
   EXPECT_TRUE(writer.DoPackage(bar, "main", "arm", barStanza));
   std::string const arm = context.ArchPath("main", "arm");
   // sorted by file name, one empty line after every entry
   EXPECT_EQ(barStanza + "\n" + fooStanza + "\n", readFile(arm + "/Packages"));
   EXPECT_EQ(readFile(arm + "/Packages"), readFile(arm + "/Packages.xz"));

   std::string const all = context.ArchPath("main", "all");
   EXPECT_TRUE(RealFileExists(all + "/Packages"));
   EXPECT_EQ("", readFile(all + "/Packages"));
   EXPECT_TRUE(RealFileExists(all + "/Packages.xz"));

   std::string const contents = context.ComponentPath("main") + "/Contents-arm";
   EXPECT_EQ("usr/bin/foo foo\nusr/bin/bar bar\n", readFile(contents + ".xz"));
   EXPECT_EQ(readFile(contents), readFile(contents + ".xz"));

   // running again does not compress the compressed files
   EXPECT_TRUE(writer.GenerateComponent("main"));
   EXPECT_FALSE(FileExists(contents + ".xz.xz"));
   EXPECT_FALSE(FileExists(arm + "/Packages.xz.xz"));
   EXPECT_TRUE(_error->empty());
}
TEST_F(WriterTest,PackagesExtraCompressors)
{
   ScopedConfig config;
   config.Set("Repo::Compress::Packages", "xz gzip");
   config.Set("Repo::Compress::Contents", "gzip");
   PackagesWriter writer(context, inspector);
   EXPECT_TRUE(writer.GenerateComponent("main"));
   std::string const arm = context.ArchPath("main", "arm");
   EXPECT_EQ(readFile(arm + "/Packages"), readFile(arm + "/Packages.gz"));
   EXPECT_EQ(readFile(arm + "/Packages"), readFile(arm + "/Packages.xz"));
   EXPECT_TRUE(RealFileExists(context.ComponentPath("main") + "/Contents-arm.gz"));
   EXPECT_FALSE(FileExists(context.ComponentPath("main") + "/Contents-arm.xz"));

   ReleaseWriter release(context);
   std::vector<std::string> const files = release.ListIndexFiles("main");
   ASSERT_EQ(8u, files.size());
   EXPECT_EQ("main/binary-all/Packages", files[0]);
   EXPECT_EQ("main/binary-all/Packages.gz", files[1]);
   EXPECT_EQ("main/binary-all/Packages.xz", files[2]);
   EXPECT_EQ("main/binary-arm/Packages", files[3]);
   EXPECT_EQ("main/binary-arm/Packages.gz", files[4]);
   EXPECT_EQ("main/binary-arm/Packages.xz", files[5]);
   EXPECT_EQ("main/Contents-arm", files[6]);
   EXPECT_EQ("main/Contents-arm.gz", files[7]);
   EXPECT_TRUE(_error->empty());
}
TEST_F(WriterTest,ReleaseFile)
{
   PackagesWriter packages(context, inspector);
   ASSERT_TRUE(packages.GenerateComponent("main"));
   // a component of an earlier run is still listed
   ASSERT_TRUE(CreateDirectory(context.OutputDir, context.ArchPath("old", "aarch64")));
   createFileWithContent(context.ArchPath("old", "aarch64"), "Packages", "");

   ReleaseWriter release(context);
   std::vector<std::string> const components = release.ListComponents();
   ASSERT_EQ(2u, components.size());
   EXPECT_EQ("main", components[0]);
   EXPECT_EQ("old", components[1]);

   std::string releaseFile;
   EXPECT_TRUE(release.Generate(releaseFile));
   EXPECT_EQ(context.DistPath() + "/Release", releaseFile);

   pkgTagSection section;
   std::string const content = readFile(releaseFile);
   ASSERT_TRUE(section.Scan(content.c_str(), content.length()));
   EXPECT_EQ("termux", section.FindS("Codename"));
   EXPECT_EQ("1", section.FindS("Version"));
   EXPECT_EQ("arm", section.FindS("Architectures"));
   EXPECT_EQ("termux repository", section.FindS("Description"));
   EXPECT_EQ("termux", section.FindS("Suite"));
   EXPECT_EQ("main old", section.FindS("Components"));
   EXPECT_TRUE(section.Find("Origin").empty());
   std::string const date = section.FindS("Date");
   EXPECT_TRUE(REPO::String::Endswith(date, " UTC"));
   EXPECT_EQ(29u, date.length());

   std::vector<std::string> const files = {
      "main/binary-all/Packages",
      "main/binary-all/Packages.xz",
      "main/binary-arm/Packages",
      "main/binary-arm/Packages.xz",
      "main/Contents-arm",
      "main/Contents-arm.xz",
      "old/binary-aarch64/Packages",
   };
   for (auto const &type : {"MD5Sum", "SHA1", "SHA256", "SHA512"})
   {
      std::vector<std::string> const rows = VectorizeString(std::string(section.FindRaw(type)), '\n');
      // the value starts with the newline after the field name
      ASSERT_EQ(files.size() + 1, rows.size()) << type;
      for (size_t i = 0; i < files.size(); ++i)
      {
	 std::string const file = context.DistPath() + "/" + files[i];
	 EXPECT_EQ(" " + hashOf(file, type) + " " + sizeOf(file) + " " + files[i], rows[i + 1]) << type;
      }
   }
   EXPECT_TRUE(_error->empty());
}
TEST_F(WriterTest,ReleaseFileOptions)
{
   PackagesWriter packages(context, inspector);
   ASSERT_TRUE(packages.GenerateComponent("main"));

   ScopedConfig config;
   config.Set("Repo::Release::Origin", "Termux");
   config.Set("Repo::Release::Label", "Termux extras");
   config.Set("Repo::Release::Codename", "stable");
   config.Set("Repo::Release::MD5", "false");
   config.Set("Repo::Release::SHA1", "false");
   config.Set("Repo::Release::SHA512", "false");

   ReleaseWriter release(context);
   std::string releaseFile;
   EXPECT_TRUE(release.Generate(releaseFile));
   std::string const content = readFile(releaseFile);
   EXPECT_TRUE(REPO::String::Startswith(content, "Origin: Termux\nLabel: Termux extras\nCodename: stable\nVersion: 1\n"));
   EXPECT_EQ(std::string::npos, content.find("MD5Sum:"));
   EXPECT_EQ(std::string::npos, content.find("SHA1:"));
   EXPECT_EQ(std::string::npos, content.find("SHA512:"));
   EXPECT_NE(std::string::npos, content.find("\nSHA256:\n"));
   EXPECT_TRUE(_error->empty());
}
