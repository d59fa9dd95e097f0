#include <config.h>

#include <repo-pkg/dirstream.h>
#include <repo-pkg/error.h>
#include <repo-pkg/extracttar.h>
#include <repo-pkg/fileutl.h>

#include <map>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "deb-helpers.h"
#include "file-helpers.h"

class RecordStream : public pkgDirStream
{
   public:
   std::vector<std::string> Names;
   std::map<std::string, pkgDirStream::Item::Type_t> Types;
   std::map<std::string, std::string> Links;
   std::map<std::string, std::string> Contents;

   bool DoItem(Item &Itm,int &Fd) override
   {
      Names.push_back(Itm.Name);
      Types[Itm.Name] = Itm.Type;
      Links[Itm.Name] = Itm.LinkTarget;
      Fd = (Itm.Type == Item::File) ? -2 : -1;
      return true;
   }
   bool Process(Item &Itm,const unsigned char *Data,
	 unsigned long long Size,unsigned long long Pos) override
   {
      std::string &content = Contents[Itm.Name];
      EXPECT_EQ(content.size(), Pos);
      content.append(reinterpret_cast<char const *>(Data), Size);
      return true;
   }
};

static std::vector<TarMember> sampleTree()
{
   std::string big;
   for (int i = 0; i < 5000; ++i)
      big.append("termux ");
   return {
      tarDirectory("./"),
      tarDirectory("./data/"),
      tarDirectory("./data/data/com.termux/files/usr/bin/"),
      tarFile("./data/data/com.termux/files/usr/bin/foo", "#!/bin/sh\necho foo\n"),
      tarSymlink("./data/data/com.termux/files/usr/bin/bar", "foo"),
      tarFile("./data/data/com.termux/files/usr/share/doc/foo/big", big),
   };
}

static void checkSampleTree(RecordStream const &stream)
{
   ASSERT_EQ(6u, stream.Names.size());
   EXPECT_EQ("./", stream.Names[0]);
   EXPECT_EQ("data/", stream.Names[1]);
   EXPECT_EQ("data/data/com.termux/files/usr/bin/foo", stream.Names[3]);
   EXPECT_EQ(pkgDirStream::Item::Directory, stream.Types.at("data/"));
   EXPECT_EQ(pkgDirStream::Item::File, stream.Types.at("data/data/com.termux/files/usr/bin/foo"));
   EXPECT_EQ(pkgDirStream::Item::SymbolicLink, stream.Types.at("data/data/com.termux/files/usr/bin/bar"));
   EXPECT_EQ("foo", stream.Links.at("data/data/com.termux/files/usr/bin/bar"));
   EXPECT_EQ("#!/bin/sh\necho foo\n", stream.Contents.at("data/data/com.termux/files/usr/bin/foo"));
   EXPECT_EQ(35000u, stream.Contents.at("data/data/com.termux/files/usr/share/doc/foo/big").size());
}

static void extractSample(std::string const &compressor)
{
   std::string tempdir;
   createTemporaryDirectory("extracttar", tempdir);
   std::string const data = compressData(buildTar(sampleTree()), compressor);
   createFileWithContent(tempdir, "data.tar", data);

   FileFd fd(tempdir + "/data.tar", FileFd::ReadOnly);
   ASSERT_TRUE(fd.IsOpen());
   ExtractTar tar(fd, data.size(), compressor);

   // extraction works repeatedly with the same extractor
   for (int i = 0; i < 3; ++i)
   {
      SCOPED_TRACE(i);
      RecordStream stream;
      ASSERT_TRUE(fd.Seek(0));
      EXPECT_TRUE(tar.Go(stream));
      EXPECT_FALSE(_error->PendingError());
      checkSampleTree(stream);
   }
   EXPECT_TRUE(fd.Close());
   removeDirectory(tempdir);
}

TEST(ExtractTarTest, Plain)
{
   extractSample(".");
}
TEST(ExtractTarTest, Gzip)
{
   extractSample("gzip");
}
TEST(ExtractTarTest, Xz)
{
   extractSample("xz");
}
TEST(ExtractTarTest, PlainStopsAtMemberEnd)
{
   std::string tempdir;
   createTemporaryDirectory("extracttarbounded", tempdir);
   // a tar without end blocks followed by unrelated data
   std::string tar = buildTar({tarFile("./control", "Package: foo\n")});
   tar.resize(tar.size() - 1024);
   createFileWithContent(tempdir, "member", tar + std::string(1024, 'x'));

   FileFd fd(tempdir + "/member", FileFd::ReadOnly);
   ExtractTar extract(fd, tar.size(), ".");
   RecordStream stream;
   EXPECT_TRUE(extract.Go(stream));
   ASSERT_EQ(1u, stream.Names.size());
   EXPECT_EQ("Package: foo\n", stream.Contents.at("control"));

   removeDirectory(tempdir);
}
TEST(ExtractTarTest, LongNames)
{
   std::string const longname = "./data/data/com.termux/files/usr/share/doc/a-package-with-a-very-long-name/"
      "and-a-deep-directory-structure/README.md";
   ASSERT_LT(100u, longname.size());
   std::string const paxpath = "data/data/com.termux/files/usr/share/pax-name";
   std::string paxrecord = " path=" + paxpath + "\n";
   paxrecord = std::to_string(paxrecord.size() + 2) + paxrecord;
   ASSERT_EQ(std::to_string(paxrecord.size()), paxrecord.substr(0, 2));

   std::string tempdir;
   createTemporaryDirectory("extracttarlong", tempdir);
   std::string const data = buildTar({
	 tarFile(longname, "long"),
	 TarMember{"./PaxHeaders/pax-name", 'x', paxrecord, ""},
	 tarFile("./short-name", "pax"),
	 tarFile("./after", "plain")});
   createFileWithContent(tempdir, "data.tar", data);

   FileFd fd(tempdir + "/data.tar", FileFd::ReadOnly);
   ExtractTar tar(fd, data.size(), ".");
   RecordStream stream;
   EXPECT_TRUE(tar.Go(stream));
   ASSERT_EQ(3u, stream.Names.size());
   EXPECT_EQ(longname.substr(2), stream.Names[0]);
   EXPECT_EQ("long", stream.Contents.at(longname.substr(2)));
   EXPECT_EQ(paxpath, stream.Names[1]);
   EXPECT_EQ("pax", stream.Contents.at(paxpath));
   // the long name only applies to the next member
   EXPECT_EQ("after", stream.Names[2]);

   removeDirectory(tempdir);
}
TEST(ExtractTarTest, UnknownType)
{
   std::string tempdir;
   createTemporaryDirectory("extracttarunknown", tempdir);
   std::string const data = buildTar({
	 TarMember{"./weird", 'Z', "skipped data", ""},
	 tarFile("./after", "content")});
   createFileWithContent(tempdir, "data.tar", data);

   FileFd fd(tempdir + "/data.tar", FileFd::ReadOnly);
   ExtractTar tar(fd, data.size(), ".");
   RecordStream stream;
   EXPECT_TRUE(tar.Go(stream));
   ASSERT_EQ(1u, stream.Names.size());
   EXPECT_EQ("content", stream.Contents.at("after"));
   EXPECT_FALSE(_error->PendingError());
   EXPECT_FALSE(_error->empty());
   _error->Discard();

   removeDirectory(tempdir);
}
TEST(ExtractTarTest, Corrupted)
{
   std::string tempdir;
   createTemporaryDirectory("extracttarcorrupt", tempdir);
   std::string data = buildTar({tarFile("./control", "Package: foo\n")});
   // change the name without fixing the checksum
   data[3] = 'X';
   createFileWithContent(tempdir, "data.tar", data);
   {
      FileFd fd(tempdir + "/data.tar", FileFd::ReadOnly);
      ExtractTar tar(fd, data.size(), ".");
      RecordStream stream;
      EXPECT_FALSE(tar.Go(stream));
      EXPECT_TRUE(_error->PendingError());
      EXPECT_TRUE(stream.Names.empty());
      _error->Discard();
   }

   // the file data is cut short
   std::string const full = buildTar({tarFile("./control", std::string(2000, 'a'))});
   createFileWithContent(tempdir, "short.tar", full.substr(0, 1024));
   {
      FileFd fd(tempdir + "/short.tar", FileFd::ReadOnly);
      ExtractTar tar(fd, 1024, ".");
      RecordStream stream;
      EXPECT_FALSE(tar.Go(stream));
      EXPECT_TRUE(_error->PendingError());
      _error->Discard();
   }

   {
      FileFd fd(tempdir + "/data.tar", FileFd::ReadOnly);
      ExtractTar tar(fd, data.size(), "zip");
      RecordStream stream;
      EXPECT_FALSE(tar.Go(stream));
      EXPECT_TRUE(_error->PendingError());
      _error->Discard();
   }
   removeDirectory(tempdir);
}
