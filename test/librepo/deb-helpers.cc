#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include <stdio.h>
#include <string.h>

#include <gtest/gtest.h>

#include "deb-helpers.h"
#include "file-helpers.h"

TarMember tarFile(std::string const &name, std::string const &content)
{
   return TarMember{name, '0', content, ""};
}
TarMember tarDirectory(std::string const &name)
{
   return TarMember{name, '5', "", ""};
}
TarMember tarSymlink(std::string const &name, std::string const &target)
{
   return TarMember{name, '2', "", target};
}

static void tarOctal(char * const field, size_t const size, unsigned long long const value)
{
   // zero padded, terminated by a NUL in the last byte
   snprintf(field, size, "%0*llo", static_cast<int>(size - 1), value);
}
static std::string tarHeader(std::string const &name, char const type, unsigned long long const size,
      std::string const &link)
{
   char block[512];
   memset(block, 0, sizeof(block));
   memcpy(block, name.c_str(), std::min<size_t>(name.size(), 100));
   tarOctal(block + 100, 8, type == '5' ? 0755 : 0644);
   tarOctal(block + 108, 8, 0);
   tarOctal(block + 116, 8, 0);
   tarOctal(block + 124, 12, size);
   tarOctal(block + 136, 12, 1500000000);
   block[156] = type;
   memcpy(block + 157, link.c_str(), std::min<size_t>(link.size(), 100));
   memcpy(block + 257, "ustar", 6);
   memcpy(block + 263, "00", 2);
   memcpy(block + 265, "root", 4);
   memcpy(block + 297, "root", 4);
   tarOctal(block + 329, 8, 0);
   tarOctal(block + 337, 8, 0);

   memset(block + 148, ' ', 8);
   unsigned long sum = 0;
   for (size_t i = 0; i < sizeof(block); ++i)
      sum += static_cast<unsigned char>(block[i]);
   snprintf(block + 148, 8, "%06lo", sum);
   block[155] = ' ';
   return std::string(block, sizeof(block));
}
static void tarPad(std::string &tar)
{
   if (tar.size() % 512 != 0)
      tar.append(512 - tar.size() % 512, '\0');
}

std::string buildTar(std::vector<TarMember> const &members)
{
   std::string tar;
   for (auto const &m : members)
   {
      if (m.Name.size() > 100)
      {
	 std::string const longname = m.Name + '\0';
	 tar.append(tarHeader("././@LongLink", 'L', longname.size(), ""));
	 tar.append(longname);
	 tarPad(tar);
      }
      tar.append(tarHeader(m.Name, m.Type, m.Content.size(), m.LinkTarget));
      tar.append(m.Content);
      tarPad(tar);
   }
   tar.append(1024, '\0');
   return tar;
}

std::string buildAr(std::vector<std::pair<std::string, std::string>> const &members)
{
   std::string ar = "!<arch>\n";
   for (auto const &m : members)
   {
      std::string header;
      strprintf(header, "%-16s%-12lu%-6u%-6u%-8o%-10zu`\n", (m.first + "/").c_str(),
	    1500000000ul, 0u, 0u, 0100644u, m.second.size());
      EXPECT_EQ(60u, header.size());
      ar.append(header);
      ar.append(m.second);
      if (m.second.size() % 2 != 0)
	 ar.append("\n");
   }
   return ar;
}

std::string compressData(std::string const &data, std::string const &compressor)
{
   if (compressor == ".")
      return data;
   REPO::Configuration::Compressor comp;
   EXPECT_TRUE(REPO::Configuration::findCompressor(compressor, comp));
   std::string dir;
   helperCreateTemporaryDirectory("compress", dir);
   std::string const file = flCombine(dir, "data" + comp.Extension);
   std::string compressed;
   {
      FileFd fd;
      EXPECT_TRUE(fd.Open(file, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, comp, 0644));
      EXPECT_TRUE(fd.Write(data.data(), data.size()));
      EXPECT_TRUE(fd.Close());
   }
   {
      FileFd fd;
      EXPECT_TRUE(fd.Open(file, FileFd::ReadOnly));
      compressed.resize(fd.FileSize());
      EXPECT_TRUE(fd.Read(&compressed[0], compressed.size()));
      EXPECT_TRUE(fd.Close());
   }
   helperRemoveDirectory(dir);
   return compressed;
}

std::string controlFile(std::string const &package, std::string const &version, std::string const &arch)
{
   std::string control;
   strprintf(control, "Package: %s\nVersion: %s\nArchitecture: %s\n"
	 "Maintainer: Test Maintainer <test@example.org>\n"
	 "Description: test package %s\n", package.c_str(), version.c_str(),
	 arch.c_str(), package.c_str());
   return control;
}

void helperCreateDeb(std::string const &file, std::string const &control,
      std::vector<TarMember> const &members, std::string const &compressor)
{
   REPO::Configuration::Compressor comp;
   ASSERT_TRUE(REPO::Configuration::findCompressor(compressor, comp));
   std::string const controltar = compressData(buildTar({
	    tarDirectory("./"), tarFile("./control", control)}), compressor);
   std::string const datatar = compressData(buildTar(members), compressor);
   std::string const deb = buildAr({
	 {"debian-binary", "2.0\n"},
	 {"control.tar" + comp.Extension, controltar},
	 {"data.tar" + comp.Extension, datatar}});

   FileFd fd;
   ASSERT_TRUE(fd.Open(file, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, 0644));
   ASSERT_TRUE(fd.Write(deb.data(), deb.size()));
   ASSERT_TRUE(fd.Close());
}
