// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Writer

   The index writers. These write the Packages and Release files of the
   repository tree built by the TreeBuilder.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/hashes.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/strutl.h>

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include <string.h>
#include <time.h>

#include "context.h"
#include "inspector.h"
#include "multicompress.h"
#include "termux-apt-repo.h"
#include "writer.h"

#include <repoi18n.h>
									/*}}}*/

// ConfigToDoHashes - which hashes to generate				/*{{{*/
static void SingleConfigToDoHashes(unsigned int &DoHashes, std::string const &Conf, unsigned int const Flag)
{
   if (_config->FindB(Conf, (DoHashes & Flag) == Flag) == true)
      DoHashes |= Flag;
   else
      DoHashes &= ~Flag;
}
static void ConfigToDoHashes(unsigned int &DoHashes, std::string const &Conf)
{
   SingleConfigToDoHashes(DoHashes, Conf + "::MD5", Hashes::MD5SUM);
   SingleConfigToDoHashes(DoHashes, Conf + "::SHA1", Hashes::SHA1SUM);
   SingleConfigToDoHashes(DoHashes, Conf + "::SHA256", Hashes::SHA256SUM);
   SingleConfigToDoHashes(DoHashes, Conf + "::SHA512", Hashes::SHA512SUM);
}
									/*}}}*/
// HashFields - name and flag of every hash, in output order		/*{{{*/
static std::vector<std::pair<char const *, unsigned int>> const &HashFields()
{
   static std::vector<std::pair<char const *, unsigned int>> const Fields = {
      {"MD5Sum", Hashes::MD5SUM},
      {"SHA1", Hashes::SHA1SUM},
      {"SHA256", Hashes::SHA256SUM},
      {"SHA512", Hashes::SHA512SUM},
   };
   return Fields;
}
									/*}}}*/
// IsCompressedName - does File end in a compressor extension?		/*{{{*/
static bool IsCompressedName(std::string const &File)
{
   if (REPO::String::Endswith(File, ".new") == true)
      return true;
   for (auto const &Ext : REPO::Configuration::getCompressorExtensions())
      if (REPO::String::Endswith(File, Ext) == true)
	 return true;
   return false;
}
									/*}}}*/
// GlobDirectories - Glob, but only the directories			/*{{{*/
static std::vector<std::string> GlobDirectories(std::string const &Pattern)
{
   std::vector<std::string> Dirs;
   for (auto const &D : Glob(Pattern))
      if (DirectoryExists(D) == true)
	 Dirs.push_back(D);
   return Dirs;
}
									/*}}}*/

// PackagesWriter::PackagesWriter - Constructor				/*{{{*/
PackagesWriter::PackagesWriter(RepoBuildContext const &Context, PackageInspector &Inspector) :
   Context(Context), Inspector(Inspector), DoHashes(~0)
{
   ConfigToDoHashes(DoHashes, "Repo::Packages");
}
									/*}}}*/
// PackagesWriter::DoPackage - Process a single package			/*{{{*/
// ---------------------------------------------------------------------
/* The control stanza followed by the location, the size and the hashes
   of the package file as it is placed in the tree. */
bool PackagesWriter::DoPackage(std::string const &FileName, std::string const &Component,
			       std::string const &Arch, std::string &Stanza)
{
   std::string Control;
   if (Inspector.ReadControl(FileName, Control) == false)
      return false;
   while (Control.empty() == false && Control.back() == '\n')
      Control.pop_back();

   FileFd Fd;
   if (Fd.Open(FileName, FileFd::ReadOnly) == false)
      return false;
   unsigned long long const FileSize = Fd.FileSize();
   Hashes Hash(DoHashes);
   if (Hash.AddFD(Fd) == false)
      return _error->Error(_("Unable to compute the hashes of %s"), FileName.c_str());
   HashStringList const HashList = Hash.GetHashStringList();
   if (Fd.Close() == false)
      return false;

   Stanza = Control;
   Stanza.append("\nFilename: ").append("dists/").append(Context.Distribution).append("/")
      .append(Component).append("/binary-").append(Arch).append("/").append(flNotDir(FileName));
   Stanza.append("\nSize: ").append(std::to_string(FileSize));
   for (auto const &F : HashFields())
   {
      if ((DoHashes & F.second) != F.second)
	 continue;
      HashString const * const H = HashList.find(F.first);
      if (H == nullptr)
	 return _error->Error(_("Unable to compute the hashes of %s"), FileName.c_str());
      Stanza.append("\n").append(F.first).append(": ").append(H->HashValue());
   }
   Stanza.append("\n");
   return true;
}
									/*}}}*/
// PackagesWriter::Generate - Packages of one binary-<arch> directory	/*{{{*/
bool PackagesWriter::Generate(std::string const &Component, std::string const &Arch)
{
   std::string const ArchDir = Context.ArchPath(Component, Arch);
   ioprintf(c0out, _("Creating package file for %s and %s\n"), Component.c_str(), Arch.c_str());

   std::string const Compress = ". " + _config->Find("Repo::Compress::Packages", "xz");
   MultiCompress Out(flCombine(ArchDir, "Packages"), Compress);
   if (_error->PendingError() == true)
      return false;

   for (auto const &Deb : Glob(flCombine(ArchDir, "*.deb")))
   {
      std::string Stanza;
      if (DoPackage(Deb, Component, Arch, Stanza) == false)
	 return false;
      if (_config->FindB("Debug::Repo::Writer", false) == true)
	 std::clog << "Packages entry for " << Deb << std::endl;
      Stanza.append("\n");
      if (Out.Write(Stanza) == false)
	 return false;
   }

   unsigned long long Size;
   return Out.Finalize(Size);
}
									/*}}}*/
// PackagesWriter::GenerateComponent - all indexes of a component	/*{{{*/
bool PackagesWriter::GenerateComponent(std::string const &Component)
{
   std::string const ComponentDir = Context.ComponentPath(Component);
   for (auto const &Dir : GlobDirectories(flCombine(ComponentDir, "binary-*")))
   {
      std::string const Arch = flNotDir(Dir).substr(strlen("binary-"));
      if (Generate(Component, Arch) == false)
	 return false;
   }

   std::string const Compress = _config->Find("Repo::Compress::Contents", "xz");
   for (auto const &Contents : Glob(flCombine(ComponentDir, "Contents-*")))
   {
      if (IsCompressedName(Contents) == true)
	 continue;
      if (MultiCompress::CompressFile(Contents, Compress) == false)
	 return false;
   }
   return true;
}
									/*}}}*/

// ReleaseWriter::ReleaseWriter - Constructor				/*{{{*/
ReleaseWriter::ReleaseWriter(RepoBuildContext const &Context) : Context(Context), DoHashes(~0)
{
   ConfigToDoHashes(DoHashes, "Repo::Release");
}
									/*}}}*/
// formatUTCDateTime - Date field of the Release file			/*{{{*/
static std::string formatUTCDateTime(time_t const now)
{
   // TimeRFC1123 uses GMT to satisfy HTTP/1.1
   std::string datetime = TimeRFC1123(now, false);
   auto const lastspace = datetime.rfind(' ');
   if (lastspace != std::string::npos)
      datetime.replace(lastspace + 1, 3, "UTC");
   return datetime;
}
									/*}}}*/
// ReleaseWriter::ListComponents - what is on disk			/*{{{*/
// ---------------------------------------------------------------------
/* This includes components of earlier runs which were not touched now */
std::vector<std::string> ReleaseWriter::ListComponents() const
{
   std::vector<std::string> Components;
   for (auto const &Dir : GlobDirectories(flCombine(Context.DistPath(), "*")))
      Components.push_back(flNotDir(Dir));
   return Components;
}
									/*}}}*/
// ReleaseWriter::ListIndexFiles - Packages and Contents of a component	/*{{{*/
std::vector<std::string> ReleaseWriter::ListIndexFiles(std::string const &Component) const
{
   std::vector<std::string> Files;
   std::string const ComponentDir = Context.ComponentPath(Component);
   for (auto const &Dir : GlobDirectories(flCombine(ComponentDir, "binary-*")))
   {
      for (auto const &P : Glob(flCombine(Dir, "Packages*")))
      {
	 if (REPO::String::Endswith(P, ".new") == true)
	    continue;
	 std::string const Name = flNotDir(P);
	 if (Name != "Packages" && IsCompressedName(Name) == false)
	    continue;
	 Files.push_back(Component + "/" + flNotDir(Dir) + "/" + Name);
      }
   }
   for (auto const &C : Glob(flCombine(ComponentDir, "Contents-*")))
   {
      if (REPO::String::Endswith(C, ".new") == true)
	 continue;
      Files.push_back(Component + "/" + flNotDir(C));
   }
   return Files;
}
									/*}}}*/
// ReleaseWriter::DoFile - Checksum a single index file			/*{{{*/
bool ReleaseWriter::DoFile(std::string const &RelName)
{
   std::string const FileName = flCombine(Context.DistPath(), RelName);
   FileFd fd;
   if (fd.Open(FileName, FileFd::ReadOnly) == false)
      return false;

   CheckSum Sum;
   Sum.size = fd.FileSize();
   Hashes hs(DoHashes);
   if (hs.AddFD(fd) == false)
      return _error->Error(_("Unable to compute the hashes of %s"), FileName.c_str());
   Sum.Hashes = hs.GetHashStringList();
   CheckSums.emplace_back(RelName, Sum);
   return fd.Close();
}
									/*}}}*/
// ReleaseWriter::Generate - Write the Release file			/*{{{*/
bool ReleaseWriter::Generate(std::string &ReleaseFile)
{
   CheckSums.clear();
   std::vector<std::string> const Components = ListComponents();
   for (auto const &C : Components)
      for (auto const &F : ListIndexFiles(C))
	 if (DoFile(F) == false)
	    return false;

   std::string Architectures;
   for (auto const &A : Context.GetArchitectures())
   {
      if (Architectures.empty() == false)
	 Architectures.append(" ");
      Architectures.append(A);
   }

   std::vector<std::pair<std::string, std::string>> Fields;
   Fields.emplace_back("Origin", _config->Find("Repo::Release::Origin"));
   Fields.emplace_back("Label", _config->Find("Repo::Release::Label"));
   Fields.emplace_back("Codename", _config->Find("Repo::Release::Codename", "termux"));
   Fields.emplace_back("Version", _config->Find("Repo::Release::Version", "1"));
   Fields.emplace_back("Architectures", Architectures);
   Fields.emplace_back("Description", _config->Find("Repo::Release::Description", Context.Distribution + " repository"));
   Fields.emplace_back("Suite", _config->Find("Repo::Release::Suite", Context.Distribution));
   Fields.emplace_back("Date", formatUTCDateTime(time(NULL)));
   Fields.emplace_back("Components", REPO::String::Join(Components, " "));

   std::string out;
   for (auto const &F : Fields)
   {
      if (F.second.empty() == true && F.first != "Architectures" && F.first != "Components")
	 continue;
      out.append(F.first).append(":");
      if (F.second.empty() == false)
	 out.append(" ").append(F.second);
      out.append("\n");
   }

   for (auto const &H : HashFields())
   {
      if ((DoHashes & H.second) != H.second)
	 continue;
      out.append(H.first).append(":\n");
      for (auto const &Sum : CheckSums)
      {
	 HashString const * const hs = Sum.second.Hashes.find(H.first);
	 if (hs == nullptr)
	    continue;
	 std::string row;
	 strprintf(row, " %s %llu %s\n", hs->HashValue().c_str(), Sum.second.size, Sum.first.c_str());
	 out.append(row);
      }
   }

   ReleaseFile = flCombine(Context.DistPath(), "Release");
   // signatures of an earlier Release would not match the new one
   for (auto const &Signature : {flCombine(Context.DistPath(), "InRelease"), ReleaseFile + ".gpg"})
      if (RemoveFile("ReleaseWriter::Generate", Signature) == false)
	 return _error->Error(_("Unable to remove the outdated signature %s"), Signature.c_str());
   if (_config->FindB("Debug::Repo::Writer", false) == true)
      std::clog << "Writing " << ReleaseFile << " with " << CheckSums.size() << " files" << std::endl;
   FileFd Output;
   if (Output.Open(ReleaseFile, FileFd::WriteAtomic, FileFd::None, 0644) == false)
      return false;
   if (Output.Write(out.c_str(), out.length()) == false)
   {
      Output.OpFail();
      Output.Close();
      return false;
   }
   return Output.Close();
}
									/*}}}*/
