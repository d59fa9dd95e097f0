// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Debian Archive File (.deb)

   A binary package is an ar archive of the 'debian-binary' version
   marker, control.tar with the package metadata and data.tar with the
   files it installs, both tars in any of the supported compressions.
   debDebFile finds these members and walks them with ExtractTar.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/arfile.h>
#include <repo-pkg/debfile.h>
#include <repo-pkg/dirstream.h>
#include <repo-pkg/error.h>
#include <repo-pkg/extracttar.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/tagfile.h>

#include <algorithm>
#include <string>

#include <repoi18n.h>
									/*}}}*/

// DebFile::debDebFile - Constructor					/*{{{*/
// ---------------------------------------------------------------------
/* Indexes the ar archive and makes sure the three members of a binary
   package are there. A failure is left on _error for the caller. */
debDebFile::debDebFile(FileFd &File) : File(File), AR(File)
{
   if (_error->PendingError() == true)
      return;

   std::string Compressor;
   if (AR.FindMember("debian-binary") == nullptr)
      _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "debian-binary");
   else if (FindCompressedMember("control.tar", Compressor) == nullptr)
      _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "control.tar");
   else if (FindCompressedMember("data.tar", Compressor) == nullptr)
      _error->Error(_("This is not a valid DEB archive, missing '%s' member"), "data.tar");
}
									/*}}}*/
// DebFile::FindCompressedMember - Find a tar with any compression	/*{{{*/
const ARArchive::Member *debDebFile::FindCompressedMember(std::string const &Base, std::string &Compressor)
{
   for (auto const &Comp : REPO::Configuration::getCompressors())
   {
      ARArchive::Member const * const Member = AR.FindMember((Base + Comp.Extension).c_str());
      if (Member != nullptr)
      {
	 Compressor = Comp.Name;
	 return Member;
      }
   }
   return nullptr;
}
									/*}}}*/
// DebFile::GotoMember - Position the file at the data of a member	/*{{{*/
// ---------------------------------------------------------------------
/* Moves the read position of the shared FileFd, so only one member can
   be read at a time. */
const ARArchive::Member *debDebFile::GotoMember(const char *Name)
{
   ARArchive::Member const * const Member = AR.FindMember(Name);
   if (Member == nullptr)
   {
      _error->Error(_("Internal error, could not locate member %s"), Name);
      return nullptr;
   }
   if (File.Seek(Member->Start) == false)
      return nullptr;
   return Member;
}
									/*}}}*/
// DebFile::ExtractTarMember - Walk one of the tar members		/*{{{*/
// ---------------------------------------------------------------------
/* Name is the member without its compressor extension, e.g. data.tar */
bool debDebFile::ExtractTarMember(pkgDirStream &Stream, const char *Name)
{
   std::string Compressor;
   ARArchive::Member const * const Member = FindCompressedMember(Name, Compressor);
   if (Member == nullptr)
      return _error->Error(_("Internal error, could not locate member %s"), Name);
   if (File.Seek(Member->Start) == false)
      return false;

   ExtractTar Tar(File, Member->Size, Compressor);
   return Tar.Go(Stream);
}
									/*}}}*/
bool debDebFile::ExtractArchive(pkgDirStream &Stream)			/*{{{*/
{
   return ExtractTarMember(Stream, "data.tar");
}
									/*}}}*/
// MemControlExtract::DoItem - capture only the wanted member		/*{{{*/
bool debDebFile::MemControlExtract::DoItem(Item &Itm,int &Fd)
{
   Capturing = (Member == Itm.Name);
   if (Capturing == true)
   {
      Found = true;
      Control.assign(Itm.Size, '\0');
   }
   // -2 makes the extractor hand the data to Process
   Fd = Capturing ? -2 : -1;
   return true;
}
									/*}}}*/
bool debDebFile::MemControlExtract::Process(Item &,const unsigned char *Data,/*{{{*/
			     unsigned long long Size,unsigned long long Pos)
{
   if (Capturing == false)
      return true;
   if (Pos + Size > Control.size())
      return false;
   std::copy(Data, Data + Size, Control.begin() + Pos);
   return true;
}
									/*}}}*/
// MemControlExtract::Read - the control stanza of a .deb		/*{{{*/
// ---------------------------------------------------------------------
/* Section refers to Control, which is kept terminated by a blank line
   so the scan sees the end of the stanza. */
bool debDebFile::MemControlExtract::Read(debDebFile &Deb)
{
   Control.clear();
   Found = false;
   if (Deb.ExtractTarMember(*this, "control.tar") == false)
      return false;
   if (Found == false || Control.empty() == true)
      return _error->Error(_("Failed to locate a valid control file"));

   Control.append("\n\n");
   if (Section.Scan(Control.c_str(), Control.size()) == false)
      return _error->Error(_("Unparsable control file"));
   return true;
}
									/*}}}*/
