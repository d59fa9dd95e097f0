// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Debian Archive File (.deb)

   Reading of binary packages: the control stanza through
   MemControlExtract and the file list by walking data.tar with a
   pkgDirStream.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_DEBFILE_H
#define REPO_DEBFILE_H

#include <repo-pkg/arfile.h>
#include <repo-pkg/dirstream.h>
#include <repo-pkg/macros.h>
#include <repo-pkg/tagfile.h>

#include <string>

class FileFd;

class REPO_PUBLIC debDebFile
{
   protected:

   FileFd &File;
   ARArchive AR;

   /** \brief find Base with one of the supported compressor extensions
    *
    *  \param[out] Compressor name of the compressor to read the member with */
   const ARArchive::Member *FindCompressedMember(std::string const &Base, std::string &Compressor);

   public:

   class MemControlExtract;

   /** \brief walk the tar member Name, e.g. "control.tar", whatever its compression */
   bool ExtractTarMember(pkgDirStream &Stream, const char *Name);
   bool ExtractArchive(pkgDirStream &Stream);
   const ARArchive::Member *GotoMember(const char *Name);

   explicit debDebFile(FileFd &File);
};

/* reads one file of control.tar into memory and parses it as a stanza */
class REPO_PUBLIC debDebFile::MemControlExtract : public pkgDirStream
{
   bool Capturing = false;
   bool Found = false;

   public:

   std::string Control;
   pkgTagSection Section;
   std::string Member;

   virtual bool DoItem(Item &Itm,int &Fd) override;
   virtual bool Process(Item &Itm,const unsigned char *Data,
			unsigned long long Size,unsigned long long Pos) override;

   bool Read(debDebFile &Deb);

   explicit MemControlExtract(std::string const &Member = "control") : Member(Member) {};
};

#endif
