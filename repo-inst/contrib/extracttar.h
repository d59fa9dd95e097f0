// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Extract a Tar - Tar Extractor

   Walks a tar stream, optionally compressed, stored inside a larger
   file and reports every member to a pkgDirStream. GNU long names and
   pax path records are resolved, a leading ./ is dropped from names.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_EXTRACTTAR_H
#define REPO_EXTRACTTAR_H

#include <repo-pkg/fileutl.h>
#include <repo-pkg/macros.h>

#include <string>

class pkgDirStream;

class REPO_PUBLIC ExtractTar
{
   protected:

   struct TarHeader;

   FileFd &File;
   unsigned long long MaxInSize;
   FileFd InFd;
   std::string DecompressProg;
   // bytes of the member consumed, only tracked for plain tar
   unsigned long long InPos;

   bool StartDecompress();
   bool ReadBlock(void *To, unsigned long long Size, bool AllowEof = false);
   bool ReadPayload(unsigned long long Size, std::string &Data);
   bool Done();

   public:

   bool Go(pkgDirStream &Stream);

   /** \param Fd positioned at the start of the tar stream
    *  \param Max size of the (compressed) stream inside Fd
    *  \param DecompressionProgram name of the compressor, "." for none */
   ExtractTar(FileFd &Fd,unsigned long long Max,std::string DecompressionProgram);
   virtual ~ExtractTar();
};

#endif
