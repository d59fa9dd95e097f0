// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   MultiCompressor

   Multiple output class. Takes the data written to it and writes it
   simultaneously to many compressed files. The outputs are written to
   temporary .new files and only renamed into place by Finalize, so a
   failed run never leaves a truncated index behind.

   ##################################################################### */
									/*}}}*/
#ifndef MULTICOMPRESS_H
#define MULTICOMPRESS_H

#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>

#include <string>
#include <sys/types.h>

class MultiCompress
{
   // An output file
   struct Files
   {
      std::string Output;
      REPO::Configuration::Compressor CompressProg;
      Files *Next;
      FileFd TmpFile;
   };

   Files *Outputs;
   mode_t Permissions;
   unsigned long long InSize;

   public:

   bool Write(const void *Data, unsigned long long Size);
   inline bool Write(std::string const &Data) { return Write(Data.c_str(), Data.length()); };
   /** \brief close and rename all outputs into place
    *
    *  \param[out] OutSize number of uncompressed bytes written */
   bool Finalize(unsigned long long &OutSize);

   /** \brief write compressed copies of an existing file next to it */
   static bool CompressFile(std::string const &Input, std::string const &Compress,
			    mode_t const &Permissions = 0644);

   /** \param Output path of the uncompressed file
    *  \param Compress space separated compressor names, "." is the plain file */
   MultiCompress(std::string const &Output, std::string const &Compress,
		 mode_t const &Permissions = 0644);
   ~MultiCompress();
};

#endif
