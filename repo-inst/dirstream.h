// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Directory Stream

   When reading an archive the items found in it are passed into a
   directory stream class for analysis and processing. The low level
   archive handlers are only responsible for decoding the archive format
   and sending events (via method calls) to the specified directory
   stream.

   For a regular file the stream hands back a file descriptor to write
   the data to. If that fd is -1 the file data is skipped, -2 sends the
   data to Process() in chunks.

   The defaults accept every item and skip all file data, so a stream
   only overrides what it is interested in.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_DIRSTREAM_H
#define REPO_DIRSTREAM_H

#include <repo-pkg/macros.h>

class REPO_PUBLIC pkgDirStream
{
   public:

   // what the archive says about one member
   struct Item
   {
      enum Type_t {File, HardLink, SymbolicLink, CharDevice, BlockDevice,
	           Directory, FIFO} Type;
      char *Name;
      char *LinkTarget;
      unsigned long Mode;
      unsigned long long Size;
   };

   virtual bool DoItem(Item &Itm,int &Fd);
   virtual bool Fail(Item &Itm,int Fd);
   virtual bool FinishedFile(Item &Itm,int Fd);
   virtual bool Process(Item &/*Itm*/,const unsigned char * /*Data*/,
			unsigned long long /*Size*/,unsigned long long /*Pos*/) {return true;};

   virtual ~pkgDirStream() {};
};

#endif
