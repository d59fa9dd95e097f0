// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Directory Stream

   Base implementation: nothing is written anywhere, subclasses pick
   the items they want to look at.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/dirstream.h>
#include <repo-pkg/error.h>

#include <repoi18n.h>
									/*}}}*/

// DirStream::DoItem - Process an item					/*{{{*/
bool pkgDirStream::DoItem(Item &,int &Fd)
{
   Fd = -1;
   return true;
}
									/*}}}*/
// DirStream::FinishedFile - Finished processing a file		/*{{{*/
bool pkgDirStream::FinishedFile(Item &,int)
{
   return true;
}
									/*}}}*/
// DirStream::Fail - Failed processing a file				/*{{{*/
bool pkgDirStream::Fail(Item &Itm, int)
{
   return _error->Error(_("Failed to process archive member %s"), Itm.Name);
}
									/*}}}*/
