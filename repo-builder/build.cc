// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build - run all passes of a repository build

   The tree builder places every package and logs its files, then the
   Packages files of all components touched in this run are written and
   finally the Release file covers every component found on disk.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/strutl.h>

#include <iostream>
#include <string>
#include <vector>

#include "build.h"
#include "context.h"
#include "inspector.h"
#include "signer.h"
#include "termux-apt-repo.h"
#include "treebuilder.h"
#include "writer.h"

#include <repoi18n.h>
									/*}}}*/

// SignReleaseFile - signing failures only warn				/*{{{*/
static void SignReleaseFile(std::string const &ReleaseFile)
{
   ioprintf(c1out, "%s\n", _("Signing with gpg..."));

   _error->PushToStack();
   std::string SignedFile;
   if (SignRelease(ReleaseFile, SignedFile) == true)
   {
      _error->MergeWithStack();
      return;
   }

   std::vector<std::string> Messages;
   while (_error->empty(GlobalError::DEBUG) == false)
   {
      std::string Msg;
      _error->PopMessage(Msg);
      Messages.push_back(Msg);
   }
   _error->RevertToStack();
   for (auto const &Msg : Messages)
      _error->Warning("%s", Msg.c_str());
   _error->Warning(_("Signing %s failed, the repository is not signed"), ReleaseFile.c_str());
}
									/*}}}*/
// BuildRepository - the whole pipeline					/*{{{*/
bool BuildRepository(RepoBuildContext &Context, PackageInspector &Inspector)
{
   if (DirectoryExists(Context.InputDir) == false)
      return _error->Error(_("'%s' does not exist"), Context.InputDir.c_str());

   TreeBuilder Builder(Context, Inspector);
   std::vector<std::string> const Packages = Builder.FindPackages();
   if (Packages.empty() == true)
      return _error->Error(_("No .deb file found in '%s'"), Context.InputDir.c_str());

   if (CreateDirectories(Context.OutputDir) == false)
      return false;

   for (auto const &P : Packages)
      if (Builder.Add(P) == false)
	 return false;

   PackagesWriter Writer(Context, Inspector);
   for (auto const &Component : Context.GetComponents())
      if (Writer.GenerateComponent(Component) == false)
	 return false;

   ReleaseWriter Release(Context);
   std::string ReleaseFile;
   if (Release.Generate(ReleaseFile) == false)
      return false;

   if (_config->FindB("Repo::Sign", false) == true)
      SignReleaseFile(ReleaseFile);
   return true;
}
									/*}}}*/
