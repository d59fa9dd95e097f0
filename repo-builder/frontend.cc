// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Front end - options, the build and the summary of termux-apt-repo

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/cmndline.h>
#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/init.h>
#include <repo-pkg/strutl.h>

#include <iostream>
#include <string>
#include <vector>

#include "build.h"
#include "context.h"
#include "inspector.h"
#include "termux-apt-repo.h"
#include "writer.h"

#include <repoi18n.h>
									/*}}}*/

// ShowHelp - Show the help text					/*{{{*/
static void ShowHelp(std::ostream &out)
{
   out <<
    _("Usage: termux-apt-repo [options] -i <input> -o <output>\n"
      "\n"
      "termux-apt-repo builds an apt repository from a directory of .deb\n"
      "files. Packages directly in the input directory are placed in the\n"
      "default component, packages in a subdirectory in a component named\n"
      "after it. A component is rebuilt from scratch every time.\n"
      "\n"
      "Options:\n"
      "  -i, --input=?          folder where .deb files are located\n"
      "  -o, --output=?         folder with repository tree\n"
      "  -d, --distribution=?   name of distribution folder (termux)\n"
      "  -m, --component=?      name of default component folder (extras)\n"
      "  -l, --use-hard-links   use hard links instead of copying deb files\n"
      "  -s, --sign             sign repo with GPG key\n"
      "  -q, --quiet            less output, can be given twice\n"
      "  -c, --config-file=?    read this configuration file\n"
      "  --option=?             set an arbitrary configuration option, eg --option Repo::Contents::Width=100\n"
      "  -v, --version          display version information\n"
      "  -h, --help             this help text") << std::endl;
}
									/*}}}*/
// ShowVersion - the version banner					/*{{{*/
static void ShowVersion(std::ostream &out)
{
   out << "termux-apt-builder v" << repoVersion << std::endl
       << "by PhateValleyman" << std::endl
       << "Jonas.Ned@outlook.com" << std::endl;
}
									/*}}}*/
// ShowSourcesHint - how to use the result				/*{{{*/
static void ShowSourcesHint(RepoBuildContext const &Context, std::vector<std::string> const &Components)
{
   c1out << _("Done!") << std::endl << std::endl;
   ioprintf(c1out, _("Make the %s directory accessible at $REPO_URL\n\n"), Context.OutputDir.c_str());
   c1out << _("Users can then access the repo by adding a file at") << std::endl
	 << "   $PREFIX/etc/apt/sources.list.d" << std::endl
	 << _("containing:") << std::endl;
   for (auto const &C : Components)
      ioprintf(c1out, "   deb [trusted=yes] $REPO_URL %s %s\n", Context.Distribution.c_str(), C.c_str());
   c1out << std::endl
	 << _("[trusted=yes] is not needed if the repo has been signed with a gpg key") << std::endl;
}
									/*}}}*/
int RunTermuxAptRepo(int argc, const char *argv[], std::ostream &out, std::ostream &err)/*{{{*/
{
   CommandLine::Args Args[] = {
      {'i',"input","Repo::Input",CommandLine::HasArg},
      {'o',"output","Repo::Output",CommandLine::HasArg},
      {'d',"distribution","Repo::Distribution",CommandLine::HasArg},
      {'m',"component","Repo::Component",CommandLine::HasArg},
      {'l',"use-hard-links","Repo::Use-Hard-Links",0},
      {'s',"sign","Repo::Sign",0},
      {'v',"version","version",0},
      {'h',"help","help",0},
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'c',"config-file",0,CommandLine::ConfigFile},
      {0,"option",0,CommandLine::ArbItem},
      {0,0,0,0}};

   // Parse the command line, the defaults only fill in what it left unset
   CommandLine CmdL(Args,_config);
   if (CmdL.Parse(argc,argv) == false || repoInitConfig(*_config) == false)
   {
      _error->DumpErrors(err);
      ShowHelp(err);
      return 1;
   }

   if (_config->FindB("version") == true)
   {
      ShowVersion(out);
      return 0;
   }
   if (_config->FindB("help") == true)
   {
      ShowHelp(out);
      return 0;
   }

   if (CmdL.FileSize() != 0)
      _error->Error(_("Unexpected argument '%s'"), CmdL.FileList[0]);
   else if (_config->Find("Repo::Input").empty() == true ||
	    _config->Find("Repo::Output").empty() == true)
      _error->Error(_("Both an input and an output directory are required"));
   if (_error->PendingError() == true)
   {
      _error->DumpErrors(err);
      ShowHelp(err);
      return 1;
   }

   InitOutput(out.rdbuf());

   RepoBuildContext Context;
   Context.ReadConfig(*_config);
   DebInspector Inspector;
   bool const Res = BuildRepository(Context, Inspector);
   if (Res == true)
      ShowSourcesHint(Context, ReleaseWriter(Context).ListComponents());

   // Print any errors or warnings found during the build
   bool const Errors = _error->PendingError();
   _error->DumpErrors(err);
   return (Res == false || Errors == true) ? 1 : 0;
}
									/*}}}*/
