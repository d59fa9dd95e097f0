// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Signer - sign the Release file with gpg

   gpg is run as a child process, Dir::Bin::gpg names the binary. The
   key is the default key of gpg unless Repo::Sign::Key is set.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>

#include <iostream>
#include <string>
#include <vector>

#include <unistd.h>

#include "signer.h"

#include <repoi18n.h>
									/*}}}*/

// SignCommandLine - gpg invocation					/*{{{*/
std::vector<std::string> SignCommandLine(std::string const &Release, std::string const &Output, bool const Detached)
{
   std::vector<std::string> Args;
   Args.push_back(_config->Find("Dir::Bin::gpg", "gpg"));
   Args.push_back("--yes");
   Args.push_back("--pinentry-mode");
   Args.push_back("loopback");
   Args.push_back("--digest-algo");
   Args.push_back(_config->Find("Repo::Sign::DigestAlgo", "SHA256"));
   std::string const Key = _config->Find("Repo::Sign::Key");
   if (Key.empty() == false)
   {
      Args.push_back("--local-user");
      Args.push_back(Key);
   }
   if (Detached == true)
      Args.push_back("--detach-sign");
   else
      Args.push_back("--clearsign");
   Args.push_back("--armor");
   Args.push_back("-o");
   Args.push_back(Output);
   Args.push_back(Release);
   return Args;
}
									/*}}}*/
// RunSigner - run gpg and wait for it					/*{{{*/
static bool RunSigner(std::vector<std::string> const &Args, std::string const &Output)
{
   if (_config->FindB("Debug::Repo::Writer", false) == true)
   {
      std::clog << "Running";
      for (auto const &A : Args)
	 std::clog << ' ' << A;
      std::clog << std::endl;
   }

   // Translate the argument list to a C array. This should happen before
   // the fork so we don't allocate memory between fork() and execvp().
   std::vector<const char *> cArgs;
   cArgs.reserve(Args.size() + 1);
   for (auto const &arg : Args)
      cArgs.push_back(arg.c_str());
   cArgs.push_back(nullptr);

   pid_t const Child = ExecFork();
   if (Child < 0)
      return _error->Errno("fork", _("Fork failed for %s to sign %s"), Args[0].c_str(), Args.back().c_str());
   if (Child == 0)
   {
      execvp(cArgs[0], (char **) &cArgs[0]);
      std::cerr << "Couldn't execute " << Args[0] << " to sign " << Args.back() << std::endl;
      _exit(100);
   }

   if (ExecWait(Child, Args[0].c_str()) == false)
   {
      if (FileExists(Output) == true)
	 RemoveFile("SignRelease", Output);
      return false;
   }
   if (RealFileExists(Output) == false)
      return _error->Error(_("%s did not create %s"), Args[0].c_str(), Output.c_str());
   return true;
}
									/*}}}*/
// SignRelease - InRelease and optionally Release.gpg			/*{{{*/
bool SignRelease(std::string const &Release, std::string &SignedFile)
{
   std::string const Dir = flNotFile(Release);
   std::string const InRelease = flCombine(Dir, "InRelease");
   if (RunSigner(SignCommandLine(Release, InRelease, false), InRelease) == false)
      return false;

   if (_config->FindB("Repo::Sign::Detached", false) == true)
   {
      std::string const Detached = Release + ".gpg";
      if (RunSigner(SignCommandLine(Release, Detached, true), Detached) == false)
      {
	 RemoveFile("SignRelease", InRelease);
	 return false;
      }
   }

   SignedFile = InRelease;
   return true;
}
									/*}}}*/
