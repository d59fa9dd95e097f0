// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build context - state shared by the passes of one repository build

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/fileutl.h>

#include <algorithm>
#include <string>
#include <vector>

#include "context.h"
									/*}}}*/

RepoBuildContext::RepoBuildContext() : UseHardLinks(false)
{
}

// RepoBuildContext::ReadConfig - settings of this run			/*{{{*/
void RepoBuildContext::ReadConfig(Configuration const &Cnf)
{
   InputDir = Cnf.Find("Repo::Input");
   OutputDir = Cnf.Find("Repo::Output");
   Distribution = Cnf.Find("Repo::Distribution", "termux");
   DefaultComponent = Cnf.Find("Repo::Component", "extras");
   UseHardLinks = Cnf.FindB("Repo::Use-Hard-Links", false);
}
									/*}}}*/
std::string RepoBuildContext::DistPath() const				/*{{{*/
{
   return flCombine(flCombine(OutputDir, "dists"), Distribution);
}
									/*}}}*/
std::string RepoBuildContext::ComponentPath(std::string const &Component) const/*{{{*/
{
   return flCombine(DistPath(), Component);
}
									/*}}}*/
std::string RepoBuildContext::ArchPath(std::string const &Component, std::string const &Arch) const/*{{{*/
{
   return flCombine(ComponentPath(Component), "binary-" + Arch);
}
									/*}}}*/
bool RepoBuildContext::AddComponent(std::string const &Component)	/*{{{*/
{
   if (HasComponent(Component) == true)
      return false;
   Components.push_back(Component);
   return true;
}
									/*}}}*/
bool RepoBuildContext::HasComponent(std::string const &Component) const	/*{{{*/
{
   return std::find(Components.begin(), Components.end(), Component) != Components.end();
}
									/*}}}*/
