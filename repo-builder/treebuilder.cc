// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Tree Builder - place packages into dists/<dist>/<component>/binary-<arch>

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/strutl.h>

#include <iostream>
#include <string>
#include <vector>

#include <errno.h>
#include <unistd.h>

#include "contents.h"
#include "context.h"
#include "inspector.h"
#include "termux-apt-repo.h"
#include "treebuilder.h"

#include <repoi18n.h>
									/*}}}*/

// ReadContentsWidth - column the package names are padded to		/*{{{*/
static unsigned int ReadContentsWidth()
{
   int const Width = _config->FindI("Repo::Contents::Width", 80);
   if (Width > 0)
      return Width;
   _error->Warning(_("Ignoring invalid Repo::Contents::Width %d, using %d"), Width, 80);
   return 80;
}
									/*}}}*/
// TreeBuilder::TreeBuilder - Constructor				/*{{{*/
TreeBuilder::TreeBuilder(RepoBuildContext &Context, PackageInspector &Inspector) :
   Context(Context), Inspector(Inspector),
   SupportedArchs(REPO::Configuration::getArchitectures()),
   ContentsWidth(ReadContentsWidth())
{
}
									/*}}}*/
// TreeBuilder::FindPackages - discover the input packages		/*{{{*/
// ---------------------------------------------------------------------
/* Packages in the input directory come first, then those one level
   below, each group sorted. */
std::vector<std::string> TreeBuilder::FindPackages() const
{
   std::vector<std::string> List = Glob(flCombine(Context.InputDir, "*.deb"));
   std::vector<std::string> const Sub = Glob(flCombine(Context.InputDir, "*/*.deb"));
   List.insert(List.end(), Sub.begin(), Sub.end());
   return List;
}
									/*}}}*/
// TreeBuilder::ComponentFor - component of a discovered package	/*{{{*/
std::string TreeBuilder::ComponentFor(std::string const &Package) const
{
   std::string Rel = Package;
   if (REPO::String::Startswith(Rel, Context.InputDir) == true)
      Rel.erase(0, Context.InputDir.length());
   while (Rel.empty() == false && Rel[0] == '/')
      Rel.erase(0, 1);

   std::string::size_type const Slash = Rel.rfind('/');
   if (Slash == std::string::npos)
      return Context.DefaultComponent;
   std::string Dir = Rel.substr(0, Slash);
   std::string::size_type const Parent = Dir.rfind('/');
   if (Parent != std::string::npos)
      Dir.erase(0, Parent + 1);
   if (Dir.empty() == true || Dir == ".")
      return Context.DefaultComponent;
   return Dir;
}
									/*}}}*/
// TreeBuilder::Materialize - hard link or copy a package		/*{{{*/
// ---------------------------------------------------------------------
/* A copy is synced to disk before returning, a failed copy is removed */
bool TreeBuilder::Materialize(std::string const &From, std::string const &To)
{
   if (Context.UseHardLinks == true)
   {
      if (unlink(To.c_str()) != 0 && errno != ENOENT)
	 return _error->Errno("unlink", _("Unable to remove %s"), To.c_str());
      if (link(From.c_str(), To.c_str()) != 0)
	 return _error->Errno("link", _("Unable to link %s to %s"), From.c_str(), To.c_str());
      return true;
   }

   FileFd In, Out;
   if (In.Open(From, FileFd::ReadOnly) == false)
      return _error->Error(_("Error copying file '%s'"), From.c_str());
   if (Out.Open(To, FileFd::WriteOnly | FileFd::Create | FileFd::Empty, FileFd::None, 0644) == false)
      return _error->Error(_("Error copying file '%s'"), From.c_str());
   Out.EraseOnFailure();
   if (CopyFile(In, Out) == false || Out.Sync() == false)
   {
      Out.OpFail();
      Out.Close();
      return _error->Error(_("Error copying file '%s'"), From.c_str());
   }
   return Out.Close();
}
									/*}}}*/
// TreeBuilder::Add - Add a single package to the tree			/*{{{*/
bool TreeBuilder::Add(std::string const &Package)
{
   bool const Debug = _config->FindB("Debug::Repo::TreeBuilder", false);
   std::string const Component = ComponentFor(Package);
   if (Context.AddComponent(Component) == true)
   {
      std::string const ComponentDir = Context.ComponentPath(Component);
      if (Debug == true)
	 std::clog << "New component " << Component << ", clearing " << ComponentDir << std::endl;
      if (RemoveDirectoryTree("TreeBuilder::Add", ComponentDir) == false)
	 return false;
   }

   std::string Name, Arch;
   if (ClassifyPackage(Inspector, Package, SupportedArchs, Name, Arch) == false)
      return false;
   Context.AddArchitecture(Arch);

   std::string const ArchDir = Context.ArchPath(Component, Arch);
   if (CreateDirectory(Context.OutputDir, ArchDir) == false)
      return false;

   ioprintf(c0out, _("Adding deb file: %s\n"), flNotDir(Package).c_str());
   std::string const Target = flCombine(ArchDir, flNotDir(Package));
   if (Debug == true)
      std::clog << Package << " -> " << Target << " (" << Name << ", " << Arch << ")" << std::endl;
   if (Materialize(Package, Target) == false)
      return false;

   std::vector<std::string> Files;
   if (Inspector.ReadFileList(Target, Files) == false)
      return false;

   ContentsWriter Contents(flCombine(Context.ComponentPath(Component), "Contents-" + Arch), ContentsWidth);
   return Contents.Append(Name, Files);
}
									/*}}}*/
