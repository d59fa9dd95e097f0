// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Package inspector - read control data and file lists of .deb files

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/debfile.h>
#include <repo-pkg/dirstream.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/tagfile.h>

#include <algorithm>
#include <string>
#include <vector>

#include "inspector.h"

#include <repoi18n.h>
									/*}}}*/

namespace {
// FileListExtract - collect the names of all items			/*{{{*/
class FileListExtract : public pkgDirStream
{
   std::vector<std::string> &Files;

   public:

   virtual bool DoItem(Item &Itm, int &Fd) override
   {
      Fd = -1;
      std::string Name = Itm.Name;
      if (Itm.Type == Item::Directory && (Name.empty() == true || Name.back() != '/'))
	 Name.push_back('/');
      Files.push_back(Name);
      return true;
   }

   explicit FileListExtract(std::vector<std::string> &Files) : Files(Files) {}
};
									/*}}}*/
}

// DebInspector::ReadControl - control stanza of a .deb		/*{{{*/
bool DebInspector::ReadControl(std::string const &Package, std::string &Control)
{
   FileFd Fd;
   if (Fd.Open(Package, FileFd::ReadOnly) == false)
      return false;
   debDebFile Deb(Fd);
   if (_error->PendingError() == true)
      return _error->Error(_("Unable to read the control data of %s"), Package.c_str());

   debDebFile::MemControlExtract Extract("control");
   if (Extract.Read(Deb) == false)
      return _error->Error(_("Unable to read the control data of %s"), Package.c_str());
   Control = std::string(Extract.Section.Text());
   return true;
}
									/*}}}*/
// DebInspector::ReadFileList - installed paths of a .deb		/*{{{*/
bool DebInspector::ReadFileList(std::string const &Package, std::vector<std::string> &Files)
{
   FileFd Fd;
   if (Fd.Open(Package, FileFd::ReadOnly) == false)
      return false;
   debDebFile Deb(Fd);
   if (_error->PendingError() == true)
      return _error->Error(_("Unable to read the file list of %s"), Package.c_str());

   Files.clear();
   FileListExtract Extract(Files);
   if (Deb.ExtractArchive(Extract) == false)
      return _error->Error(_("Unable to read the file list of %s"), Package.c_str());
   return true;
}
									/*}}}*/
// ClassifyPackage - determine name and architecture			/*{{{*/
bool ClassifyPackage(PackageInspector &Inspector, std::string const &Package,
		     std::vector<std::string> const &SupportedArchs,
		     std::string &Name, std::string &Arch)
{
   std::string Control;
   if (Inspector.ReadControl(Package, Control) == false)
      return false;

   pkgTagSection Section;
   if (Section.Scan(Control.c_str(), Control.size()) == false)
      return _error->Error(_("Unparsable control file in %s"), Package.c_str());

   for (char const * const Field : {"Package", "Architecture"})
   {
      if (Section.Find(Field).empty() == false)
	 continue;
      return _error->Error(_("Missing field '%s' in the control file of %s"), Field, Package.c_str());
   }

   std::string const PkgArch = Section.FindS("Architecture");
   if (std::find(SupportedArchs.begin(), SupportedArchs.end(), PkgArch) == SupportedArchs.end())
      return _error->Error(_("Unsupported arch '%s' in '%s'"), PkgArch.c_str(), flNotDir(Package).c_str());

   Name = Section.FindS("Package");
   Arch = PkgArch;
   return true;
}
									/*}}}*/
