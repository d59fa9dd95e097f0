// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   contents - Contents-<arch> files of a component

   The rows are not sorted or merged, a file shipped by two packages
   shows up twice, as does a package added twice.

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

#include "contents.h"

#include <repoi18n.h>
									/*}}}*/

ContentsWriter::ContentsWriter(std::string const &FileName, unsigned int const Width) :
   FileName(FileName), Width(Width)
{
}

// ContentsWriter::FormatRow - path padded to the column, then package	/*{{{*/
std::string ContentsWriter::FormatRow(std::string const &Path, std::string const &Package) const
{
   std::string Row;
   std::string const Name = REPO::String::Startswith(Path, "./") ? Path.substr(2) : Path;
   strprintf(Row, "%-*s %s\n", static_cast<int>(Width), Name.c_str(), Package.c_str());
   return Row;
}
									/*}}}*/
// ContentsWriter::Append - Add the files of one package		/*{{{*/
bool ContentsWriter::Append(std::string const &Package, std::vector<std::string> const &Files)
{
   FileFd Out;
   if (Out.Open(FileName, FileFd::WriteAppend, FileFd::None, 0644) == false)
      return _error->Error(_("Error opening contents file %s"), FileName.c_str());

   bool const Debug = _config->FindB("Debug::Repo::TreeBuilder", false);
   unsigned long Rows = 0;
   for (auto const &F : Files)
   {
      if (F.empty() == true || F.back() == '/')
	 continue;
      std::string const Row = FormatRow(F, Package);
      if (Out.Write(Row.c_str(), Row.length()) == false)
	 return false;
      ++Rows;
   }
   if (Debug == true)
      std::clog << "Contents " << FileName << ": " << Rows << " rows for " << Package << std::endl;
   return Out.Close();
}
									/*}}}*/
