// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   contents - Contents-<arch> files of a component

   A contents file is an append-only log: every package added to a
   component appends one row per installed file, the path padded to the
   column width followed by the package name.

   ##################################################################### */
									/*}}}*/
#ifndef CONTENTS_H
#define CONTENTS_H

#include <string>
#include <vector>

class ContentsWriter
{
   std::string const FileName;
   unsigned int const Width;

   public:

   /** \brief format a single row, including the newline */
   std::string FormatRow(std::string const &Path, std::string const &Package) const;
   /** \brief append the rows of a package, directories are skipped
    *
    *  The file is opened and closed by every call. */
   bool Append(std::string const &Package, std::vector<std::string> const &Files);

   ContentsWriter(std::string const &FileName, unsigned int const Width = 80);
};

#endif
