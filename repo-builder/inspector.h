// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Package inspector - read what the builder needs out of a package

   The builder only ever asks two questions about a package file: what
   its control stanza says and which files it installs. PackageInspector
   is that interface, DebInspector answers it by reading the .deb
   archive directly.

   ##################################################################### */
									/*}}}*/
#ifndef INSPECTOR_H
#define INSPECTOR_H

#include <string>
#include <vector>

class PackageInspector
{
   public:

   /** \brief the control stanza, ending in exactly one newline */
   virtual bool ReadControl(std::string const &Package, std::string &Control) = 0;
   /** \brief paths of data.tar in archive order without a leading ./
    *
    *  Directories end in a '/'. */
   virtual bool ReadFileList(std::string const &Package, std::vector<std::string> &Files) = 0;

   virtual ~PackageInspector() {};
};

class DebInspector : public PackageInspector
{
   public:

   virtual bool ReadControl(std::string const &Package, std::string &Control) override;
   virtual bool ReadFileList(std::string const &Package, std::vector<std::string> &Files) override;

   virtual ~DebInspector() {};
};

/** \brief find name and architecture of a package
 *
 *  Fails if the control stanza lacks Package or Architecture, or if the
 *  architecture is not in SupportedArchs. Nothing is written in any case.
 */
bool ClassifyPackage(PackageInspector &Inspector, std::string const &Package,
		     std::vector<std::string> const &SupportedArchs,
		     std::string &Name, std::string &Arch);

#endif
