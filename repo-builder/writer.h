// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Writer

   The index writers. PackagesWriter produces the Packages files of a
   component (and compresses its Contents files), ReleaseWriter the
   Release file of the distribution with the checksums of all of them.

   ##################################################################### */
									/*}}}*/
#ifndef WRITER_H
#define WRITER_H

#include <repo-pkg/hashes.h>

#include <string>
#include <utility>
#include <vector>

class PackageInspector;
class RepoBuildContext;

class PackagesWriter
{
   RepoBuildContext const &Context;
   PackageInspector &Inspector;

   public:

   unsigned int DoHashes;

   /** \brief the Packages stanza of a package placed in binary-<Arch> */
   bool DoPackage(std::string const &FileName, std::string const &Component,
		  std::string const &Arch, std::string &Stanza);
   /** \brief write Packages and its compressed variants for one directory */
   bool Generate(std::string const &Component, std::string const &Arch);
   /** \brief all binary-* directories of the component, then its Contents */
   bool GenerateComponent(std::string const &Component);

   PackagesWriter(RepoBuildContext const &Context, PackageInspector &Inspector);
};

class ReleaseWriter
{
   RepoBuildContext const &Context;

   public:

   unsigned int DoHashes;

   struct CheckSum
   {
      HashStringList Hashes;
      unsigned long long size;
   };

   /** \brief components present on disk, sorted */
   std::vector<std::string> ListComponents() const;
   /** \brief index files of a component, relative to the distribution */
   std::vector<std::string> ListIndexFiles(std::string const &Component) const;
   bool DoFile(std::string const &RelName);
   /** \brief write <dist>/Release
    *
    *  \param[out] ReleaseFile path of the written file */
   bool Generate(std::string &ReleaseFile);

   ReleaseWriter(RepoBuildContext const &Context);

   protected:
   // in the order the files were added
   std::vector<std::pair<std::string, CheckSum>> CheckSums;
};

#endif
