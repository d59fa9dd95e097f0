// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Tree Builder - place packages into dists/<dist>/<component>/binary-<arch>

   Packages are added one by one in discovery order. The component of a
   package is the directory it was found in below the input directory,
   packages directly in the input directory go to the default component.
   A component is wiped the first time it is seen in a run.

   ##################################################################### */
									/*}}}*/
#ifndef TREEBUILDER_H
#define TREEBUILDER_H

#include <string>
#include <vector>

class PackageInspector;
class RepoBuildContext;

class TreeBuilder
{
   RepoBuildContext &Context;
   PackageInspector &Inspector;
   std::vector<std::string> const SupportedArchs;
   unsigned int const ContentsWidth;

   bool Materialize(std::string const &From, std::string const &To);

   public:

   /** \brief component of a package found at Package below the input directory */
   std::string ComponentFor(std::string const &Package) const;
   /** \brief all *.deb of the input directory and its immediate subdirectories */
   std::vector<std::string> FindPackages() const;

   bool Add(std::string const &Package);

   TreeBuilder(RepoBuildContext &Context, PackageInspector &Inspector);
};

#endif
