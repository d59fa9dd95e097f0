// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build context - state shared by the passes of one repository build

   The driver owns the context and hands it to the tree builder, the
   packages writer and the release writer in turn. It records which
   components were (re)built during this run, in the order they were
   first seen, and which architectures were encountered.

   ##################################################################### */
									/*}}}*/
#ifndef CONTEXT_H
#define CONTEXT_H

#include <set>
#include <string>
#include <vector>

class Configuration;

class RepoBuildContext
{
   std::vector<std::string> Components;
   std::set<std::string> Architectures;

   public:

   std::string InputDir;
   std::string OutputDir;
   std::string Distribution;
   std::string DefaultComponent;
   bool UseHardLinks;

   // <output>/dists/<distribution>
   std::string DistPath() const;
   std::string ComponentPath(std::string const &Component) const;
   std::string ArchPath(std::string const &Component, std::string const &Arch) const;

   /** \brief remember the component, \b false if it was already known */
   bool AddComponent(std::string const &Component);
   bool HasComponent(std::string const &Component) const;
   std::vector<std::string> const &GetComponents() const { return Components; };

   void AddArchitecture(std::string const &Arch) { Architectures.insert(Arch); };
   // sorted
   std::set<std::string> const &GetArchitectures() const { return Architectures; };

   /** \brief fill the settings from Repo::* and the given paths */
   void ReadConfig(Configuration const &Cnf);

   RepoBuildContext();
};

#endif
