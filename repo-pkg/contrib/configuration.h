// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   Options of a repository build, filled from defaults, the optional
   configuration file and the command line, in that order.

   A name is a path of tags separated by '::', e.g.
     Repo::Contents::Width
   Tags are matched case insensitively. A node without a tag is a list
   item, e.g. an entry of Repo::Architectures.

   The file format is the usual apt-style one:
     Repo::Distribution "termux";
     Repo::Architectures { "all"; "arm"; "aarch64"; };

   ##################################################################### */
									/*}}}*/
#ifndef REPO_CONFIGURATION_H
#define REPO_CONFIGURATION_H

#include <list>
#include <string>
#include <vector>

#include <repo-pkg/macros.h>


class REPO_PUBLIC Configuration
{
   struct Node
   {
      std::string Tag;
      std::string Value;
      std::list<Node> Children;
   };
   Node Root;

   /* Create adds missing nodes; a trailing '::' then appends a list item */
   Node *Walk(std::string const &Name, bool const Create);
   const Node *Walk(std::string const &Name) const
   {
      return const_cast<Configuration *>(this)->Walk(Name, false);
   }

   public:

   std::string Find(const char *Name,const char *Default = 0) const;
   std::string Find(std::string const &Name,const char *Default = 0) const {return Find(Name.c_str(),Default);};
   std::string Find(std::string const &Name, std::string const &Default) const {return Find(Name.c_str(),Default.c_str());};
   /** return a list of child options
    *
    * If the node carries a value instead of children it is split at
    * commas. Default is used the same way if the node does not exist.
    *
    * \param Name of the parent node
    * \param Default list of values separated by commas */
   std::vector<std::string> FindVector(const char *Name, std::string const &Default = "") const;
   std::vector<std::string> FindVector(std::string const &Name, std::string const &Default = "") const { return FindVector(Name.c_str(), Default); };

   /** an unset or unparsable value gives Default */
   int FindI(const char *Name,int const &Default = 0) const;
   int FindI(std::string const &Name,int const &Default = 0) const {return FindI(Name.c_str(),Default);};
   bool FindB(const char *Name,bool const &Default = false) const;
   bool FindB(std::string const &Name,bool const &Default = false) const {return FindB(Name.c_str(),Default);};

   inline void Set(const std::string &Name,const std::string &Value) {Set(Name.c_str(),Value);};
   void Set(const char *Name,const std::string &Value);
   void Set(const char *Name,const int &Value);
   /** set Name only if it has no value yet */
   void CndSet(const char *Name,const std::string &Value);
   void CndSet(const char *Name,const int Value);

   inline bool Exists(const std::string &Name) const {return Exists(Name.c_str());};
   bool Exists(const char *Name) const;

   /** remove Name with everything below it */
   void Clear(const std::string &Name);

   Configuration() = default;
   Configuration(Configuration const &) = delete;
   Configuration &operator=(Configuration const &) = delete;
};

REPO_PUBLIC extern Configuration *_config;

REPO_PUBLIC bool ReadConfigFile(Configuration &Conf,const std::string &FName);

#endif
