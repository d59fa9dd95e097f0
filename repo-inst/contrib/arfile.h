// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   AR File - Index the members of an 'ar' archive

   A .deb is an ar archive. The index records where the data of every
   member starts and how long it is, reading the data is left to the
   caller who positions the FileFd at Member::Start.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_ARFILE_H
#define REPO_ARFILE_H

#include <repo-pkg/macros.h>

#include <string>
#include <vector>

class FileFd;

class REPO_PUBLIC ARArchive
{
   public:
   struct Member
   {
      std::string Name;
      unsigned long MTime = 0;
      unsigned long Mode = 0;
      unsigned long long Size = 0;
      // offset of the data in the archive
      unsigned long long Start = 0;
   };

   private:
   FileFd &File;
   std::vector<Member> List;

   bool ReadIndex();
   bool ReadMemberHeader(unsigned long long &Left, Member &Memb);

   public:
   const Member *FindMember(const char *Name) const;
   /** all members in archive order, empty if the archive is broken */
   std::vector<Member> const &Members() const { return List; }

   explicit ARArchive(FileFd &File);
};

#endif
