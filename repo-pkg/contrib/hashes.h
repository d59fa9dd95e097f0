// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Hashes - digests of files for the index writers

   The index writers feed files through a Hashes object and format the
   resulting HashStringList. Names of the algorithms are the field
   names used in Packages and Release files: MD5Sum, SHA1, SHA256 and
   SHA512.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_HASHES_H
#define REPO_HASHES_H

#include <repo-pkg/macros.h>

#include <cstring>
#include <utility>
#include <string>
#include <vector>

class FileFd;

/** \brief a digest in hex together with the name of its algorithm */
class REPO_PUBLIC HashString
{
   std::string Type;
   std::string Hash;

   public:
   HashString(std::string Type, std::string Hash) : Type(std::move(Type)), Hash(std::move(Hash)) {}

   std::string const &HashType() const { return Type; }
   std::string const &HashValue() const { return Hash; }
};

class REPO_PUBLIC HashStringList
{
   std::vector<HashString> list;
   unsigned long long fileSize = 0;

   public:
   /** the hash of the given type, the type is matched ignoring case
    *
    *  @return \b nullptr if the list has no such hash */
   HashString const * find(char const * const type) const;
   HashString const * find(std::string const &type) const { return find(type.c_str()); }

   /** the size of the hashed data */
   unsigned long long FileSize() const { return fileSize; }
   void FileSize(unsigned long long const Size) { fileSize = Size; }

   /** add a hash, a second one of the same type is refused */
   bool push_back(HashString const &hashString);
   size_t size() const { return list.size(); }
   bool empty() const { return list.empty(); }

   typedef std::vector<HashString>::const_iterator const_iterator;
   const_iterator begin() const { return list.begin(); }
   const_iterator end() const { return list.end(); }
};

class PrivateHashes;
class REPO_PUBLIC Hashes
{
   PrivateHashes * const d;

   public:
   enum SupportedHashes { MD5SUM = (1 << 0), SHA1SUM = (1 << 1), SHA256SUM = (1 << 2),
      SHA512SUM = (1 << 3) };

   bool Add(const unsigned char * const Data, unsigned long long const Size) REPO_NONNULL(2);
   inline bool Add(const char * const Data) REPO_NONNULL(2)
   {return Add(reinterpret_cast<unsigned char const *>(Data),strlen(Data));};

   /** hash Size bytes of Fd, everything up to the end if Size is 0 */
   bool AddFD(FileFd &Fd,unsigned long long Size = 0);

   /** all calculated hashes in MD5Sum, SHA1, SHA256, SHA512 order */
   HashStringList GetHashStringList() const;

   /** @param Hashes bitflag composed of #SupportedHashes */
   explicit Hashes(unsigned int const Hashes = ~0u);
   Hashes(Hashes const &) = delete;
   Hashes &operator=(Hashes const &) = delete;
   ~Hashes();
};

#endif
