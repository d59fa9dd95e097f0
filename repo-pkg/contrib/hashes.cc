// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Hashes - digests of files for the index writers

   Every enabled algorithm has its own OpenSSL EVP context, all of them
   are updated from the same buffer so a file is read only once.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/hashes.h>
#include <repo-pkg/macros.h>

#include <algorithm>
#include <memory>
#include <string>
#include <strings.h>

#include <openssl/evp.h>

#include <repoi18n.h>
									/*}}}*/

HashString const * HashStringList::find(char const * const type) const /*{{{*/
{
   if (type == nullptr)
      return nullptr;
   for (auto const &hs : list)
      if (strcasecmp(hs.HashType().c_str(), type) == 0)
	 return &hs;
   return nullptr;
}
									/*}}}*/
bool HashStringList::push_back(HashString const &hashString)		/*{{{*/
{
   if (hashString.HashType().empty() == true || hashString.HashValue().empty() == true)
      return false;
   if (find(hashString.HashType()) != nullptr)
      return false;
   list.push_back(hashString);
   return true;
}
									/*}}}*/

// Algorithms - field name, digest and flag in output order		/*{{{*/
struct HashAlgorithm
{
   char const * const Name;
   EVP_MD const *(* const Digest)();
   Hashes::SupportedHashes const Flag;
};
static HashAlgorithm const Algorithms[] = {
   {"MD5Sum", EVP_md5, Hashes::MD5SUM},
   {"SHA1", EVP_sha1, Hashes::SHA1SUM},
   {"SHA256", EVP_sha256, Hashes::SHA256SUM},
   {"SHA512", EVP_sha512, Hashes::SHA512SUM},
};
static constexpr size_t AlgorithmCount = sizeof(Algorithms) / sizeof(Algorithms[0]);
									/*}}}*/
class PrivateHashes							/*{{{*/
{
   public:
   EVP_MD_CTX *Contexts[AlgorithmCount] = {};
   unsigned long long Size = 0;

   explicit PrivateHashes(unsigned int const Enabled)
   {
      for (size_t I = 0; I != AlgorithmCount; ++I)
      {
	 if ((Enabled & Algorithms[I].Flag) == 0)
	    continue;
	 EVP_MD_CTX * const Ctx = EVP_MD_CTX_new();
	 if (Ctx != nullptr && EVP_DigestInit_ex(Ctx, Algorithms[I].Digest(), nullptr) == 1)
	    Contexts[I] = Ctx;
	 else
	 {
	    EVP_MD_CTX_free(Ctx);
	    _error->Error(_("Unable to initialise the %s digest"), Algorithms[I].Name);
	 }
      }
   }
   ~PrivateHashes()
   {
      for (auto Ctx : Contexts)
	 EVP_MD_CTX_free(Ctx);
   }

   // hex of the digest so far, the context itself keeps going
   std::string Hex(EVP_MD_CTX const * const Ctx) const
   {
      unsigned char Sum[EVP_MAX_MD_SIZE];
      unsigned int Len = 0;
      std::unique_ptr<EVP_MD_CTX, void (*)(EVP_MD_CTX *)> Copy(EVP_MD_CTX_new(), EVP_MD_CTX_free);
      if (Copy == nullptr || EVP_MD_CTX_copy_ex(Copy.get(), Ctx) != 1 ||
	  EVP_DigestFinal_ex(Copy.get(), Sum, &Len) != 1)
	 return "";

      static char const Digits[] = "0123456789abcdef";
      std::string Res;
      Res.reserve(Len * 2);
      for (unsigned int I = 0; I != Len; ++I)
      {
	 Res.push_back(Digits[Sum[I] >> 4]);
	 Res.push_back(Digits[Sum[I] & 0x0f]);
      }
      return Res;
   }
};
									/*}}}*/
// Hashes::Add - feed data to every enabled digest			/*{{{*/
bool Hashes::Add(const unsigned char * const Data, unsigned long long const Size)
{
   d->Size += Size;
   for (auto Ctx : d->Contexts)
      if (Ctx != nullptr && EVP_DigestUpdate(Ctx, Data, Size) != 1)
	 return _error->Error(_("Unable to update the digests"));
   return true;
}
									/*}}}*/
// Hashes::AddFD - feed (a part of) a file				/*{{{*/
bool Hashes::AddFD(FileFd &Fd,unsigned long long Size)
{
   bool const Everything = (Size == 0);
   std::unique_ptr<unsigned char[]> Buf(new unsigned char[REPO_BUFFER_SIZE]);
   while (Everything == true || Size != 0)
   {
      unsigned long long Want = REPO_BUFFER_SIZE;
      if (Everything == false)
	 Want = std::min(Want, Size);

      unsigned long long Got = 0;
      if (Fd.Read(Buf.get(), Want, &Got) == false)
	 return false;
      if (Got == 0 && Everything == true)
	 break;
      // a part was requested, but the file ended before
      if (Got != Want && Everything == false)
	 return false;
      if (Add(Buf.get(), Got) == false)
	 return false;
      if (Everything == false)
	 Size -= Got;
   }
   return true;
}
									/*}}}*/
HashStringList Hashes::GetHashStringList() const			/*{{{*/
{
   HashStringList List;
   for (size_t I = 0; I != AlgorithmCount; ++I)
      if (d->Contexts[I] != nullptr)
	 List.push_back(HashString(Algorithms[I].Name, d->Hex(d->Contexts[I])));
   List.FileSize(d->Size);
   return List;
}
									/*}}}*/
Hashes::Hashes(unsigned int const Hashes) : d(new PrivateHashes(Hashes)) {}
Hashes::~Hashes() { delete d; }
