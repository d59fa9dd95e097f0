// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   AR File - Index the members of an 'ar' archive

   The archive is the magic "!<arch>\n" followed by members, each one a
   60 byte text header and its data padded to an even length. GNU ar
   ends short names with a '/', BSD ar pads them with spaces and stores
   long names as "#1/<len>" in front of the data. See ar(5).

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/arfile.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/strutl.h>

#include <string>
#include <vector>
#include <string.h>

#include <repoi18n.h>
									/*}}}*/

static char const ArMagic[] = "!<arch>\n";
static constexpr size_t ArMagicSize = sizeof(ArMagic) - 1;

// the on-disk header, all fields are space padded ascii
struct ArHeader
{
   char Name[16];
   char MTime[12];
   char UID[6];
   char GID[6];
   char Mode[8];
   char Size[10];
   char End[2];
};
static_assert(sizeof(ArHeader) == 60, "ar member headers are 60 bytes");

ARArchive::ARArchive(FileFd &File) : File(File)
{
   if (ReadIndex() == false)
      List.clear();
}
// ARArchive::ReadMemberHeader - parse the header at the current offset	/*{{{*/
bool ARArchive::ReadMemberHeader(unsigned long long &Left, Member &Memb)
{
   ArHeader Head;
   if (Left < sizeof(Head) || File.Read(&Head, sizeof(Head)) == false)
      return _error->Error(_("Error reading archive member header"));
   Left -= sizeof(Head);

   if (memcmp(Head.End, "`\n", sizeof(Head.End)) != 0 ||
       StrToNum(Head.MTime, Memb.MTime, sizeof(Head.MTime)) == false ||
       StrToNum(Head.Mode, Memb.Mode, sizeof(Head.Mode), 8) == false ||
       StrToNum(Head.Size, Memb.Size, sizeof(Head.Size)) == false)
      return _error->Error(_("Invalid archive member header"));

   if (strncmp(Head.Name, "#1/", 3) != 0)
   {
      size_t Len = sizeof(Head.Name);
      while (Len != 0 && (Head.Name[Len - 1] == ' ' || Head.Name[Len - 1] == '/'))
	 --Len;
      Memb.Name.assign(Head.Name, Len);
      return true;
   }

   // BSD: the name is the start of the data
   unsigned long NameLen = 0;
   if (StrToNum(Head.Name + 3, NameLen, sizeof(Head.Name) - 3) == false ||
       NameLen > Memb.Size || NameLen > 256 || NameLen > Left)
      return _error->Error(_("Invalid archive member header"));
   Memb.Name.resize(NameLen);
   if (NameLen != 0 && File.Read(&Memb.Name[0], NameLen) == false)
      return false;
   Memb.Size -= NameLen;
   Left -= NameLen;
   return true;
}
									/*}}}*/
// ARArchive::ReadIndex - walk all member headers			/*{{{*/
bool ARArchive::ReadIndex()
{
   unsigned long long Left = File.FileSize();

   char Magic[ArMagicSize];
   if (Left < sizeof(Magic) || File.Read(Magic, sizeof(Magic)) == false ||
       memcmp(Magic, ArMagic, sizeof(Magic)) != 0)
      return _error->Error(_("Invalid archive signature"));
   Left -= sizeof(Magic);

   while (Left != 0)
   {
      Member Memb;
      if (ReadMemberHeader(Left, Memb) == false)
	 return false;
      if (Memb.Size > Left)
	 return _error->Error(_("Archive is too short"));

      Memb.Start = File.Tell();
      // the last member may come without its padding byte
      unsigned long long Span = Memb.Size;
      if (Span % 2 != 0 && Span != Left)
	 ++Span;
      if (File.Skip(Span) == false)
	 return false;
      Left -= Span;
      List.push_back(std::move(Memb));
   }
   return true;
}
									/*}}}*/
// ARArchive::FindMember - a member by its name				/*{{{*/
const ARArchive::Member *ARArchive::FindMember(const char *Name) const
{
   for (auto const &Memb : List)
      if (Memb.Name == Name)
	 return &Memb;
   return nullptr;
}
									/*}}}*/
