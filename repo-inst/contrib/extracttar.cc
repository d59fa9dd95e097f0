// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Extract a Tar - Tar Extractor

   The archive member is read through a second FileFd sharing the
   descriptor (and so the seek pointer) of the outer file. The compressed
   formats end on their own, a plain tar is bounded by the member size.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/dirstream.h>
#include <repo-pkg/error.h>
#include <repo-pkg/extracttar.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/strutl.h>

#include <algorithm>
#include <string>
#include <string.h>

#include <repoi18n.h>
									/*}}}*/

// ustar header, the rest of the 512 byte block is padding
struct ExtractTar::TarHeader
{
   char Name[100];
   char Mode[8];
   char UserID[8];
   char GroupID[8];
   char Size[12];
   char MTime[12];
   char Checksum[8];
   char LinkFlag;
   char LinkName[100];
   char MagicNumber[8];
   char UserName[32];
   char GroupName[32];
   char Major[8];
   char Minor[8];
};

ExtractTar::ExtractTar(FileFd &Fd,unsigned long long Max,std::string DecompressionProgram)
	: File(Fd), MaxInSize(Max), DecompressProg(DecompressionProgram), InPos(0)
{
}
ExtractTar::~ExtractTar()
{
   Done();
}
bool ExtractTar::Done()
{
   return InFd.Close();
}
// ExtractTar::StartDecompress - Open the member for reading		/*{{{*/
// ---------------------------------------------------------------------
/* The decompressor reads from the file at its current position, data
   following the compressed stream is ignored. */
bool ExtractTar::StartDecompress()
{
   InPos = 0;
   if (DecompressProg.empty() == true || DecompressProg == ".")
      return InFd.OpenDescriptor(File.Fd(), FileFd::ReadOnly, false);

   REPO::Configuration::Compressor Comp;
   if (REPO::Configuration::findCompressor(DecompressProg, Comp) == false)
      return _error->Error(_("Cannot find a configured compressor for '%s'"),
			   DecompressProg.c_str());
   return InFd.OpenDescriptor(File.Fd(), FileFd::ReadOnly, Comp, false);
}
									/*}}}*/
// ExtractTar::ReadBlock - Read from the member				/*{{{*/
// ---------------------------------------------------------------------
/* Reading stops at the end of the member even if the outer file goes
   on, the caller sees zeros there which end the archive. */
bool ExtractTar::ReadBlock(void *To, unsigned long long Size, bool AllowEof)
{
   if (InFd.IsCompressed() == true)
      return InFd.Read(To, Size, AllowEof);

   if (InPos >= MaxInSize)
   {
      memset(To, 0, Size);
      return true;
   }
   if (InPos + Size > MaxInSize)
      return _error->Error(_("Corrupted archive"));
   InPos += Size;
   return InFd.Read(To, Size);
}
									/*}}}*/
// ExtractTar::ReadPayload - the data blocks of an extension header	/*{{{*/
bool ExtractTar::ReadPayload(unsigned long long Size, std::string &Data)
{
   Data.clear();
   unsigned char Block[512];
   while (Size > 0)
   {
      if (ReadBlock(Block, sizeof(Block)) == false)
	 return false;
      unsigned long long const Used = std::min<unsigned long long>(Size, sizeof(Block));
      Data.append(reinterpret_cast<char *>(Block), Used);
      Size -= Used;
   }
   // GNU long names carry their terminating NUL in the payload
   Data.resize(strnlen(Data.c_str(), Data.size()));
   return true;
}
									/*}}}*/
// PaxRecord - value of Key in a pax extended header			/*{{{*/
// ---------------------------------------------------------------------
/* A pax header is a list of "<length> <key>=<value>\n" records */
static std::string PaxRecord(std::string const &Data, std::string const &Key)
{
   std::string::size_type Pos = 0;
   while (Pos < Data.size())
   {
      std::string::size_type const Space = Data.find(' ', Pos);
      if (Space == std::string::npos)
	 break;
      unsigned long const Length = strtoul(Data.c_str() + Pos, nullptr, 10);
      if (Length == 0 || Pos + Length > Data.size() || Space + 1 >= Pos + Length)
	 break;
      std::string const Record = Data.substr(Space + 1, Pos + Length - Space - 2);
      if (Record.compare(0, Key.length() + 1, Key + "=") == 0)
	 return Record.substr(Key.length() + 1);
      Pos += Length;
   }
   return std::string();
}
									/*}}}*/
// TarNumber - octal or GNU base-256 number field			/*{{{*/
template<typename T>
static bool TarNumber(char const * const Field, unsigned int const Len, T &Out)
{
   unsigned long long Value;
   if (Base256ToNum(Field, Value, Len) == false &&
       StrToNum(Field, Value, Len, 8) == false)
      return false;
   Out = Value;
   return true;
}
									/*}}}*/
// TarType - item type of a header type flag				/*{{{*/
static bool TarType(char const Flag, pkgDirStream::Item::Type_t &Type)
{
   switch (Flag)
   {
      case '\0': case '0': Type = pkgDirStream::Item::File; return true;
      case '1': Type = pkgDirStream::Item::HardLink; return true;
      case '2': Type = pkgDirStream::Item::SymbolicLink; return true;
      case '3': Type = pkgDirStream::Item::CharDevice; return true;
      case '4': Type = pkgDirStream::Item::BlockDevice; return true;
      case '5': Type = pkgDirStream::Item::Directory; return true;
      case '6': Type = pkgDirStream::Item::FIFO; return true;
   }
   return false;
}
									/*}}}*/
// ExtractTar::Go - Perform extraction					/*{{{*/
// ---------------------------------------------------------------------
/* Every header block is verified and decoded into an Item which is
   handed to the stream together with the data following it. Long names
   from GNU and pax extension headers apply to the next real item. */
bool ExtractTar::Go(pkgDirStream &Stream)
{
   if (StartDecompress() == false)
      return false;

   std::string LongName, LongLink;
   std::string Name, Link;
   while (true)
   {
      unsigned char Block[512];
      if (ReadBlock(Block, sizeof(Block), true) == false)
	 return false;
      if (InFd.Eof() == true)
	 break;

      TarHeader * const Tar = reinterpret_cast<TarHeader *>(Block);
      unsigned long Stored;
      bool const HaveSum = StrToNum(Tar->Checksum, Stored, sizeof(Tar->Checksum), 8);
      // the checksum is taken with its own field read as spaces
      memset(Tar->Checksum, ' ', sizeof(Tar->Checksum));
      unsigned long Sum = 0;
      for (auto const B : Block)
	 Sum += B;
      if (Sum == ' ' * sizeof(Tar->Checksum))
	 return Done();
      if (HaveSum == false)
	 return _error->Error(_("Corrupted archive"));
      if (Sum != Stored)
	 return _error->Error(_("Tar checksum failed, archive corrupted"));

      pkgDirStream::Item Itm;
      if (TarNumber(Tar->Mode, sizeof(Tar->Mode), Itm.Mode) == false ||
	  TarNumber(Tar->Size, sizeof(Tar->Size), Itm.Size) == false)
	 return _error->Error(_("Corrupted archive"));

      if (Tar->LinkFlag == 'K' || Tar->LinkFlag == 'L' ||
	  Tar->LinkFlag == 'x' || Tar->LinkFlag == 'g')
      {
	 std::string Data;
	 if (ReadPayload(Itm.Size, Data) == false)
	    return false;
	 if (Tar->LinkFlag == 'K')
	    LongLink = Data;
	 else if (Tar->LinkFlag == 'L')
	    LongName = Data;
	 else if (Tar->LinkFlag == 'x')
	 {
	    std::string Value = PaxRecord(Data, "path");
	    if (Value.empty() == false)
	       LongName = Value;
	    Value = PaxRecord(Data, "linkpath");
	    if (Value.empty() == false)
	       LongLink = Value;
	 }
	 continue;
      }

      // the header fields are not terminated if they use all 100 bytes
      Name = LongName.empty() == false ? LongName : std::string(Tar->Name, strnlen(Tar->Name, sizeof(Tar->Name)));
      Link = LongLink.empty() == false ? LongLink : std::string(Tar->LinkName, strnlen(Tar->LinkName, sizeof(Tar->LinkName)));
      LongName.clear();
      LongLink.clear();
      if (Name.length() > 2 && Name.compare(0, 2, "./") == 0)
	 Name.erase(0, 2);
      Itm.Name = &Name[0];
      Itm.LinkTarget = &Link[0];

      bool const Known = TarType(Tar->LinkFlag, Itm.Type);
      if (Known == false)
	 _error->Warning(_("Unknown TAR header type %u"), (unsigned)Tar->LinkFlag);

      int Fd = -1;
      if (Known == true && Stream.DoItem(Itm, Fd) == false)
	 return false;

      unsigned long long Left = Itm.Size;
      while (Left != 0)
      {
	 unsigned char Data[32*1024];
	 unsigned long long const Chunk = std::min<unsigned long long>(Left, sizeof(Data));
	 if (ReadBlock(Data, ((Chunk + 511) / 512) * 512) == false)
	    return false;
	 if (Known == true)
	 {
	    // -2 hands the data to Process, any other negative Fd skips it
	    if (Fd > 0 && FileFd::Write(Fd, Data, Chunk) == false)
	       return Stream.Fail(Itm, Fd);
	    if (Fd == -2 && Stream.Process(Itm, Data, Chunk, Itm.Size - Left) == false)
	       return Stream.Fail(Itm, Fd);
	 }
	 Left -= Chunk;
      }

      if (Known == true && Stream.FinishedFile(Itm, Fd) == false)
	 return false;
   }

   return Done();
}
									/*}}}*/
