// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   MultiCompressor

   Every output gets its own FileFd with the matching compressor, the
   compression itself happens in-process.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/repoconfiguration.h>
#include <repo-pkg/strutl.h>

#include <ctype.h>
#include <iostream>
#include <string>
#include <vector>

#include "multicompress.h"

#include <repoi18n.h>
									/*}}}*/

static std::vector<REPO::Configuration::Compressor>::const_iterator findMatchingCompressor(std::string::const_iterator &I,
      std::string::const_iterator const &End, std::vector<REPO::Configuration::Compressor> const &Compressors)
{
      // Grab a word (aka: a compressor name)
      for (; I != End && isspace(*I); ++I);
      std::string::const_iterator Start = I;
      for (; I != End && !isspace(*I); ++I);

      std::string const Name(Start, I);
      auto Comp = Compressors.begin();
      for (; Comp != Compressors.end(); ++Comp)
	 if (Comp->Name == Name)
	    break;
      if (Comp == Compressors.end() && Name.empty() == false)
	 _error->Warning(_("Unknown compression algorithm '%s'"),Name.c_str());
      return Comp;
}

// MultiCompress::MultiCompress - Constructor				/*{{{*/
// ---------------------------------------------------------------------
/* Setup the file outputs and compression modes */
MultiCompress::MultiCompress(std::string const &Output, std::string const &Compress,
			     mode_t const &Permissions) : Outputs(0), Permissions(Permissions), InSize(0)
{
   auto const Compressors = REPO::Configuration::getCompressors();
   // Parse the compression string, a space separated lists of compression types
   for (auto I = Compress.cbegin(); I != Compress.cend();)
   {
      auto const Comp = findMatchingCompressor(I, Compress.cend(), Compressors);
      if (Comp == Compressors.end())
	 continue;

      // every compressor only once
      bool Known = false;
      for (Files *O = Outputs; O != 0; O = O->Next)
	 Known |= (O->CompressProg.Name == Comp->Name);
      if (Known == true)
	 continue;

      // Create and link in a new output
      Files *NewOut = new Files;
      NewOut->Next = Outputs;
      Outputs = NewOut;
      NewOut->CompressProg = *Comp;
      NewOut->Output = Output + Comp->Extension;
   }

   if (Outputs == 0)
   {
      _error->Error(_("Compressed output %s needs a compression set"),Output.c_str());
      return;
   }

   // Open all the temp files now so we can report any errors.
   for (Files *I = Outputs; I != 0; I = I->Next)
   {
      if (_config->FindB("Debug::Repo::Writer", false) == true)
	 std::clog << "Writing " << I->Output << " with " << I->CompressProg.Name << std::endl;
      I->TmpFile.Open(I->Output + ".new", FileFd::WriteOnly | FileFd::Create | FileFd::Empty,
		      I->CompressProg, this->Permissions);
   }
}
									/*}}}*/
// MultiCompress::~MultiCompress - Destructor				/*{{{*/
// ---------------------------------------------------------------------
/* Outputs not finalized are thrown away */
MultiCompress::~MultiCompress()
{
   for (; Outputs != 0;)
   {
      Files *Tmp = Outputs->Next;
      if (Outputs->TmpFile.IsOpen() == true)
      {
	 Outputs->TmpFile.OpFail();
	 Outputs->TmpFile.Close();
	 RemoveFile("MultiCompress", Outputs->Output + ".new");
      }
      delete Outputs;
      Outputs = Tmp;
   }
}
									/*}}}*/
// MultiCompress::Write - Send data to all outputs			/*{{{*/
bool MultiCompress::Write(const void *Data, unsigned long long Size)
{
   if (Outputs == 0)
      return false;
   for (Files *I = Outputs; I != 0; I = I->Next)
      if (I->TmpFile.Write(Data, Size) == false)
	 return false;
   InSize += Size;
   return true;
}
									/*}}}*/
// MultiCompress::Finalize - Finish up writing				/*{{{*/
bool MultiCompress::Finalize(unsigned long long &OutSize)
{
   OutSize = InSize;
   if (Outputs == 0)
      return false;

   for (Files *I = Outputs; I != 0; I = I->Next)
      if (I->TmpFile.Close() == false)
	 return false;

   for (Files *I = Outputs; I != 0; I = I->Next)
      if (Rename(I->Output + ".new", I->Output) == false)
	 return false;
   return true;
}
									/*}}}*/
// MultiCompress::CompressFile - Compress an existing file		/*{{{*/
// ---------------------------------------------------------------------
/* The plain input stays untouched, a "." in Compress is ignored */
bool MultiCompress::CompressFile(std::string const &Input, std::string const &Compress,
				 mode_t const &Permissions)
{
   std::string Compressed;
   for (auto const &C : VectorizeString(Compress, ' '))
   {
      if (C.empty() == true || C == ".")
	 continue;
      Compressed.append(C).append(" ");
   }
   if (Compressed.empty() == true)
      return true;

   FileFd In;
   if (In.Open(Input, FileFd::ReadOnly) == false)
      return false;

   MultiCompress Out(Input, Compressed, Permissions);
   if (_error->PendingError() == true)
      return false;

   char Buffer[REPO_BUFFER_SIZE];
   unsigned long long Actual = 0;
   do {
      if (In.Read(Buffer, sizeof(Buffer), &Actual) == false)
	 return false;
      if (Actual != 0 && Out.Write(Buffer, Actual) == false)
	 return false;
   } while (Actual != 0);

   unsigned long long Size;
   return Out.Finalize(Size);
}
									/*}}}*/
