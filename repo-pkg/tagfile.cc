// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fast scanner for RFC-822 type header information

   The scanner copies one stanza out of the given buffer and records
   where every field name and value starts and ends.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/strutl.h>
#include <repo-pkg/tagfile.h>

#include <string>
#include <string_view>
#include <vector>

#include <string.h>
									/*}}}*/

// TagSection::pkgTagSection - Constructor				/*{{{*/
pkgTagSection::pkgTagSection() : Length(0)
{
}
pkgTagSection::~pkgTagSection() {}
									/*}}}*/
// TagSection::Clear - forget the last stanza				/*{{{*/
void pkgTagSection::Clear()
{
   Section.clear();
   Tags.clear();
   Length = 0;
}
									/*}}}*/
// TagSection::Scan - Scan for the end of the header information	/*{{{*/
// ---------------------------------------------------------------------
/* Leading empty lines are skipped. Every line of the stanza has to be
   a 'Field: value' line or a continuation of the previous one. */
bool pkgTagSection::Scan(const char *Start, unsigned long MaxLength)
{
   Clear();
   const char *End = Start + MaxLength;
   const char *Stop = Start;

   // skip blank lines before the stanza
   while (Stop < End && (*Stop == '\n' || *Stop == '\r'))
      ++Stop;
   const char *const Begin = Stop;

   while (Stop < End && *Stop != '\n')
   {
      const char *EndLine = static_cast<const char *>(memchr(Stop, '\n', End - Stop));
      if (EndLine == nullptr)
	 EndLine = End;

      std::string_view const Line(Stop, EndLine - Stop);
      if (Line.empty() == false && (Line[0] == ' ' || Line[0] == '\t'))
      {
	 if (Tags.empty() == true)
	    return false;
	 Tags.back().EndValue = (EndLine - Begin);
      }
      else
      {
	 auto const Colon = Line.find(':');
	 if (Colon == std::string_view::npos || Colon == 0)
	    return false;
	 TagData Tag;
	 Tag.StartTag = Stop - Begin;
	 Tag.EndTag = Tag.StartTag + Colon;
	 while (Tag.EndTag > Tag.StartTag && isspace_ascii(Stop[Tag.EndTag - Tag.StartTag - 1]) != 0)
	    --Tag.EndTag;
	 Tag.StartValue = Tag.StartTag + Colon + 1;
	 Tag.EndValue = EndLine - Begin;
	 Tags.push_back(Tag);
      }
      Stop = (EndLine == End) ? End : EndLine + 1;
      // allow for \r\n line endings
      if (Stop < End && *Stop == '\r' && Stop + 1 < End && Stop[1] == '\n')
	 ++Stop;
   }

   if (Tags.empty() == true)
      return false;

   Section.assign(Begin, Stop - Begin);
   if (Section.back() != '\n')
      Section.push_back('\n');

   // consume the blank lines terminating the stanza
   while (Stop < End && (*Stop == '\n' || *Stop == '\r'))
      ++Stop;
   Length = Stop - Start;

   // a field must not appear twice in one stanza
   for (unsigned int I = 0; I != Tags.size(); ++I)
   {
      unsigned int Pos;
      if (FindPos(TagName(I), Pos) == true && Pos != I)
	 return false;
   }
   return true;
}
									/*}}}*/
// TagSection::FindPos - Locate a field					/*{{{*/
bool pkgTagSection::FindPos(std::string_view Tag, unsigned int &Pos) const
{
   for (unsigned int I = 0; I != Tags.size(); ++I)
   {
      std::string_view const Name = TagName(I);
      if (stringcasecmp(Name.data(), Name.data() + Name.size(), Tag.data(), Tag.data() + Tag.size()) != 0)
	 continue;
      Pos = I;
      return true;
   }
   return false;
}
									/*}}}*/
// TagSection::Find - Locate a tag and return the value		/*{{{*/
std::string_view pkgTagSection::Find(std::string_view Tag) const
{
   std::string_view Value = FindRaw(Tag);
   while (Value.empty() == false && isspace_ascii(Value.front()) != 0)
      Value.remove_prefix(1);
   while (Value.empty() == false && isspace_ascii(Value.back()) != 0)
      Value.remove_suffix(1);
   return Value;
}
std::string_view pkgTagSection::FindRaw(std::string_view Tag) const
{
   unsigned int Pos;
   if (FindPos(Tag, Pos) == false)
      return std::string_view();
   TagData const &T = Tags[Pos];
   return std::string_view(Section.data() + T.StartValue, T.EndValue - T.StartValue);
}
									/*}}}*/
std::string_view pkgTagSection::Text() const				/*{{{*/
{
   return Section;
}
									/*}}}*/
std::string_view pkgTagSection::TagName(unsigned int I) const		/*{{{*/
{
   if (I >= Tags.size())
      return std::string_view();
   return std::string_view(Section.data() + Tags[I].StartTag, Tags[I].EndTag - Tags[I].StartTag);
}
									/*}}}*/
