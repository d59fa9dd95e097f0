// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - Some useful string functions.

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <repo-pkg/strutl.h>

#include <algorithm>
#include <iterator>
#include <limits>
#include <locale>
#include <sstream>
#include <string>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>
#include <errno.h>
									/*}}}*/
// REPO::String - small helpers on std::string			/*{{{*/
std::string REPO::String::Strip(const std::string &str)
{
   auto const first = std::find_if_not(str.begin(), str.end(), isspace_ascii);
   if (first == str.end())
      return std::string();
   auto const last = std::find_if_not(str.rbegin(), str.rend(), isspace_ascii);
   return std::string(first, last.base());
}
bool REPO::String::Endswith(const std::string &s, const std::string &ending)
{
   return s.length() >= ending.length() &&
      std::equal(ending.rbegin(), ending.rend(), s.rbegin());
}
bool REPO::String::Startswith(const std::string &s, const std::string &starting)
{
   return s.length() >= starting.length() &&
      std::equal(starting.begin(), starting.end(), s.begin());
}
std::string REPO::String::Join(std::vector<std::string> list, const std::string &sep)
{
   std::string out;
   for (auto const &item : list)
   {
      if (&item != &list.front())
	 out.append(sep);
      out.append(item);
   }
   return out;
}
									/*}}}*/
// TimeRFC1123 - Convert a time_t into RFC1123 format			/*{{{*/
std::string TimeRFC1123(time_t Date, bool const NumericTimezone)
{
   struct tm Conv;
   if (gmtime_r(&Date, &Conv) == NULL)
      return "";

   // strftime would honour the locale, the date has to be english
   auto const posix = std::locale::classic();
   std::ostringstream datestr;
   datestr.imbue(posix);
   char const fmt[] = "%a, %d %b %Y %H:%M:%S";
   std::use_facet<std::time_put<char>>(posix).put(
	 std::ostreambuf_iterator<char>(datestr),
	 datestr, ' ', &Conv, fmt, fmt + strlen(fmt));
   datestr << (NumericTimezone ? " +0000" : " GMT");
   return datestr.str();
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
int StringToBool(const std::string &Text,int Default)
{
   if (Text == "0" || Text == "1")
      return Text[0] - '0';

   static char const * const yes[] = {"yes", "true", "with", "on", "enable"};
   static char const * const no[] = {"no", "false", "without", "off", "disable"};
   auto const Is = [&Text](char const * const Word) { return strcasecmp(Text.c_str(), Word) == 0; };
   if (std::any_of(std::begin(yes), std::end(yes), Is))
      return 1;
   if (std::any_of(std::begin(no), std::end(no), Is))
      return 0;
   return Default;
}
									/*}}}*/
// StrToNum - Convert a fixed length string to a number		/*{{{*/
// ---------------------------------------------------------------------
/* This is used in decoding the crazy fixed length string headers in
   tar and ar files. */
bool StrToNum(const char *Str,unsigned long &Res,unsigned Len,unsigned Base)
{
   unsigned long long BigRes;
   if (StrToNum(Str, BigRes, Len, Base) == false)
      return false;

   if (std::numeric_limits<unsigned long>::max() < BigRes)
      return false;

   Res = BigRes;
   return true;
}
bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base)
{
   // the field ends at its first NUL, spaces around the digits are padding
   std::string Field(Str, strnlen(Str, Len));
   std::string::size_type const First = Field.find_first_not_of(' ');
   Res = 0;
   if (First == std::string::npos)
      return true;
   Field.erase(Field.find_last_not_of(' ') + 1);
   Field.erase(0, First);
   if (Field[0] == '-' || Field.find(' ') != std::string::npos)
      return false;

   char *End = nullptr;
   errno = 0;
   Res = strtoull(Field.c_str(), &End, Base);
   return errno == 0 && End == Field.c_str() + Field.size();
}
									/*}}}*/
// Base256ToNum - Convert a fixed length binary to a number		/*{{{*/
// ---------------------------------------------------------------------
/* GNU tar stores sizes above 8 GiB big-endian with the high bit of the
   first byte set. */
bool Base256ToNum(const char *Str,unsigned long long &Res,unsigned int Len)
{
   if ((Str[0] & 0x80) == 0)
      return false;

   Res = Str[0] & 0x7F;
   for (unsigned int i = 1; i < Len; ++i)
   {
      if (Res > (std::numeric_limits<unsigned long long>::max() >> 8))
	 return false;
      Res = (Res << 8) + static_cast<unsigned char>(Str[i]);
   }
   return true;
}
									/*}}}*/
// VectorizeString - Split a string into a vector of strings		/*{{{*/
std::vector<std::string> VectorizeString(std::string const &haystack, char const &split)
{
   std::vector<std::string> exploded;
   if (haystack.empty() == true)
      return exploded;
   std::string::size_type start = 0;
   while (true)
   {
      std::string::size_type const end = haystack.find(split, start);
      if (end == std::string::npos)
      {
	 exploded.push_back(haystack.substr(start));
	 return exploded;
      }
      exploded.push_back(haystack.substr(start, end - start));
      start = end + 1;
   }
}
									/*}}}*/
// ioprintf - C format string outputter to C++ iostreams		/*{{{*/
static std::string vstrprintf(const char *format, va_list args)
{
   va_list copy;
   va_copy(copy, args);
   int const n = vsnprintf(nullptr, 0, format, copy);
   va_end(copy);
   if (n < 0)
      return "";
   std::string out(n + 1, '\0');
   vsnprintf(&out[0], out.size(), format, args);
   out.resize(n);
   return out;
}
void ioprintf(std::ostream &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out << vstrprintf(format, args);
   va_end(args);
}
void strprintf(std::string &out,const char *format,...)
{
   va_list args;
   va_start(args,format);
   out = vstrprintf(format, args);
   va_end(args);
}
									/*}}}*/
// stringcasecmp - Case insensitive ascii compare			/*{{{*/
// ---------------------------------------------------------------------
/* A string sorts before every longer string it is a prefix of */
int stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd)
{
   auto const Same = [](char const a, char const b) { return tolower_ascii(a) == tolower_ascii(b); };
   std::size_t const Common = std::min(AEnd - A, BEnd - B);
   auto const Diff = std::mismatch(A, A + Common, B, Same);
   if (Diff.first != A + Common)
      return tolower_ascii(*Diff.first) < tolower_ascii(*Diff.second) ? -1 : 1;
   if (AEnd - A == BEnd - B)
      return 0;
   return AEnd - A < BEnd - B ? -1 : 1;
}
									/*}}}*/
