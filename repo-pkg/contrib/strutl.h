// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - These are some useful string functions

   _strstrip and friends are gone; what is left are the helpers the
   repository writers need for parsing control data and formatting
   index files.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_STRUTL_H
#define REPO_STRUTL_H

#include <repo-pkg/macros.h>

#include <cstring>
#include <iostream>
#include <string>
#include <vector>
#include <time.h>

namespace REPO {
   namespace String {
      REPO_PUBLIC std::string Strip(const std::string &s);
      REPO_PUBLIC bool Endswith(const std::string &s, const std::string &ending);
      REPO_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
      REPO_PUBLIC std::string Join(std::vector<std::string> list, const std::string &sep);
   }
}

/** \brief format a time_t as an RFC1123 date in UTC
 *
 *  \param Date to convert
 *  \param NumericTimezone use "+0000" instead of "GMT" as zone
 */
REPO_PUBLIC std::string TimeRFC1123(time_t Date, bool const NumericTimezone);

/** \brief parse yes/no/true/false/on/off/with/without/enable/disable and 0/1 */
REPO_PUBLIC int StringToBool(const std::string &Text,int Default = -1);

REPO_PUBLIC bool StrToNum(const char *Str,unsigned long &Res,unsigned Len,unsigned Base = 0);
REPO_PUBLIC bool StrToNum(const char *Str,unsigned long long &Res,unsigned Len,unsigned Base = 0);
REPO_PUBLIC bool Base256ToNum(const char *Str,unsigned long long &Res,unsigned int Len);

/** \brief split a string at every occurrence of split
 *
 *  Empty fields are kept, so "a,,b" gives three entries.
 */
REPO_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const &split) REPO_PURE;

REPO_PUBLIC void ioprintf(std::ostream &out,const char *format,...) REPO_PRINTF(2);
REPO_PUBLIC void strprintf(std::string &out,const char *format,...) REPO_PRINTF(2);

// Ascii only variants of the ctype functions, independent of the locale
static inline int tolower_ascii(int const c)
{
   if (c >= 'A' && c <= 'Z')
      return c + 32;
   return c;
}
static inline int isspace_ascii(int const c)
{
   return c == ' ' || c == '\f' || c == '\n' || c == '\r' || c == '\t' || c == '\v';
}

REPO_PUBLIC int REPO_PURE stringcasecmp(const char *A,const char *AEnd,const char *B,const char *BEnd);
inline int stringcasecmp(std::string const &A, std::string const &B)
{
   return stringcasecmp(A.data(), A.data() + A.size(), B.data(), B.data() + B.size());
}

#endif
