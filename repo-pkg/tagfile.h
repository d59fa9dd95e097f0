// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Fast scanner for RFC-822 type header information

   This parser handles Debian control files and the Packages indexes
   generated from them. A stanza is a list of 'Field: value' lines,
   continuation lines start with a space or a tab and an empty line
   ends the stanza.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_TAGFILE_H
#define REPO_TAGFILE_H

#include <repo-pkg/macros.h>

#include <string>
#include <string_view>
#include <vector>

/** \class pkgTagSection parses a single deb822 stanza and provides various
 * Find methods to extract the included values.
 *
 * Field names are compared case-insensitively. The stanza text is copied,
 * so the section stays valid after the input buffer is gone. */
class REPO_PUBLIC pkgTagSection
{
   struct TagData {
      std::string::size_type StartTag;
      std::string::size_type EndTag;
      std::string::size_type StartValue;
      std::string::size_type EndValue;
   };
   std::string Section;
   std::vector<TagData> Tags;
   unsigned long Length;

   REPO_HIDDEN bool FindPos(std::string_view Tag, unsigned int &Pos) const;
   REPO_HIDDEN void Clear();

   public:

   /** \brief the value with leading and trailing whitespace removed
    *
    *  Continuation lines are part of the value, including their newlines.
    *  A missing field gives an empty view. */
   std::string_view Find(std::string_view Tag) const;
   /** \brief the value as it is written in the stanza */
   std::string_view FindRaw(std::string_view Tag) const;
   std::string FindS(std::string_view Tag) const { return std::string{Find(Tag)}; }

   /** \brief parse the stanza starting at Start
    *
    *  \param Start of the text to parse
    *  \param MaxLength of the text available
    *  \return \b false if no stanza was found or a line is malformed */
   bool Scan(const char *Start, unsigned long MaxLength);

   /** \brief number of bytes consumed by the last Scan, including the
    *  blank lines after the stanza */
   inline unsigned long size() const {return Length;};
   /** \brief the stanza text without the trailing blank lines, ends with a newline */
   std::string_view Text() const;

   /** \brief name of the field at position I in stanza order */
   std::string_view TagName(unsigned int I) const;

   pkgTagSection();
   virtual ~pkgTagSection();
};

#endif
