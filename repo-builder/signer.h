// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Signer - sign the Release file with gpg

   ##################################################################### */
									/*}}}*/
#ifndef SIGNER_H
#define SIGNER_H

#include <string>
#include <vector>

/** \brief the gpg command line producing Output from Release
 *
 *  \param Detached a detached signature instead of a clear-signed file */
std::vector<std::string> SignCommandLine(std::string const &Release, std::string const &Output, bool const Detached);

/** \brief clear-sign Release into InRelease next to it
 *
 *  With Repo::Sign::Detached a Release.gpg is created as well. On
 *  failure neither InRelease nor Release.gpg is left behind.
 *  \param[out] SignedFile path of the InRelease file */
bool SignRelease(std::string const &Release, std::string &SignedFile);

#endif
