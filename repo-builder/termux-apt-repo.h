// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Front end and output streams shared by the repository builder

   c0out carries progress, c1out the summary and c2out what is shown
   even when asked to be quiet.

   ##################################################################### */
									/*}}}*/
#ifndef TERMUX_APT_REPO_H
#define TERMUX_APT_REPO_H

#include <fstream>
#include <iostream>

extern std::ostream c0out;
extern std::ostream c1out;
extern std::ostream c2out;
extern std::ofstream devnull;
extern unsigned Quiet;

bool InitOutput(std::basic_streambuf<char> * const out = std::cout.rdbuf());

/** \brief parse the options in argv into _config and build the repository
 *
 *  The version banner, the help and the summary go to out, errors
 *  and warnings to err.
 *  \return the exit code: 0 on success, 1 on bad usage or a failed build */
int RunTermuxAptRepo(int argc, const char *argv[], std::ostream &out, std::ostream &err);

#endif
