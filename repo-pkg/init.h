// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the repository library

   This function must be called to configure the config class before
   calling many library functions.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_INIT_H
#define REPO_INIT_H

#include <repo-pkg/macros.h>

class Configuration;

REPO_PUBLIC extern const char *repoVersion;

REPO_PUBLIC bool repoInitConfig(Configuration &Cnf);

#endif
