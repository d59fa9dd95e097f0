// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   termux-apt-repo - build an apt repository from a directory of .debs

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <iostream>

#include "termux-apt-repo.h"
									/*}}}*/

int main(int argc, const char *argv[])					/*{{{*/
{
   return RunTermuxAptRepo(argc, argv, std::cout, std::cerr);
}
									/*}}}*/
