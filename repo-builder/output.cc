// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Output streams of the repository builder, silenced by the quiet level

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>

#include <fstream>
#include <iostream>

#include "termux-apt-repo.h"
									/*}}}*/

std::ostream c0out(0);
std::ostream c1out(0);
std::ostream c2out(0);
std::ofstream devnull("/dev/null");
unsigned Quiet = 0;

bool InitOutput(std::basic_streambuf<char> * const out)			/*{{{*/
{
   _config->CndSet("quiet", 0);
   Quiet = _config->FindI("quiet", 0);

   c0out.rdbuf(out);
   c1out.rdbuf(out);
   c2out.rdbuf(out);
   if (Quiet > 0)
      c0out.rdbuf(devnull.rdbuf());
   if (Quiet > 1)
      c1out.rdbuf(devnull.rdbuf());
   return true;
}
									/*}}}*/
