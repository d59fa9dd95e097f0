// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Sophisticated command line parser

   The options are described by an array of Args which map each short
   and long option onto a configuration item:

   CommandLine::Args Args[] = {
      {'q',"quiet","quiet",CommandLine::IntLevel},
      {'d',"distribution","Repo::Distribution",CommandLine::HasArg},
      {'s',"sign","Repo::Sign",0},
      {'c',"config-file",0,CommandLine::ConfigFile},
      {'o',"option",0,CommandLine::ArbItem},
      {0,0,0,0}};

   The flags mean,
     HasArg - the option takes a value: -d termux, -d=termux,
              --distribution termux or --distribution=termux
     IntLevel - an integer level: -qq (+2), -q=5 (=5)
     Boolean  - true/false: -s (true), --no-sign (false),
                --sign=no (false)
     InvBoolean - like Boolean, but a bare -x sets false
     ConfigFile - read the named configuration file at this point
     ArbItem  - an arbitrary item=value configuration string
   The default, if the flags are 0, is Boolean.

   Everything that is not an option ends up in FileList.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_CMNDLINE_H
#define REPO_CMNDLINE_H

#include <repo-pkg/configuration.h>
#include <repo-pkg/macros.h>

class REPO_PUBLIC CommandLine
{
   public:
   struct Args;

   protected:

   Args *ArgList;
   Configuration *Conf;
   bool HandleOpt(int &I,int argc,const char *argv[],
		  const char *Value,Args *A,bool Negated);

   public:

   enum AFlags
   {
      HasArg = (1 << 0),
      IntLevel = (1 << 1),
      Boolean = (1 << 2),
      InvBoolean = (1 << 3),
      ConfigFile = (1 << 4) | HasArg,
      ArbItem = (1 << 5) | HasArg
   };

   const char **FileList;

   bool Parse(int argc,const char **argv);
   unsigned int FileSize() const REPO_PURE;

   CommandLine(Args *AList,Configuration *Conf);
   ~CommandLine();
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() const {return ShortOpt == 0 && LongOpt == 0;};
   inline bool IsBoolean() const {return Flags == 0 || (Flags & (Boolean|InvBoolean)) != 0;};
};

#endif
