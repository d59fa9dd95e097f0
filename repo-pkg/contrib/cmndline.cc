// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - Sophisticated command line parser

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <repo-pkg/cmndline.h>
#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/strutl.h>

#include <string>
#include <stdlib.h>
#include <string.h>

#include <repoi18n.h>
									/*}}}*/
using namespace std;

// CommandLine::CommandLine - Constructor				/*{{{*/
CommandLine::CommandLine(Args *AList,Configuration *Conf) : ArgList(AList),
                                 Conf(Conf), FileList(0)
{
}
									/*}}}*/
// CommandLine::~CommandLine - Destructor				/*{{{*/
CommandLine::~CommandLine()
{
   delete [] FileList;
}
									/*}}}*/
// CommandLine::Parse - Main action member				/*{{{*/
bool CommandLine::Parse(int argc,const char **argv)
{
   delete [] FileList;
   FileList = new const char *[argc];
   const char **Files = FileList;
   int I;
   for (I = 1; I < argc; ++I)
   {
      const char *Opt = argv[I];

      // It is not an option
      if (Opt[0] != '-' || Opt[1] == 0)
      {
	 *Files++ = Opt;
	 continue;
      }

      // Double dash signifies the end of option processing
      if (strcmp(Opt, "--") == 0)
      {
	 ++I;
	 break;
      }

      // Single dash: a cluster of short options, the last may take a value
      if (Opt[1] != '-')
      {
	 for (++Opt; *Opt != 0; ++Opt)
	 {
	    Args *A;
	    for (A = ArgList; A->end() == false && A->ShortOpt != *Opt; ++A);
	    if (A->end() == true)
	       return _error->Error(_("Command line option '%c' [from %s] is not understood in combination with the other options."),*Opt,argv[I]);

	    if ((A->Flags & HasArg) == HasArg)
	    {
	       const char *Value = Opt + 1;
	       if (*Value == '=')
		  ++Value;
	       if (HandleOpt(I,argc,argv,*Value == 0 ? nullptr : Value,A,false) == false)
		  return false;
	       break;
	    }
	    if (Opt[1] == '=')
	    {
	       if (HandleOpt(I,argc,argv,Opt + 2,A,false) == false)
		  return false;
	       break;
	    }
	    if (HandleOpt(I,argc,argv,nullptr,A,false) == false)
	       return false;
	 }
	 continue;
      }

      // Long option, possibly --name=value or --no-name
      Opt += 2;
      const char *OptEnd = strchrnul(Opt, '=');
      std::string const Name(Opt, OptEnd);
      const char *Value = (*OptEnd == '=') ? OptEnd + 1 : nullptr;

      Args *A;
      for (A = ArgList; A->end() == false &&
	   (A->LongOpt == 0 || stringcasecmp(Name, A->LongOpt) != 0); ++A);

      bool Negated = false;
      if (A->end() == true && Name.compare(0, 3, "no-") == 0)
      {
	 std::string const Positive = Name.substr(3);
	 for (A = ArgList; A->end() == false &&
	      (A->LongOpt == 0 || stringcasecmp(Positive, A->LongOpt) != 0); ++A);
	 if (A->end() == false && A->IsBoolean() == false)
	    return _error->Error(_("Command line option %s is not boolean"),argv[I]);
	 Negated = true;
      }
      if (A->end() == true)
	 return _error->Error(_("Command line option %s is not understood in combination with the other options"),argv[I]);

      if (HandleOpt(I,argc,argv,Value,A,Negated) == false)
	 return false;
   }

   // Copy any remaining file names over
   for (; I < argc; ++I)
      *Files++ = argv[I];
   *Files = 0;

   return true;
}
									/*}}}*/
// CommandLine::HandleOpt - Handle a single option including all flags	/*{{{*/
// ---------------------------------------------------------------------
/* Value is the text following '=' or glued to a short option, it is
   null if the option was given on its own. */
bool CommandLine::HandleOpt(int &I,int argc,const char *argv[],
			    const char *Value,Args *A,bool Negated)
{
   if ((A->Flags & HasArg) == HasArg)
   {
      if (Value == nullptr)
      {
	 if (I + 1 >= argc)
	    return _error->Error(_("Option %s requires an argument."),argv[I]);
	 Value = argv[++I];
      }

      if ((A->Flags & ConfigFile) == ConfigFile)
	 return ReadConfigFile(*Conf,Value);

      if ((A->Flags & ArbItem) == ArbItem)
      {
	 const char *J = strchr(Value, '=');
	 if (J == nullptr || J == Value)
	    return _error->Error(_("Option %s: Configuration item specification must have an =<val>."),argv[I]);
	 Conf->Set(std::string(Value, J - Value), std::string(J + 1));
	 return true;
      }

      Conf->Set(A->ConfName,Value);
      return true;
   }

   if ((A->Flags & IntLevel) == IntLevel)
   {
      if (Value == nullptr)
      {
	 Conf->Set(A->ConfName,Conf->FindI(A->ConfName) + 1);
	 return true;
      }
      char *EndPtr;
      long const Level = strtol(Value,&EndPtr,10);
      if (*Value == 0 || *EndPtr != 0)
	 return _error->Error(_("Option %s requires an integer argument, not '%s'"),argv[I],Value);
      Conf->Set(A->ConfName,static_cast<int>(Level));
      return true;
   }

   // Boolean type
   int Sense = (A->Flags & InvBoolean) == InvBoolean ? 0 : 1;
   if (Value != nullptr)
   {
      Sense = StringToBool(Value,-1);
      if (Sense == -1)
	 return _error->Error(_("Sense %s is not understood, try true or false."),Value);
      if ((A->Flags & InvBoolean) == InvBoolean)
	 Sense = !Sense;
   }
   if (Negated == true)
      Sense = !Sense;

   Conf->Set(A->ConfName,Sense);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - Count the number of filenames		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   unsigned int Count = 0;
   for (const char **I = FileList; I != 0 && *I != 0; ++I)
      ++Count;
   return Count;
}
									/*}}}*/
