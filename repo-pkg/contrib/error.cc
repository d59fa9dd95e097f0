// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - messages of a repository build

   Messages are formatted when they are added. The stack of put aside
   lists lets a caller look at the messages of one step in isolation.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/error.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <utility>

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
									/*}}}*/

GlobalError *_GetErrorObj()						/*{{{*/
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// VFormat - printf into a std::string					/*{{{*/
static std::string VFormat(const char *Format, va_list args)
{
   va_list sizing;
   va_copy(sizing, args);
   int const Len = vsnprintf(nullptr, 0, Format, sizing);
   va_end(sizing);
   if (Len < 0)
      return Format;
   std::string Out(Len + 1, '\0');
   vsnprintf(&Out[0], Out.size(), Format, args);
   Out.resize(Len);
   return Out;
}
									/*}}}*/
// WithErrno - the text of a message about a failed call		/*{{{*/
static std::string WithErrno(std::string Text, const char *Function, int const errsv)
{
   Text.append(" - ").append(Function);
   Text.append(" (").append(std::to_string(errsv)).append(": ").append(strerror(errsv)).append(")");
   return Text;
}
									/*}}}*/
bool GlobalError::Append(MsgType type, std::string Text)		/*{{{*/
{
   Messages.push_back(Item{type, std::move(Text)});
   return false;
}
									/*}}}*/
bool GlobalError::Insert(MsgType type, const char *Description, va_list &args)/*{{{*/
{
   return Append(type, VFormat(Description, args));
}
									/*}}}*/
bool GlobalError::InsertErrno(MsgType type, const char *Function,	/*{{{*/
			      const char *Description, va_list &args, int const errsv)
{
   return Append(type, WithErrno(VFormat(Description, args), Function, errsv));
}
									/*}}}*/
bool GlobalError::Errno(const char *Function, const char *Description, ...)/*{{{*/
{
   int const errsv = errno;
   va_list args;
   va_start(args, Description);
   InsertErrno(ERROR, Function, Description, args, errsv);
   va_end(args);
   return false;
}
									/*}}}*/
bool GlobalError::WarningE(const char *Function, const char *Description, ...)/*{{{*/
{
   int const errsv = errno;
   va_list args;
   va_start(args, Description);
   InsertErrno(WARNING, Function, Description, args, errsv);
   va_end(args);
   return false;
}
									/*}}}*/
bool GlobalError::Error(const char *Description, ...)			/*{{{*/
{
   va_list args;
   va_start(args, Description);
   Insert(ERROR, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
bool GlobalError::Warning(const char *Description, ...)			/*{{{*/
{
   va_list args;
   va_start(args, Description);
   Insert(WARNING, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
bool GlobalError::Notice(const char *Description, ...)			/*{{{*/
{
   va_list args;
   va_start(args, Description);
   Insert(NOTICE, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
bool GlobalError::PendingError() const					/*{{{*/
{
   return std::any_of(Messages.begin(), Messages.end(), [](Item const &m) {
      return m.Type >= ERROR;
   });
}
									/*}}}*/
bool GlobalError::empty(MsgType const &threshold) const			/*{{{*/
{
   return std::none_of(Messages.begin(), Messages.end(), [&threshold](Item const &m) {
      return m.Type >= threshold || m.Type >= ERROR;
   });
}
									/*}}}*/
bool GlobalError::PopMessage(std::string &Text)				/*{{{*/
{
   if (Messages.empty() == true)
      return false;
   Text = std::move(Messages.front().Text);
   bool const WasError = Messages.front().Type >= ERROR;
   Messages.pop_front();
   return WasError;
}
									/*}}}*/
void GlobalError::Discard()						/*{{{*/
{
   Messages.clear();
}
									/*}}}*/
// GlobalError::DumpErrors - print and forget				/*{{{*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const &threshold,
			     bool const &mergeStack)
{
   if (mergeStack == true)
      while (Stacks.empty() == false)
	 MergeWithStack();

   for (auto const &m : Messages)
      if (m.Type >= threshold)
	 out << m << std::endl;
   Discard();
}
									/*}}}*/
void GlobalError::PushToStack()						/*{{{*/
{
   Stacks.push_back(std::move(Messages));
   Messages.clear();
}
									/*}}}*/
void GlobalError::RevertToStack()					/*{{{*/
{
   Messages = std::move(Stacks.back());
   Stacks.pop_back();
}
									/*}}}*/
void GlobalError::MergeWithStack()					/*{{{*/
{
   std::deque<Item> Older = std::move(Stacks.back());
   Stacks.pop_back();
   Older.insert(Older.end(), Messages.begin(), Messages.end());
   Messages = std::move(Older);
}
									/*}}}*/
// operator<< - one message with its severity prefix			/*{{{*/
std::ostream &operator<<(std::ostream &out, GlobalError::Item const &i)
{
   char Prefix = 'D';
   if (i.Type >= GlobalError::ERROR)
      Prefix = 'E';
   else if (i.Type >= GlobalError::WARNING)
      Prefix = 'W';
   else if (i.Type >= GlobalError::NOTICE)
      Prefix = 'N';
   out << Prefix << ": ";

   std::string::size_type Start = 0;
   std::string::size_type Nl;
   while ((Nl = i.Text.find('\n', Start)) != std::string::npos)
   {
      out.write(i.Text.data() + Start, Nl - Start);
      out << std::endl << "   ";
      Start = Nl + 1;
   }
   return out << i.Text.substr(Start);
}
									/*}}}*/
