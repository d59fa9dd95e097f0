// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   The options form a tree of tagged nodes; list items are nodes
   without a tag. Each node owns its children.

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/strutl.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

#include <stdlib.h>
#include <string.h>

#include <repoi18n.h>
									/*}}}*/
Configuration *_config = new Configuration;

// SplitName - the tags of a scoped name				/*{{{*/
static std::vector<std::string> SplitName(std::string const &Name)
{
   std::vector<std::string> Tags;
   std::string::size_type Start = 0;
   std::string::size_type Sep;
   while ((Sep = Name.find("::", Start)) != std::string::npos)
   {
      Tags.push_back(Name.substr(Start, Sep - Start));
      Start = Sep + 2;
   }
   Tags.push_back(Name.substr(Start));
   return Tags;
}
									/*}}}*/
// Configuration::Walk - the node of a scoped name			/*{{{*/
// ---------------------------------------------------------------------
/* An empty tag never matches an existing node, with Create it adds a
   new list item after the other children. */
Configuration::Node *Configuration::Walk(std::string const &Name, bool const Create)
{
   auto const Tags = SplitName(Name);
   if (Create == false && Tags.back().empty() == true)
      return nullptr;

   Node *Current = &Root;
   for (auto const &Tag : Tags)
   {
      auto Child = Current->Children.end();
      if (Tag.empty() == false)
	 Child = std::find_if(Current->Children.begin(), Current->Children.end(),
	       [&Tag](Node const &N) { return stringcasecmp(N.Tag, Tag) == 0; });
      if (Child == Current->Children.end())
      {
	 if (Create == false)
	    return nullptr;
	 Current->Children.emplace_back();
	 Current->Children.back().Tag = Tag;
	 Child = std::prev(Current->Children.end());
      }
      Current = &*Child;
   }
   return Current;
}
									/*}}}*/
std::string Configuration::Find(const char *Name,const char *Default) const/*{{{*/
{
   const Node *N = Walk(Name);
   if (N != nullptr && N->Value.empty() == false)
      return N->Value;
   return Default == nullptr ? "" : Default;
}
									/*}}}*/
std::vector<std::string> Configuration::FindVector(const char *Name, std::string const &Default) const/*{{{*/
{
   const Node *N = Walk(Name);
   if (N != nullptr && N->Value.empty() == false)
      return VectorizeString(N->Value, ',');
   if (N == nullptr || N->Children.empty() == true)
      return VectorizeString(Default, ',');

   std::vector<std::string> Values;
   Values.reserve(N->Children.size());
   for (auto const &Child : N->Children)
      Values.push_back(Child.Value);
   return Values;
}
									/*}}}*/
int Configuration::FindI(const char *Name,int const &Default) const	/*{{{*/
{
   std::string const Value = Find(Name);
   if (Value.empty() == true)
      return Default;

   char *End = nullptr;
   long const Number = strtol(Value.c_str(), &End, 0);
   if (End == Value.c_str() || *End != '\0')
      return Default;
   return Number;
}
									/*}}}*/
bool Configuration::FindB(const char *Name,bool const &Default) const	/*{{{*/
{
   std::string const Value = Find(Name);
   if (Value.empty() == true)
      return Default;
   return StringToBool(Value, Default);
}
									/*}}}*/
void Configuration::Set(const char *Name,const std::string &Value)	/*{{{*/
{
   Walk(Name, true)->Value = Value;
}
void Configuration::Set(const char *Name,const int &Value)
{
   Set(Name, std::to_string(Value));
}
									/*}}}*/
void Configuration::CndSet(const char *Name,const std::string &Value)	/*{{{*/
{
   Node *N = Walk(Name, true);
   if (N->Value.empty() == true)
      N->Value = Value;
}
void Configuration::CndSet(const char *Name,const int Value)
{
   CndSet(Name, std::to_string(Value));
}
									/*}}}*/
bool Configuration::Exists(const char *Name) const			/*{{{*/
{
   return Walk(Name) != nullptr;
}
									/*}}}*/
// Configuration::Clear - Remove a whole subtree			/*{{{*/
void Configuration::Clear(const std::string &Name)
{
   std::string::size_type const Sep = Name.rfind("::");
   Node *Parent = &Root;
   if (Sep != std::string::npos)
      Parent = Walk(Name.substr(0, Sep), false);
   if (Parent == nullptr)
      return;

   std::string const Tag = Sep == std::string::npos ? Name : Name.substr(Sep + 2);
   auto const Child = std::find_if(Parent->Children.begin(), Parent->Children.end(),
	 [&Tag](Node const &N) { return N.Tag.empty() == false && stringcasecmp(N.Tag, Tag) == 0; });
   if (Child != Parent->Children.end())
      Parent->Children.erase(Child);
}
									/*}}}*/

// ConfigTokenizer - Split a configuration file into tokens		/*{{{*/
// ---------------------------------------------------------------------
/* Comments are C++ style (// and block comments) or start with '#'.
   A token is a quoted string, a bare word or one of the ; { }
   punctuation characters. */
namespace {
class ConfigTokenizer
{
   std::string const &Text;
   std::string::size_type Pos;
   unsigned int Line;

   bool SkipWhitespaceAndComments()
   {
      while (Pos < Text.size())
      {
	 char const c = Text[Pos];
	 if (c == '\n')
	 {
	    ++Line;
	    ++Pos;
	 }
	 else if (isspace_ascii(c) != 0)
	    ++Pos;
	 else if (c == '#' || Text.compare(Pos, 2, "//") == 0)
	    Pos = std::min(Text.find('\n', Pos), Text.size());
	 else if (Text.compare(Pos, 2, "/*") == 0)
	 {
	    auto const End = Text.find("*/", Pos + 2);
	    if (End == std::string::npos)
	       return false;
	    Line += std::count(Text.begin() + Pos, Text.begin() + End, '\n');
	    Pos = End + 2;
	 }
	 else
	    break;
      }
      return true;
   }

   public:
   enum Kind { END, WORD, QUOTED, SEMICOLON, OPEN, CLOSE, BROKEN };

   Kind Next(std::string &Token)
   {
      Token.clear();
      if (SkipWhitespaceAndComments() == false)
	 return BROKEN;
      if (Pos >= Text.size())
	 return END;

      char const c = Text[Pos];
      if (c == ';' || c == '{' || c == '}')
      {
	 ++Pos;
	 return c == ';' ? SEMICOLON : (c == '{' ? OPEN : CLOSE);
      }
      if (c == '"')
      {
	 auto const End = Text.find('"', Pos + 1);
	 if (End == std::string::npos)
	    return BROKEN;
	 Token = Text.substr(Pos + 1, End - Pos - 1);
	 Line += std::count(Token.begin(), Token.end(), '\n');
	 Pos = End + 1;
	 return QUOTED;
      }
      auto const Start = Pos;
      while (Pos < Text.size() && isspace_ascii(Text[Pos]) == 0 &&
	     strchr(";{}\"", Text[Pos]) == nullptr)
	 ++Pos;
      Token = Text.substr(Start, Pos - Start);
      return WORD;
   }

   unsigned int CurrentLine() const { return Line; }

   explicit ConfigTokenizer(std::string const &Text) : Text(Text), Pos(0), Line(1) {}
};
}
									/*}}}*/
// ReadConfigFile - Read a configuration file				/*{{{*/
// ---------------------------------------------------------------------
/* The configuration format is very much like the named.conf format
   used in bind8, in fact this routine can parse most named.conf files.
   Statements end with ';', scopes open with 'Tag {' and close with
   '};'. A value without a tag inside a scope is a list item. */
bool ReadConfigFile(Configuration &Conf,const std::string &FName)
{
   std::ifstream F(FName);
   if (F.is_open() == false)
      return _error->Errno("ifstream::ifstream",_("Opening configuration file %s"),FName.c_str());
   std::stringstream Buffer;
   Buffer << F.rdbuf();
   std::string const Text = Buffer.str();

   ConfigTokenizer Tokens(Text);
   std::vector<std::string> Stack;
   std::vector<std::string> Statement;
   std::string Token;

   auto const Scope = [&Stack](std::string const &Tag) {
      std::string Full;
      for (auto const &S : Stack)
	 Full.append(S).append("::");
      return Full + Tag;
   };
   auto const SyntaxError = [&](char const *What) {
      return _error->Error(_("Syntax error %s:%u: %s"), FName.c_str(), Tokens.CurrentLine(), What);
   };

   while (true)
   {
      auto const Kind = Tokens.Next(Token);
      switch (Kind)
      {
	 case ConfigTokenizer::BROKEN:
	    return SyntaxError(_("Unterminated quote or comment"));
	 case ConfigTokenizer::END:
	    if (Statement.empty() == false)
	       return SyntaxError(_("Missing ; at end of file"));
	    if (Stack.empty() == false)
	       return SyntaxError(_("Unmatched { at end of file"));
	    return true;
	 case ConfigTokenizer::WORD:
	 case ConfigTokenizer::QUOTED:
	    if (Statement.size() == 2)
	       return SyntaxError(_("Extra junk after value"));
	    Statement.push_back(Token);
	    break;
	 case ConfigTokenizer::SEMICOLON:
	    if (Statement.size() == 1)
	       Conf.Set(Scope(""), Statement[0]);
	    else if (Statement.size() == 2)
	       Conf.Set(Scope(Statement[0]), Statement[1]);
	    Statement.clear();
	    break;
	 case ConfigTokenizer::OPEN:
	    if (Statement.size() != 1)
	       return SyntaxError(_("Block starts with no name."));
	    Stack.push_back(Statement[0]);
	    Statement.clear();
	    break;
	 case ConfigTokenizer::CLOSE:
	    if (Statement.empty() == false)
	       return SyntaxError(_("Missing ; before }"));
	    if (Stack.empty() == true)
	       return SyntaxError(_("Too many closes"));
	    Stack.pop_back();
	    break;
      }
   }
}
									/*}}}*/
