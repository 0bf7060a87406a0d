// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <hostauth/configuration.h>
#include <hostauth/error.h>
#include <hostauth/fileutl.h>
#include <hostauth/strutl.h>

#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include <string>
#include <vector>

#include <hostauthi18n.h>
									/*}}}*/

Configuration *_config = new Configuration;

bool Configuration::KeyLess::operator()(std::string const &A, std::string const &B) const
{
   return strcasecmp(A.c_str(), B.c_str()) < 0;
}
// Configuration::Find - Find a value					/*{{{*/
std::string Configuration::Find(std::string const &Name, std::string const &Default) const
{
   auto const Itm = Values.find(Name);
   if (Itm == Values.end() || Itm->second.empty() == true)
      return Default;
   return Itm->second;
}
									/*}}}*/
// Configuration::FindI - Find an integer value				/*{{{*/
int Configuration::FindI(std::string const &Name, int const Default) const
{
   auto const Itm = Values.find(Name);
   if (Itm == Values.end() || Itm->second.empty() == true)
      return Default;

   char *End;
   int const Res = strtol(Itm->second.c_str(), &End, 0);
   if (End == Itm->second.c_str())
      return Default;
   return Res;
}
									/*}}}*/
// Configuration::FindB - Find a boolean type				/*{{{*/
bool Configuration::FindB(std::string const &Name, bool const Default) const
{
   auto const Itm = Values.find(Name);
   if (Itm == Values.end() || Itm->second.empty() == true)
      return Default;
   return StringToBool(Itm->second, Default);
}
									/*}}}*/
// Configuration::Set - Set a value					/*{{{*/
void Configuration::Set(std::string const &Name, std::string const &Value)
{
   Values[Name] = Value;
}
void Configuration::Set(std::string const &Name, int const Value)
{
   Set(Name, std::to_string(Value));
}
void Configuration::CndSet(std::string const &Name, std::string const &Value)
{
   Values.emplace(Name, Value);
}
void Configuration::CndSet(std::string const &Name, int const Value)
{
   CndSet(Name, std::to_string(Value));
}
									/*}}}*/
bool Configuration::Exists(std::string const &Name) const		/*{{{*/
{
   return Values.find(Name) != Values.end();
}
									/*}}}*/
void Configuration::Clear(std::string const &Name)			/*{{{*/
{
   auto Itm = Values.lower_bound(Name);
   while (Itm != Values.end() && strncasecmp(Itm->first.c_str(), Name.c_str(), Name.length()) == 0)
   {
      if (Itm->first.length() == Name.length() || Itm->first.compare(Name.length(), 2, "::") == 0)
	 Itm = Values.erase(Itm);
      else
	 ++Itm;
   }
}
									/*}}}*/
// Configuration::Dump - Dump the config				/*{{{*/
void Configuration::Dump(std::ostream &str) const
{
   for (auto const &Itm : Values)
      str << Itm.first << " \"" << Itm.second << "\";\n";
}
									/*}}}*/

// ReadConfigFile - Read a configuration file				/*{{{*/
/* The file is split into words, quoted strings and the characters {};
   and every statement is a name with one optional value, terminated
   by a semicolon, or a name opening a block for the statements scoped
   below it. */
bool ReadConfigFile(Configuration &Conf, std::string const &FName)
{
   FileFd F;
   if (F.Open(FName) == false)
      return false;

   std::vector<std::string> Scopes;
   std::string Tag;
   std::string Value;
   bool HaveValue = false;
   unsigned int CurLine = 0;

   auto const Statement = [&](char const Punct, std::string const &Word, bool const Quoted) {
      switch (Punct)
      {
	 case '{':
	    if (Tag.empty() == true || HaveValue == true)
	       return _error->Error(_("Syntax error %s:%u: Block starts with no name."), FName.c_str(), CurLine);
	    Scopes.push_back(Scopes.empty() ? Tag : Scopes.back() + "::" + Tag);
	    Tag.clear();
	    return true;
	 case '}':
	    if (Tag.empty() == false)
	       return _error->Error(_("Syntax error %s:%u: Missing ';' before '}'"), FName.c_str(), CurLine);
	    if (Scopes.empty() == true)
	       return _error->Error(_("Syntax error %s:%u: Too many closes"), FName.c_str(), CurLine);
	    Scopes.pop_back();
	    return true;
	 case ';':
	    if (Tag.empty() == false)
	       Conf.Set(Scopes.empty() ? Tag : Scopes.back() + "::" + Tag, Value);
	    Tag.clear();
	    Value.clear();
	    HaveValue = false;
	    return true;
      }
      if (Tag.empty() == true)
      {
	 if (Quoted == true)
	    return _error->Error(_("Syntax error %s:%u: Malformed tag"), FName.c_str(), CurLine);
	 Tag = Word;
	 return true;
      }
      if (HaveValue == true)
	 return _error->Error(_("Syntax error %s:%u: Extra junk after value"), FName.c_str(), CurLine);
      Value = Word;
      HaveValue = true;
      return true;
   };

   std::string Line;
   while (F.ReadLine(Line) == true)
   {
      ++CurLine;
      for (std::string::size_type I = 0; I < Line.length(); ++I)
      {
	 char const c = Line[I];
	 if (isspace_ascii(c) != 0)
	    continue;
	 if (c == '#' || Line.compare(I, 2, "//") == 0)
	    break;

	 bool Okay;
	 if (c == '{' || c == '}' || c == ';')
	    Okay = Statement(c, "", false);
	 else if (c == '"')
	 {
	    auto const End = Line.find('"', I + 1);
	    if (End == std::string::npos)
	       return _error->Error(_("Syntax error %s:%u: Unterminated quote"), FName.c_str(), CurLine);
	    Okay = Statement('\0', Line.substr(I + 1, End - I - 1), true);
	    I = End;
	 }
	 else
	 {
	    auto End = Line.find_first_of(" \t\v\f\r{};\"", I);
	    if (End == std::string::npos)
	       End = Line.length();
	    Okay = Statement('\0', Line.substr(I, End - I), false);
	    I = End - 1;
	 }
	 if (Okay == false)
	    return false;
      }
   }
   if (F.Failed() == true)
      return false;

   if (Tag.empty() == false || Scopes.empty() == false)
      return _error->Error(_("Syntax error %s:%u: Extra junk at end of file"), FName.c_str(), CurLine);
   return true;
}
									/*}}}*/
