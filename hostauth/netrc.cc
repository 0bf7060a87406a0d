// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   netrc file parser - returns the login and password of all machine
                       and default entries of a netrc-type file

   ##################################################################### */
									/*}}}*/
#include <config.h>

#include <hostauth/configuration.h>
#include <hostauth/fileutl.h>
#include <hostauth/netrc.h>
#include <hostauth/strutl.h>

#include <iostream>
#include <string>
#include <vector>

namespace HostAuth {

class HOSTAUTH_HIDDEN NetrcParser					/*{{{*/
{
   enum class State
   {
      SCANNING,
      AWAITING_VALUE
   };
   enum class Field
   {
      MACHINE,
      LOGIN,
      PASSWORD,
      ACCOUNT,
      MACRO_NAME
   };
   struct Entry
   {
      std::string Machine;
      std::string Login;
      std::string Password;
      std::string Account;
   };

   std::vector<Credential> &Creds;
   State state;
   Field field;
   bool HaveEntry;
   Entry Current;
   // a macdef was seen on the current line, its body starts with the next
   bool MacroStarts;
   bool InMacro;

   void Flush()
   {
      if (HaveEntry == false)
	 return;
      Creds.emplace_back(Current.Machine, Current.Login, Current.Password);
      HaveEntry = false;
   }
   void StartEntry()
   {
      Flush();
      Current = Entry();
      HaveEntry = true;
   }
   void Assign(std::string const &Value)
   {
      // a value without a machine or default before it has no home
      if (HaveEntry == false)
	 return;
      switch (field)
      {
	 case Field::MACHINE: Current.Machine = Value; break;
	 case Field::LOGIN: Current.Login = Value; break;
	 case Field::PASSWORD: Current.Password = Value; break;
	 case Field::ACCOUNT: Current.Account = Value; break;
	 case Field::MACRO_NAME: break;
      }
   }
   void Await(Field const f)
   {
      state = State::AWAITING_VALUE;
      field = f;
   }

   public:
   void Feed(std::string const &RawLine)
   {
      // the body of a macro ends with an empty line
      if (InMacro == true)
      {
	 if (RawLine.empty())
	    InMacro = false;
	 return;
      }

      std::string const Line = String::Strip(SubstVar(RawLine, "\t", " "));
      for (auto const &token : VectorizeString(Line, ' '))
      {
	 if (token.empty())
	    continue;

	 if (state == State::AWAITING_VALUE)
	 {
	    Assign(token);
	    state = State::SCANNING;
	    continue;
	 }

	 if (token[0] == '#')
	    break;

	 if (token == "machine")
	 {
	    StartEntry();
	    Await(Field::MACHINE);
	 }
	 else if (token == "default")
	    StartEntry();
	 else if (token == "login")
	    Await(Field::LOGIN);
	 else if (token == "password")
	    Await(Field::PASSWORD);
	 else if (token == "account")
	    Await(Field::ACCOUNT);
	 else if (token == "macdef")
	 {
	    Await(Field::MACRO_NAME);
	    MacroStarts = true;
	 }
      }

      if (MacroStarts == true)
      {
	 MacroStarts = false;
	 InMacro = true;
      }
   }
   void Finish()
   {
      Flush();
   }

   explicit NetrcParser(std::vector<Credential> &Creds) : Creds(Creds),
      state(State::SCANNING), field(Field::MACHINE), HaveEntry(false),
      MacroStarts(false), InMacro(false) {}
};
									/*}}}*/
bool ParseNetrc(FileFd &NetRCFile, std::vector<Credential> &Creds)	/*{{{*/
{
   if (NetRCFile.IsOpen() == false)
      return true;
   bool const Debug = _config->FindB("Debug::HostAuth", false);

   auto const Before = Creds.size();
   NetrcParser Parser(Creds);
   std::string Line;
   while (NetRCFile.ReadLine(Line) == true)
      Parser.Feed(Line);
   Parser.Finish();

   if (Debug == true)
      std::clog << "ParseNetrc: Found " << (Creds.size() - Before) << " entries in "
		<< NetRCFile.Name() << std::endl;
   return NetRCFile.Failed() == false;
}
									/*}}}*/
}
