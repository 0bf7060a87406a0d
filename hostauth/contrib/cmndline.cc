// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - command line parser feeding the configuration

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include <config.h>

#include <hostauth/cmndline.h>
#include <hostauth/configuration.h>
#include <hostauth/error.h>
#include <hostauth/fileutl.h>
#include <hostauth/strutl.h>

#include <string>

#include <string.h>
#include <strings.h>

#include <hostauthi18n.h>
									/*}}}*/

CommandLine::CommandLine(Args *AList, Configuration *Conf) : ArgList(AList),
                                 Conf(Conf), FileList(nullptr)
{
}
CommandLine::CommandLine() : ArgList(nullptr), Conf(nullptr), FileList(nullptr)
{
}
CommandLine::~CommandLine()
{
   delete [] FileList;
}
// CommandLine::Parse - Main action member				/*{{{*/
bool CommandLine::Parse(int argc, const char **argv)
{
   delete [] FileList;
   FileList = new const char *[argc];
   const char **Files = FileList;

   auto const FindLong = [this](const char *Start, const char *End) {
      Args *A = ArgList;
      for (; A->end() == false; ++A)
	 if (A->LongOpt != nullptr && strlen(A->LongOpt) == static_cast<size_t>(End - Start) &&
	       strncasecmp(A->LongOpt, Start, End - Start) == 0)
	    break;
      return A;
   };

   int I;
   for (I = 1; I < argc; ++I)
   {
      const char * const Opt = argv[I];
      const char * const Given = argv[I];

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

      // Single dash, a group of short options
      if (Opt[1] != '-')
      {
	 for (const char *S = Opt + 1; *S != 0; ++S)
	 {
	    Args *A = ArgList;
	    for (; A->end() == false && A->ShortOpt != *S; ++A);
	    if (A->end() == true)
	       return _error->Error(_("Command line option '%c' [from %s] is not understood in combination with the other options."), *S, Given);

	    if (A->IsBoolean() == false)
	    {
	       // the rest of the group is the value
	       const char *Value = S + 1;
	       if (*Value == '=')
		  ++Value;
	       else if (*Value == 0)
	       {
		  if (I + 1 >= argc || argv[I + 1][0] == '-')
		     return _error->Error(_("Option %s requires an argument."), Given);
		  Value = argv[++I];
	       }
	       if (HandleArg(A, Value, Given) == false)
		  return false;
	       break;
	    }

	    if (S[1] == '=')
	    {
	       if (HandleBool(I, argc, argv, A, S + 2, -1) == false)
		  return false;
	       break;
	    }
	    if (S[1] == 0)
	    {
	       if (HandleBool(I, argc, argv, A, nullptr, -1) == false)
		  return false;
	    }
	    else
	       Conf->Set(A->ConfName, 1);
	 }
	 continue;
      }

      // Long option, maybe with a sense in front like --no-foo
      const char * const Name = Opt + 2;
      const char * const NameEnd = strchrnul(Name, '=');
      Args *A = FindLong(Name, NameEnd);
      int Sense = -1;
      if (A->end() == true)
      {
	 const char * const Dash = static_cast<const char *>(memchr(Name, '-', NameEnd - Name));
	 if (Dash != nullptr)
	 {
	    Sense = StringToBool(std::string(Name, Dash));
	    A = FindLong(Dash + 1, NameEnd);
	 }
	 if (Dash == nullptr || Sense < 0 || A->end() == true)
	    return _error->Error(_("Command line option %s is not understood in combination with the other options"), Given);
	 if (A->IsBoolean() == false)
	    return _error->Error(_("Command line option %s is not boolean"), Given);
      }

      const char *Value = (*NameEnd == '=') ? NameEnd + 1 : nullptr;
      if (A->IsBoolean() == true)
      {
	 if (HandleBool(I, argc, argv, A, Value, Sense) == false)
	    return false;
	 continue;
      }
      if (Value == nullptr)
      {
	 if (I + 1 >= argc || argv[I + 1][0] == '-')
	    return _error->Error(_("Option %s requires an argument."), Given);
	 Value = argv[++I];
      }
      if (HandleArg(A, Value, Given) == false)
	 return false;
   }

   // Copy any remaining file names over
   for (; I < argc; ++I)
      *Files++ = argv[I];
   *Files = nullptr;

   return true;
}
									/*}}}*/
// CommandLine::HandleArg - store the value of an option with argument	/*{{{*/
bool CommandLine::HandleArg(Args const *A, const char *Value, const char *Given)
{
   // Parse a configuration file
   if ((A->Flags & ConfigFile) == ConfigFile)
      return ReadConfigFile(*Conf, Value);

   // Arbitrary item specification
   if ((A->Flags & ArbItem) == ArbItem)
   {
      const char * const J = strchr(Value, '=');
      if (J == nullptr)
	 return _error->Error(_("Option %s: Configuration item specification must have an =<val>."), Given);
      Conf->Set(std::string(Value, J - Value), J + 1);
      return true;
   }

   if ((A->Flags & PathArg) == PathArg && Value[0] != '\0' && Value[0] != '/' &&
	 strncmp(Value, "~/", 2) != 0)
   {
      std::string const CWD = SafeGetCWD();
      if (CWD.empty() == true)
	 return _error->Errno("getcwd", _("Unable to determine the current directory"));
      Conf->Set(A->ConfName, flNormalize(CWD + Value));
      return true;
   }

   Conf->Set(A->ConfName, Value);
   return true;
}
									/*}}}*/
// CommandLine::HandleBool - set a boolean option			/*{{{*/
// ---------------------------------------------------------------------
/* Sense is the word in front of the option (--no-foo) or -1. Without
   an explicit value the next argument is eaten if it is a boolean. */
bool CommandLine::HandleBool(int &I, int argc, const char *argv[], Args const *A,
			     const char *Value, int const Sense)
{
   if (Value != nullptr)
   {
      int const Given = StringToBool(Value);
      if (Given < 0)
	 return _error->Error(_("Sense %s is not understood, try true or false."), Value);
      Conf->Set(A->ConfName, Sense < 0 ? Given : (Given == Sense ? 1 : 0));
      return true;
   }
   if (Sense >= 0)
   {
      Conf->Set(A->ConfName, Sense);
      return true;
   }
   if (I + 1 < argc)
   {
      int const Next = StringToBool(argv[I + 1]);
      if (Next >= 0)
      {
	 ++I;
	 Conf->Set(A->ConfName, Next);
	 return true;
      }
   }
   Conf->Set(A->ConfName, 1);
   return true;
}
									/*}}}*/
// CommandLine::FileSize - Count the number of filenames		/*{{{*/
unsigned int CommandLine::FileSize() const
{
   unsigned int Count = 0;
   for (const char **I = FileList; I != nullptr && *I != nullptr; ++I)
      ++Count;
   return Count;
}
									/*}}}*/
// CommandLine::DispatchArg - Do something with the first arg		/*{{{*/
bool CommandLine::DispatchArg(Dispatch const * const Map, bool NoMatch)
{
   if (FileSize() == 0)
   {
      if (NoMatch == true)
	 _error->Error(_("No operation given"));
      return false;
   }

   for (Dispatch const *D = Map; D->Match != nullptr; ++D)
   {
      if (strcmp(FileList[0], D->Match) != 0)
	 continue;
      bool const Res = D->Handler(*this);
      if (Res == false && _error->PendingError() == false)
	 _error->Error("Handler silently failed");
      return Res;
   }

   if (NoMatch == true)
      _error->Error(_("Invalid operation %s"), FileList[0]);
   return false;
}
									/*}}}*/
