// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Command Line Class - command line parser feeding the configuration

   Options are mapped into a Configuration, everything else is kept in
   FileList in the order given. A -- ends the option processing.

   The argument descriptor array can be initialized as:

 CommandLine::Args Args[] =
 {{'c',"config-file",0,CommandLine::ConfigFile},
  {0,0,0,0}};

   The flags mean,
     HasArg     - Means the argument has a value
     ConfigFile - Means this flag should be interprited as the name of
                  a config file to read in at this point in option processing.
                  Implies HasArg.
     ArbItem    - Means the item is an arbitrary configuration string of
                  the form item=value, where item is passed directly
                  to the configuration class.
     PathArg    - The value is a filename, a relative one is made absolute
                  against the current directory. Implies HasArg.
   The default, if the flags are 0 is a boolean:
     -d (true) --no-d (false) --long (true) --no-long (false)
     -d=yes (true) -d no (false) --long=off (false)

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_CMNDLINE_H
#define HOSTAUTH_CMNDLINE_H

#include <hostauth/configuration.h>
#include <hostauth/macros.h>

class HOSTAUTH_PUBLIC CommandLine
{
   public:
   struct Args;
   struct Dispatch;

   protected:

   Args *ArgList;
   Configuration *Conf;
   bool HandleArg(Args const *A, const char *Value, const char *Given);
   bool HandleBool(int &I, int argc, const char *argv[], Args const *A,
		   const char *Value, int const Sense);

   public:

   enum AFlags
   {
      HasArg = (1 << 0),
      ConfigFile = (1 << 4) | HasArg,
      ArbItem = (1 << 5) | HasArg,
      PathArg = (1 << 6) | HasArg
   };

   const char **FileList;

   bool Parse(int argc, const char **argv);
   unsigned int FileSize() const HOSTAUTH_PURE;
   bool DispatchArg(Dispatch const * const List, bool NoMatch = true);

   CommandLine(Args *AList, Configuration *Conf);
   CommandLine();
   ~CommandLine();
   CommandLine(CommandLine const &) = delete;
   CommandLine &operator=(CommandLine const &) = delete;
};

struct CommandLine::Args
{
   char ShortOpt;
   const char *LongOpt;
   const char *ConfName;
   unsigned long Flags;

   inline bool end() const {return ShortOpt == 0 && LongOpt == 0;}
   inline bool IsBoolean() const {return (Flags & HasArg) == 0;}
};

struct CommandLine::Dispatch
{
   const char *Match;
   bool (*Handler)(CommandLine &);
};

#endif
