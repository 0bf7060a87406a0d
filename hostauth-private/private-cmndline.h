#ifndef HOSTAUTH_PRIVATE_CMNDLINE_H
#define HOSTAUTH_PRIVATE_CMNDLINE_H

#include <hostauth/cmndline.h>
#include <hostauth/macros.h>

#include <vector>

struct hostauthDispatchWithHelp
{
   const char *Match;
   bool (*Handler)(CommandLine &);
   const char *Help;
};

HOSTAUTH_PUBLIC std::vector<CommandLine::Args> getCommandArgs();
HOSTAUTH_PUBLIC std::vector<hostauthDispatchWithHelp> GetCommands();
HOSTAUTH_PUBLIC bool ShowHelp(CommandLine &CmdL);

/** \brief initialise the configuration and parse the command line into CmdL
 *
 *  CmdL has to be built on the arguments of getCommandArgs. If nothing
 *  is left to dispatch the returned list is empty and Status carries
 *  the exit code: 0 after the help was shown, 1 if no command was given
 *  and 100 on errors.
 */
HOSTAUTH_PUBLIC std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,
      int const argc, const char *argv[], unsigned short &Status);
HOSTAUTH_PUBLIC unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds);

#endif
