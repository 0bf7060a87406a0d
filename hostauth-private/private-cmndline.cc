// Include files							/*{{{*/
#include <config.h>

#include <hostauth/cmndline.h>
#include <hostauth/configuration.h>
#include <hostauth/error.h>
#include <hostauth/init.h>

#include <hostauth-private/private-cmndline.h>
#include <hostauth-private/private-lookup.h>
#include <hostauth-private/private-output.h>

#include <iomanip>
#include <iostream>
#include <vector>

#include <string.h>

#include <hostauthi18n.h>
									/*}}}*/

std::vector<CommandLine::Args> getCommandArgs()				/*{{{*/
{
   return {
      {'h',"help","help",0},
      {'v',"version","version",0},
      {'c',"config-file",nullptr,CommandLine::ConfigFile},
      {'o',"option",nullptr,CommandLine::ArbItem},
      {0,"git-credentials","Dir::Auth::GitCredentials",CommandLine::PathArg},
      {0,"netrc","Dir::Auth::Netrc",CommandLine::PathArg},
      {0,"show-password","HostAuth::Lookup::Show-Password",0},
      {0,nullptr,nullptr,0}};
}
									/*}}}*/
std::vector<hostauthDispatchWithHelp> GetCommands()			/*{{{*/
{
   return {
      {"lookup", &DoLookup, _("Show the credentials used for the given URLs")},
      {"list", &DoList, _("Show all credentials in the order they are considered")},
      {nullptr, nullptr, nullptr}
   };
}
									/*}}}*/
// ShowHelp - Show the help screen					/*{{{*/
bool ShowHelp(CommandLine &)
{
   c1out << PACKAGE << " " << PACKAGE_VERSION << std::endl;
   if (_config->FindB("version") == true)
      return true;

   c1out <<
      _("Usage: hostauth [options] command\n"
	"       hostauth [options] lookup url1 [url2 ...]\n"
	"\n"
	"hostauth finds the username and password to use for HTTP Basic\n"
	"authentication from ~/.git-credentials and ~/.netrc.\n")
      << std::endl
      << _("Most used commands:") << std::endl;
   for (auto const &C : GetCommands())
      if (C.Match != nullptr && C.Help != nullptr)
	 c1out << "  " << std::left << std::setw(8) << C.Match << " - " << C.Help << std::endl;

   c1out << std::endl <<
      _("Options:\n"
	"  -h   This help text.\n"
	"  -c=? Read this configuration file\n"
	"  -o=? Set an arbitrary configuration option, eg -o Dir::Home=/tmp\n"
	"  --git-credentials=? Use this git-credentials file\n"
	"  --netrc=? Use this netrc file\n"
	"  --show-password Print passwords instead of masking them\n");
   return true;
}
									/*}}}*/
std::vector<CommandLine::Dispatch> ParseCommandLine(CommandLine &CmdL,	/*{{{*/
      int const argc, const char *argv[], unsigned short &Status)
{
   std::vector<CommandLine::Dispatch> Cmds;
   if (hostauthInitConfig(*_config) == false || CmdL.Parse(argc, argv) == false)
   {
      _error->DumpErrors();
      Status = 100;
      return Cmds;
   }

   // See if the help should be shown
   if (_config->FindB("help") == true || _config->FindB("version") == true ||
	 (CmdL.FileSize() > 0 && strcmp(CmdL.FileList[0], "help") == 0))
   {
      ShowHelp(CmdL);
      Status = 0;
      return Cmds;
   }
   if (CmdL.FileSize() == 0)
   {
      ShowHelp(CmdL);
      Status = 1;
      return Cmds;
   }

   for (auto const &C : GetCommands())
      Cmds.push_back({C.Match, C.Handler});
   Status = 0;
   return Cmds;
}
									/*}}}*/
unsigned short DispatchCommandLine(CommandLine &CmdL, std::vector<CommandLine::Dispatch> const &Cmds)	/*{{{*/
{
   // Match the operation
   bool const returned = Cmds.empty() ? true : CmdL.DispatchArg(Cmds.data());

   // Print any errors or warnings found during parsing
   bool const Errors = _error->PendingError();
   _error->DumpErrors();
   if (returned == false)
      return 100;
   return Errors == true ? 100 : 0;
}
									/*}}}*/
