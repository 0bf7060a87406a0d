// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   hostauth - Program to look up HTTP credentials for URLs

   Commands:
     lookup - For each URL given print the credentials which would be
              used for it. Use like:
 hostauth lookup https://example.com/repo
     list   - Print all credentials found in the stores in the order
              they are considered.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/cmndline.h>
#include <hostauth/configuration.h>

#include <hostauth-private/private-cmndline.h>
#include <hostauth-private/private-output.h>

#include <locale>
#include <stdexcept>
#include <vector>
#include <locale.h>

#include <hostauthi18n.h>
									/*}}}*/
int main(int argc,const char *argv[])					/*{{{*/
{
   try {
      std::locale::global(std::locale(""));
   } catch (std::runtime_error const &) {
      setlocale(LC_ALL, "");
   }
   textdomain(PACKAGE);

   InitOutput();

   auto Args = getCommandArgs();
   CommandLine CmdL(Args.data(), _config);
   unsigned short Status;
   auto const Cmds = ParseCommandLine(CmdL, argc, argv, Status);
   if (Cmds.empty() == true)
      return Status;

   return DispatchCommandLine(CmdL, Cmds);
}
									/*}}}*/
