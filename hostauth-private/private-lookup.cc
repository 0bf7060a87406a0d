// Include files							/*{{{*/
#include <config.h>

#include <hostauth/authfind.h>
#include <hostauth/cmndline.h>
#include <hostauth/configuration.h>
#include <hostauth/credential.h>
#include <hostauth/error.h>
#include <hostauth/strutl.h>

#include <hostauth-private/private-lookup.h>
#include <hostauth-private/private-output.h>

#include <iostream>

#include <hostauthi18n.h>
									/*}}}*/

void ShowCredential(std::ostream &out, HostAuth::Credential const &Cred)	/*{{{*/
{
   if (_config->FindB("HostAuth::Lookup::Show-Password", false) == false)
   {
      out << Cred << std::endl;
      return;
   }
   out << (Cred.Scope().empty() ? "(default)" : Cred.Scope()) << ' '
       << Cred.Username() << ':' << Cred.Password() << std::endl;
}
									/*}}}*/
// DoLookup - Handle the lookup command					/*{{{*/
// ---------------------------------------------------------------------
/* The stores are read once and each URL is matched against them. */
bool DoLookup(CommandLine &CmdL)
{
   if (CmdL.FileSize() < 2)
      return _error->Error(_("You must give at least one URL to look up"));

   auto const Creds = HostAuth::ReadAuthStores(HostAuth::ConfiguredAuthStores(*_config));
   for (const char **I = CmdL.FileList + 1; *I != nullptr; ++I)
   {
      HostAuth::Credential const Cred = HostAuth::MatchCredential(*I, Creds);
      if (Cred.empty() == true)
      {
	 ioprintf(c1out, _("No credentials for %s"), *I);
	 c1out << std::endl;
	 continue;
      }
      ShowCredential(c1out, Cred);
   }
   return true;
}
									/*}}}*/
// DoList - Handle the list command					/*{{{*/
bool DoList(CommandLine &)
{
   auto const Stores = HostAuth::ConfiguredAuthStores(*_config);
   if (_config->FindB("Debug::HostAuth", false) == true)
      std::clog << "Stores: git-credentials " << Stores.GitCredentials
		<< ", netrc " << Stores.Netrc << std::endl;
   for (auto const &Cred : HostAuth::ReadAuthStores(Stores))
      ShowCredential(c1out, Cred);
   return true;
}
									/*}}}*/
