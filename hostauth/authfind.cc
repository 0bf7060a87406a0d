// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Authentication lookup - find the credentials to use for a URL

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/authfind.h>
#include <hostauth/configuration.h>
#include <hostauth/error.h>
#include <hostauth/fileutl.h>
#include <hostauth/gitcredentials.h>
#include <hostauth/macros.h>
#include <hostauth/netrc.h>
#include <hostauth/strutl.h>

#include <algorithm>
#include <iostream>
#include <string>
#include <vector>
									/*}}}*/

namespace HostAuth {

AuthStores ConfiguredAuthStores(Configuration const &Cnf)		/*{{{*/
{
   std::string const Home = Cnf.Find("Dir::Home");
   auto const Locate = [&](char const * const Name) {
      std::string File = Cnf.Find(Name);
      if (File.empty() == true)
	 return File;
      if (String::Startswith(File, "~/"))
      {
	 if (Home.empty() == true)
	    return std::string();
	 File.erase(0, 2);
      }
      else if (File[0] == '/')
	 return File;
      else if (Home.empty() == true)
	 return std::string();
      return flNormalize(Home + "/" + File);
   };

   AuthStores Stores;
   Stores.GitCredentials = Locate("Dir::Auth::GitCredentials");
   Stores.Netrc = Locate("Dir::Auth::Netrc");
   return Stores;
}
									/*}}}*/
// ReadStore - open and parse a single store				/*{{{*/
// ---------------------------------------------------------------------
/* Messages generated here belong to the pushed error stack of the
   caller: with debugging they are shown, otherwise dropped. */
static void ReadStore(std::string const &Path, std::vector<Credential> &Creds,
		      bool (*Parser)(FileFd &, std::vector<Credential> &), bool const Debug)
{
   if (Path.empty() == true)
      return;

   {
      FileFd Store;
      if (Store.Open(Path) == true &&
	    Parser(Store, Creds) == false && Debug == true)
	 std::clog << "ReadAuthStores: Reading " << Path << " failed" << std::endl;
   }

   if (Debug == true)
      _error->DumpErrors(std::clog, GlobalError::DEBUG, false);
   else
      _error->Discard();
}
									/*}}}*/
std::vector<Credential> ReadAuthStores(AuthStores const &Stores)	/*{{{*/
{
   bool const Debug = _config->FindB("Debug::HostAuth", false);
   std::vector<Credential> Creds;

   _error->PushToStack();
   DEFER([] { _error->RevertToStack(); });

   ReadStore(Stores.GitCredentials, Creds, ParseGitCredentials, Debug);
   ReadStore(Stores.Netrc, Creds, ParseNetrc, Debug);
   return Creds;
}
									/*}}}*/
Credential MatchCredential(std::string const &Target, std::vector<Credential> const &Creds)/*{{{*/
{
   auto const Match = std::find_if(Creds.begin(), Creds.end(), [&](Credential const &Cred) {
      return Cred.Scope().empty() || Target.find(Cred.Scope()) != std::string::npos;
   });
   if (Match == Creds.end())
      return Credential();
   return *Match;
}
									/*}}}*/
// ForDisplay - the URL without credentials it might carry		/*{{{*/
static std::string ForDisplay(std::string const &BaseURL)
{
   if (BaseURL.find("://") == std::string::npos)
      return BaseURL;
   return URI::NoUserPassword(BaseURL);
}
									/*}}}*/
Credential FindAuthForHost(std::string const &BaseURL, AuthStores const &Stores)/*{{{*/
{
   Credential const Cred = MatchCredential(BaseURL, ReadAuthStores(Stores));
   if (_config->FindB("Debug::HostAuth", false) == true)
   {
      if (Cred.empty() == true)
	 std::clog << "FindAuthForHost: Found no credentials for " << ForDisplay(BaseURL) << std::endl;
      else
	 std::clog << "FindAuthForHost: Using " << Cred << " for " << ForDisplay(BaseURL) << std::endl;
   }
   return Cred;
}
Credential FindAuthForHost(std::string const &BaseURL)
{
   return FindAuthForHost(BaseURL, ConfiguredAuthStores(*_config));
}
									/*}}}*/
}
