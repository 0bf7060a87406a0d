// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the hostauth library

   ##################################################################### */
									/*}}}*/
// Include files							/*{{{*/
#include<config.h>

#include <hostauth/configuration.h>
#include <hostauth/error.h>
#include <hostauth/fileutl.h>
#include <hostauth/init.h>
#include <hostauth/macros.h>

#include <cstdlib>
#include <string.h>
#include <string>

#include <pwd.h>
#include <sys/types.h>
#include <unistd.h>

#include <hostauthi18n.h>
									/*}}}*/

#define Stringfy_(x) # x
#define Stringfy(x)  Stringfy_(x)
const char *hostauthVersion = PACKAGE_VERSION;
const char *hostauthLibVersion = Stringfy(HOSTAUTH_MAJOR) "."
                                 Stringfy(HOSTAUTH_MINOR) "."
                                 Stringfy(HOSTAUTH_RELEASE);

// HomeDirectory - $HOME or the home of the passwd entry		/*{{{*/
static std::string HomeDirectory()
{
   char const * const Env = getenv("HOME");
   if (Env != nullptr && strlen(Env) != 0)
      return Env;

   struct passwd const * const pw = getpwuid(getuid());
   if (pw == nullptr || pw->pw_dir == nullptr)
      return "";
   return pw->pw_dir;
}
									/*}}}*/
// hostauthInitConfig - Initialize the configuration class		/*{{{*/
// ---------------------------------------------------------------------
/* The store names are relative to Dir::Home unless they start with
   a / or ~/, see HostAuth::ConfiguredAuthStores. */
bool hostauthInitConfig(Configuration &Cnf)
{
   Cnf.CndSet("Dir::Home", HomeDirectory());
   Cnf.CndSet("Dir::Auth::GitCredentials", ".git-credentials");
   Cnf.CndSet("Dir::Auth::Netrc", ".netrc");

   bool Res = true;

   // Read an alternate config file
   const char *Cfg = getenv("HOSTAUTH_CONFIG");
   if (Cfg != 0 && strlen(Cfg) != 0)
   {
      if (RealFileExists(Cfg) == true)
	 Res &= ReadConfigFile(Cnf,Cfg);
      else
	 _error->WarningE("RealFileExists",_("Unable to read %s"),Cfg);
   }

   if (Res == false)
      return false;

   if (Cnf.FindB("Debug::hostauthInitConfig",false) == true)
      Cnf.Dump();

   return true;
}
									/*}}}*/
