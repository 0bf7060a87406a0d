// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   git-credentials parser - one credential bearing URL per line

   A line has to look like scheme://[user[:password]@]host[:port][/path]
   for us to take it. The path is ignored, the userinfo is percent
   decoded and the host with its port as written is the scope.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/configuration.h>
#include <hostauth/fileutl.h>
#include <hostauth/gitcredentials.h>
#include <hostauth/strutl.h>

#include <iostream>
#include <string>
#include <utility>
#include <vector>
									/*}}}*/

namespace HostAuth {

bool ParseGitCredentialLine(std::string const &Line, Credential &Cred)	/*{{{*/
{
   ::URI U;
   if (U.CopyFrom(Line) == false)
      return false;

   Cred = Credential(U.HostPort(), U.User, U.Password);
   return true;
}
									/*}}}*/
bool ParseGitCredentials(FileFd &File, std::vector<Credential> &Creds)	/*{{{*/
{
   if (File.IsOpen() == false)
      return true;
   bool const Debug = _config->FindB("Debug::HostAuth", false);

   std::string Line;
   unsigned long CurLine = 0;
   while (File.ReadLine(Line) == true)
   {
      ++CurLine;
      if (Line.empty() == true)
	 continue;

      Credential Cred;
      if (ParseGitCredentialLine(Line, Cred) == false)
      {
	 if (Debug == true)
	    std::clog << "Skipping line " << CurLine << " of " << File.Name() << std::endl;
	 continue;
      }
      Creds.push_back(std::move(Cred));
   }
   return File.Failed() == false;
}
									/*}}}*/
}
