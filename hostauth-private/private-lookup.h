#ifndef HOSTAUTH_PRIVATE_LOOKUP_H
#define HOSTAUTH_PRIVATE_LOOKUP_H

#include <hostauth/macros.h>

#include <iostream>

class CommandLine;
namespace HostAuth
{
class Credential;
}

// masks the password unless HostAuth::Lookup::Show-Password is set
HOSTAUTH_PUBLIC void ShowCredential(std::ostream &out, HostAuth::Credential const &Cred);

HOSTAUTH_PUBLIC bool DoLookup(CommandLine &CmdL);
HOSTAUTH_PUBLIC bool DoList(CommandLine &CmdL);

#endif
