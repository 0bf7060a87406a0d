// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Credential - a username/password pair and the scope it applies to

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/credential.h>

#include <ostream>
#include <string>
#include <utility>
									/*}}}*/

namespace HostAuth {

Credential::Credential(std::string Scope, std::string Username, std::string Password) :
   scope(std::move(Scope)), username(std::move(Username)), password(std::move(Password))
{
}
bool Credential::empty() const
{
   return scope.empty() && username.empty() && password.empty();
}
bool Credential::operator==(Credential const &Other) const
{
   return scope == Other.scope && username == Other.username && password == Other.password;
}
std::ostream &operator<<(std::ostream &out, Credential const &Cred)	/*{{{*/
{
   if (Cred.Scope().empty())
      out << "(default)";
   else
      out << Cred.Scope();
   out << ' ' << Cred.Username();
   if (Cred.Password().empty() == false)
      out << ":****";
   return out;
}
									/*}}}*/
}
