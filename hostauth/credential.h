// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Credential - a username/password pair for HTTP Basic Authentication
                together with the scope (host) it applies to

   An empty scope marks a default which applies to every target. The
   default constructed Credential (everything empty) is the result of a
   lookup which found nothing.

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_CREDENTIAL_H
#define HOSTAUTH_CREDENTIAL_H

#include <hostauth/macros.h>

#include <iosfwd>
#include <string>

namespace HostAuth {

class HOSTAUTH_PUBLIC Credential
{
   std::string scope;
   std::string username;
   std::string password;

   public:
   /** \brief host (with an optional :port) or a substring of the target
    *  this credential applies to, empty for a default */
   std::string const &Scope() const { return scope; }
   std::string const &Username() const { return username; }
   std::string const &Password() const { return password; }

   /** \brief \b true for the "no credential" value */
   bool empty() const HOSTAUTH_PURE;

   bool operator==(Credential const &Other) const HOSTAUTH_PURE;
   bool operator!=(Credential const &Other) const { return !(*this == Other); }

   Credential(std::string Scope, std::string Username, std::string Password);
   Credential() = default;
};

/** \brief prints scope and username, the password only as a mask */
HOSTAUTH_PUBLIC std::ostream &operator<<(std::ostream &out, Credential const &Cred);

}

#endif
