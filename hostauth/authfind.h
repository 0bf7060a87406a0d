// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Authentication lookup - find the credentials to use for a URL

   The git-credentials store and the netrc store are read on each call
   and concatenated in this order. The first credential whose scope is
   contained in the URL, or which has an empty scope, is the result.
   A store which can't be read is treated as an empty store.

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_AUTHFIND_H
#define HOSTAUTH_AUTHFIND_H

#include <hostauth/credential.h>
#include <hostauth/macros.h>

#include <string>
#include <vector>

class Configuration;

namespace HostAuth {

/** \brief paths of the credential stores, an empty path is no store */
struct AuthStores
{
   std::string GitCredentials;
   std::string Netrc;
};

/** \brief the stores as configured in Dir::Auth
 *
 *  Relative paths are taken relative to Dir::Home. */
HOSTAUTH_PUBLIC AuthStores ConfiguredAuthStores(Configuration const &Cnf);

/** \brief all credentials of both stores in lookup order
 *
 *  Errors encountered while reading are not reported, but shown
 *  with Debug::HostAuth. The global error list is left as it was.
 */
HOSTAUTH_PUBLIC std::vector<Credential> ReadAuthStores(AuthStores const &Stores);

/** \brief first credential applying to Target
 *
 *  \return the empty Credential if none applies
 */
HOSTAUTH_PUBLIC Credential MatchCredential(std::string const &Target, std::vector<Credential> const &Creds);

HOSTAUTH_PUBLIC Credential FindAuthForHost(std::string const &BaseURL, AuthStores const &Stores);
/** \brief lookup in the stores configured in #_config */
HOSTAUTH_PUBLIC Credential FindAuthForHost(std::string const &BaseURL);

}

#endif
