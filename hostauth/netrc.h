// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   netrc file parser - returns the login and password of all machine
                       and default entries of a netrc-type file

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_NETRC_H
#define HOSTAUTH_NETRC_H

#include <hostauth/credential.h>
#include <hostauth/macros.h>

#include <vector>

class FileFd;

namespace HostAuth {

/** \brief append a Credential for each machine and default entry
 *
 *  Entries are added in file order, a default entry gets an empty
 *  scope. Macro definitions are skipped up to the next empty line.
 *  A FileFd which isn't open stands for a file which doesn't exist.
 *
 *  \return \b false only if reading failed
 */
HOSTAUTH_PUBLIC bool ParseNetrc(FileFd &NetRCFile, std::vector<Credential> &Creds);

}

#endif
