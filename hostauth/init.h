// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the hostauth library

   This function must be called to configure the config class before
   looking up credentials with the configured stores.

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_INIT_H
#define HOSTAUTH_INIT_H

#include <hostauth/macros.h>

class Configuration;

HOSTAUTH_PUBLIC extern const char *hostauthVersion;
HOSTAUTH_PUBLIC extern const char *hostauthLibVersion;

HOSTAUTH_PUBLIC bool hostauthInitConfig(Configuration &Cnf);

#endif
