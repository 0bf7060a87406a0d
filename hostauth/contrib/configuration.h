// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Configuration Class

   All runtime configuration is stored in here. Each configuration name
   is given as a fully scoped string such as
     Dir::Auth::Netrc
   and has associated with it a text string. Names are compared
   without regard to case.

   Most things can get by quite happily with,
     cout << _config->Find("Dir::Home") << endl;

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_CONFIGURATION_H
#define HOSTAUTH_CONFIGURATION_H

#include <hostauth/macros.h>

#include <iostream>
#include <map>
#include <string>

class HOSTAUTH_PUBLIC Configuration
{
   struct KeyLess
   {
      bool operator()(std::string const &A, std::string const &B) const;
   };
   std::map<std::string, std::string, KeyLess> Values;

   public:

   // an empty value counts as unset for the Find methods
   std::string Find(std::string const &Name, std::string const &Default = "") const;
   int FindI(std::string const &Name, int const Default = 0) const;
   bool FindB(std::string const &Name, bool const Default = false) const;

   void Set(std::string const &Name, std::string const &Value);
   void Set(std::string const &Name, int const Value);
   // only set if the name has no value yet
   void CndSet(std::string const &Name, std::string const &Value);
   void CndSet(std::string const &Name, int const Value);

   bool Exists(std::string const &Name) const;

   /** \brief remove Name and every option scoped below it */
   void Clear(std::string const &Name);
   void Clear() { Values.clear(); }

   inline void Dump() { Dump(std::clog); }
   void Dump(std::ostream &str) const;
};

HOSTAUTH_PUBLIC extern Configuration *_config;

/** \brief read options from a file in the format written by Dump
 *
 *  Besides the plain Name "value"; statements a file can group options
 *  into scopes like Dir::Auth { Netrc ".netrc"; }; and carry comments
 *  starting with # or //.
 */
HOSTAUTH_PUBLIC bool ReadConfigFile(Configuration &Conf, std::string const &FName);

#endif
