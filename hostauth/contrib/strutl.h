// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   String Util - string helpers for the store parsers and the
   configuration code, and the URI class which takes the credential
   bearing URLs apart

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_STRUTL_H
#define HOSTAUTH_STRUTL_H

#include <hostauth/macros.h>

#include <iostream>
#include <string>
#include <vector>

namespace HostAuth {
   namespace String {
      HOSTAUTH_PUBLIC std::string Strip(const std::string &s);
      HOSTAUTH_PUBLIC bool Startswith(const std::string &s, const std::string &starting);
   }
}

/** \brief decode all %XX sequences, broken ones are kept as they are */
HOSTAUTH_PUBLIC std::string DeQuoteString(const std::string &Str);

/** \brief 1 for yes/true/with/on/enable/1, 0 for the opposites, Default otherwise */
HOSTAUTH_PUBLIC int StringToBool(const std::string &Text, int const Default = -1);

// split a given string by a char
HOSTAUTH_PUBLIC std::vector<std::string> VectorizeString(std::string const &haystack, char const split);

HOSTAUTH_PUBLIC void ioprintf(std::ostream &out, const char *format, ...) HOSTAUTH_PRINTF(2);

HOSTAUTH_PUBLIC std::string SubstVar(const std::string &Str, const std::string &Subst, const std::string &Contents);

HOSTAUTH_PURE
static inline int tolower_ascii(int const c)
{
   return (c >= 'A' && c <= 'Z') ? c + 32 : c;
}
HOSTAUTH_PURE
static inline int isspace_ascii(int const c)
{
   // 9='\t',10='\n',11='\v',12='\f',13='\r',32=' '
   return (c >= 9 && c <= 13) || c == ' ';
}
HOSTAUTH_PURE
static inline int isalpha_ascii(int const c)
{
   return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}
HOSTAUTH_PURE
static inline int isdigit_ascii(int const c)
{
   return c >= '0' && c <= '9';
}
HOSTAUTH_PURE
static inline int isxdigit_ascii(int const c)
{
   return isdigit_ascii(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/** \brief a URL of the form scheme://[user[:password]@]host[:port][/path]
 *
 *  Only URLs with an authority are accepted. The rules for the userinfo
 *  and the host follow RFC 3986 as web clients apply it: the userinfo
 *  has to consist of unreserved, sub-delims and percent encoded
 *  characters, the host must not contain spaces or other characters
 *  which would have to be encoded and a port is just digits.
 */
class HOSTAUTH_PUBLIC URI
{
   std::string hostport;

   public:
   std::string Access;
   /** \brief percent decoded */
   std::string User;
   /** \brief percent decoded */
   std::string Password;
   /** \brief percent decoded, IPv6 literals without their brackets */
   std::string Host;
   /** \brief digits as given, empty if there is no port */
   std::string Port;
   std::string Path;

   /** \brief parse From into the parts, a malformed URL returns \b false
    *  and leaves the parts empty */
   bool CopyFrom(std::string const &From);

   /** \brief host and port exactly as written in the URL
    *
    *  A port keeps leading zeros, an empty port keeps its colon and
    *  IPv6 literals keep their square brackets. */
   std::string const &HostPort() const { return hostport; }

   /** \brief the URL with the userinfo removed, for messages */
   static std::string NoUserPassword(std::string const &URL);

   URI() = default;
};

#endif
