// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   String Util - string helpers and the URI class

   ##################################################################### */
									/*}}}*/
// Includes								/*{{{*/
#include <config.h>

#include <hostauth/strutl.h>

#include <algorithm>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

#include <stdarg.h>
#include <stdio.h>
#include <string.h>
#include <strings.h>
									/*}}}*/

namespace HostAuth {
namespace String {
std::string Strip(const std::string &str)
{
   auto const Start = std::find_if_not(str.begin(), str.end(), isspace_ascii);
   if (Start == str.end())
      return "";
   auto const End = std::find_if_not(str.rbegin(), str.rend(), isspace_ascii).base();
   return std::string(Start, End);
}
bool Startswith(const std::string &s, const std::string &start)
{
   return s.size() >= start.size() && s.compare(0, start.size(), start) == 0;
}
}
}

// DeQuoteString - decode %XX sequences					/*{{{*/
static int HexValue(char const c)
{
   if (isdigit_ascii(c))
      return c - '0';
   return tolower_ascii(c) - 'a' + 10;
}
std::string DeQuoteString(const std::string &Str)
{
   std::string Res;
   Res.reserve(Str.length());
   for (std::string::size_type I = 0; I < Str.length(); ++I)
   {
      if (Str[I] == '%' && I + 2 < Str.length() &&
	    isxdigit_ascii(Str[I + 1]) && isxdigit_ascii(Str[I + 2]))
      {
	 Res.push_back(static_cast<char>(HexValue(Str[I + 1]) * 16 + HexValue(Str[I + 2])));
	 I += 2;
	 continue;
      }
      Res.push_back(Str[I]);
   }
   return Res;
}
									/*}}}*/
// StringToBool - Converts a string into a boolean			/*{{{*/
int StringToBool(const std::string &Text, int const Default)
{
   static char const * const Yes[] = {"1", "yes", "true", "with", "on", "enable"};
   static char const * const No[] = {"0", "no", "false", "without", "off", "disable"};
   auto const Is = [&](char const * const Word) { return strcasecmp(Text.c_str(), Word) == 0; };
   if (std::any_of(std::begin(Yes), std::end(Yes), Is))
      return 1;
   if (std::any_of(std::begin(No), std::end(No), Is))
      return 0;
   return Default;
}
									/*}}}*/
std::vector<std::string> VectorizeString(std::string const &haystack, char const split)/*{{{*/
{
   std::vector<std::string> exploded;
   if (haystack.empty() == true)
      return exploded;
   std::string::size_type Start = 0;
   while (true)
   {
      auto const End = haystack.find(split, Start);
      if (End == std::string::npos)
      {
	 exploded.push_back(haystack.substr(Start));
	 break;
      }
      exploded.push_back(haystack.substr(Start, End - Start));
      Start = End + 1;
   }
   return exploded;
}
									/*}}}*/
// ioprintf - C format string outputter to C++ iostreams		/*{{{*/
void ioprintf(std::ostream &out, const char *format, ...)
{
   va_list args;
   va_start(args, format);
   va_list measure;
   va_copy(measure, args);
   int const Len = vsnprintf(nullptr, 0, format, measure);
   va_end(measure);
   if (Len > 0)
   {
      std::vector<char> Buf(Len + 1);
      vsnprintf(Buf.data(), Buf.size(), format, args);
      out.write(Buf.data(), Len);
   }
   va_end(args);
}
									/*}}}*/
// SubstVar - Substitute a string for another string			/*{{{*/
std::string SubstVar(const std::string &Str, const std::string &Subst, const std::string &Contents)
{
   if (Subst.empty() == true)
      return Str;

   std::string Res;
   std::string::size_type Start = 0;
   std::string::size_type Hit;
   while ((Hit = Str.find(Subst, Start)) != std::string::npos)
   {
      Res.append(Str, Start, Hit - Start).append(Contents);
      Start = Hit + Subst.length();
   }
   return Res.append(Str, Start, std::string::npos);
}
									/*}}}*/

// URI helpers								/*{{{*/
static bool AllDigits(std::string const &s)
{
   return std::all_of(s.begin(), s.end(), isdigit_ascii);
}
// every % has to start a %XX sequence
static bool ValidEscapes(std::string const &s)
{
   for (std::string::size_type I = 0; I < s.length(); ++I)
   {
      if (s[I] != '%')
	 continue;
      if (I + 2 >= s.length() || isxdigit_ascii(s[I + 1]) == 0 || isxdigit_ascii(s[I + 2]) == 0)
	 return false;
      I += 2;
   }
   return true;
}
static bool IsUserInfoChar(char const c)
{
   return isalpha_ascii(c) || isdigit_ascii(c) || strchr("-._:~!$&'()*+,;=%@", c) != nullptr;
}
/* A host may only use %XX for non-ASCII bytes (and %25 for a literal %),
   the zone of an IPv6 literal may encode anything. */
static bool IsHostText(std::string const &s, bool const Zone)
{
   for (std::string::size_type I = 0; I < s.length(); ++I)
   {
      char const c = s[I];
      if (c == '%')
      {
	 if (I + 2 >= s.length() || isxdigit_ascii(s[I + 1]) == 0 || isxdigit_ascii(s[I + 2]) == 0)
	    return false;
	 if (Zone == false && HexValue(s[I + 1]) < 8 && s.compare(I, 3, "%25") != 0)
	    return false;
	 I += 2;
      }
      else if (static_cast<unsigned char>(c) >= 0x80 || isalpha_ascii(c) || isdigit_ascii(c))
	 continue;
      else if (strchr("-._~!$&'()*+,;=:<>\"", c) == nullptr)
	 return false;
   }
   return true;
}
									/*}}}*/
bool URI::CopyFrom(std::string const &From)				/*{{{*/
{
   *this = URI();

   if (std::any_of(From.begin(), From.end(), [](char const c) {
	    return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; }))
      return false;

   auto const SchemeEnd = From.find(':');
   if (SchemeEnd == std::string::npos || SchemeEnd == 0 || isalpha_ascii(From[0]) == 0)
      return false;
   if (std::all_of(From.begin() + 1, From.begin() + SchemeEnd, [](char const c) {
	    return isalpha_ascii(c) || isdigit_ascii(c) || c == '+' || c == '-' || c == '.'; }) == false)
      return false;
   if (From.compare(SchemeEnd, 3, "://") != 0)
      return false;

   URI U;
   U.Access = From.substr(0, SchemeEnd);
   auto const AuthStart = SchemeEnd + 3;
   auto AuthEnd = From.find_first_of("/?#", AuthStart);
   if (AuthEnd == std::string::npos)
      AuthEnd = From.length();
   auto PathEnd = From.find_first_of("?#", AuthEnd);
   if (PathEnd == std::string::npos)
      PathEnd = From.length();
   U.Path = From.substr(AuthEnd, PathEnd - AuthEnd);
   auto const Fragment = From.find('#');
   if (ValidEscapes(U.Path) == false ||
	 (Fragment != std::string::npos && ValidEscapes(From.substr(Fragment + 1)) == false))
      return false;

   std::string HostText = From.substr(AuthStart, AuthEnd - AuthStart);
   auto const At = HostText.rfind('@');
   if (At != std::string::npos)
   {
      std::string const UserInfo = HostText.substr(0, At);
      if (std::all_of(UserInfo.begin(), UserInfo.end(), IsUserInfoChar) == false ||
	    ValidEscapes(UserInfo) == false)
	 return false;
      auto const Colon = UserInfo.find(':');
      U.User = DeQuoteString(UserInfo.substr(0, Colon));
      if (Colon != std::string::npos)
	 U.Password = DeQuoteString(UserInfo.substr(Colon + 1));
      HostText.erase(0, At + 1);
   }

   std::string Name;
   if (HostText.empty() == false && HostText[0] == '[')
   {
      auto const Close = HostText.rfind(']');
      if (Close == std::string::npos)
	 return false;
      std::string const ColonPort = HostText.substr(Close + 1);
      if (ColonPort.empty() == false && (ColonPort[0] != ':' || AllDigits(ColonPort.substr(1)) == false))
	 return false;
      Name = HostText.substr(1, Close - 1);
      auto const Zone = Name.find("%25");
      if (IsHostText(Name.substr(0, Zone), false) == false ||
	    (Zone != std::string::npos && IsHostText(Name.substr(Zone), true) == false))
	 return false;
      if (ColonPort.empty() == false)
	 U.Port = ColonPort.substr(1);
   }
   else
   {
      auto const Colon = HostText.rfind(':');
      Name = HostText.substr(0, Colon);
      if (Colon != std::string::npos)
      {
	 U.Port = HostText.substr(Colon + 1);
	 if (AllDigits(U.Port) == false)
	    return false;
      }
      if (IsHostText(Name, false) == false)
	 return false;
   }
   if (Name.empty() == true)
      return false;

   U.Host = DeQuoteString(Name);
   U.hostport = DeQuoteString(HostText);
   *this = std::move(U);
   return true;
}
									/*}}}*/
std::string URI::NoUserPassword(std::string const &URL)		/*{{{*/
{
   auto const SchemeEnd = URL.find("://");
   if (SchemeEnd == std::string::npos)
      return URL;
   auto const AuthStart = SchemeEnd + 3;
   auto AuthEnd = URL.find_first_of("/?#", AuthStart);
   if (AuthEnd == std::string::npos)
      AuthEnd = URL.length();
   auto const At = URL.substr(AuthStart, AuthEnd - AuthStart).rfind('@');
   if (At == std::string::npos)
      return URL;
   return URL.substr(0, AuthStart).append(URL, AuthStart + At + 1, std::string::npos);
}
									/*}}}*/
