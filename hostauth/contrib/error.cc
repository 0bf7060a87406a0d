// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - messages for the user, collected per thread

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/error.h>

#include <algorithm>
#include <iostream>
#include <list>
#include <string>
#include <utility>
#include <vector>

#include <errno.h>
#include <stdarg.h>
#include <stdio.h>
#include <string.h>
									/*}}}*/

// _GetErrorObj - one GlobalError per thread				/*{{{*/
GlobalError *_GetErrorObj()
{
   static thread_local GlobalError Obj;
   return &Obj;
}
									/*}}}*/
// FormatMessage - vsnprintf into a string of the needed size		/*{{{*/
static std::string FormatMessage(const char *Description, va_list args)
{
   va_list measure;
   va_copy(measure, args);
   int const Len = vsnprintf(nullptr, 0, Description, measure);
   va_end(measure);
   if (Len < 0)
      return Description;

   std::vector<char> Buf(Len + 1);
   vsnprintf(Buf.data(), Buf.size(), Description, args);
   return std::string(Buf.data(), Len);
}
									/*}}}*/
bool GlobalError::Add(MsgType const Type, std::string &&Text)		/*{{{*/
{
   Messages.push_back(Item{std::move(Text), Type});
   if (Type == ERROR || Type == FATAL)
      PendingFlag = true;
   if (Type == FATAL || Type == DEBUG)
      std::clog << Messages.back() << std::endl;
   return false;
}
bool GlobalError::AddWithErrno(MsgType const Type, int const errsv,
			       const char *Function, std::string &&Text)
{
   Text.append(" - ").append(Function).append(" (")
      .append(std::to_string(errsv)).append(": ").append(strerror(errsv)).append(")");
   return Add(Type, std::move(Text));
}
									/*}}}*/
// GlobalError::Errno, WarningE - a message with the errno text	/*{{{*/
bool GlobalError::Errno(const char *Function, const char *Description, ...)
{
   int const errsv = errno;
   va_list args;
   va_start(args, Description);
   std::string Text = FormatMessage(Description, args);
   va_end(args);
   return AddWithErrno(ERROR, errsv, Function, std::move(Text));
}
bool GlobalError::WarningE(const char *Function, const char *Description, ...)
{
   int const errsv = errno;
   va_list args;
   va_start(args, Description);
   std::string Text = FormatMessage(Description, args);
   va_end(args);
   return AddWithErrno(WARNING, errsv, Function, std::move(Text));
}
									/*}}}*/
// GlobalError::Error, Warning, Notice, Insert - a plain message	/*{{{*/
#define GEMessage(NAME, TYPE) \
bool GlobalError::NAME(const char *Description, ...) \
{ \
   va_list args; \
   va_start(args, Description); \
   std::string Text = FormatMessage(Description, args); \
   va_end(args); \
   return Add(TYPE, std::move(Text)); \
}
GEMessage(Error, ERROR)
GEMessage(Warning, WARNING)
GEMessage(Notice, NOTICE)
#undef GEMessage
bool GlobalError::Insert(MsgType const Type, const char *Description, ...)
{
   va_list args;
   va_start(args, Description);
   std::string Text = FormatMessage(Description, args);
   va_end(args);
   return Add(Type, std::move(Text));
}
									/*}}}*/
bool GlobalError::PopMessage(std::string &Text)				/*{{{*/
{
   if (Messages.empty() == true)
      return false;

   Item const Msg = std::move(Messages.front());
   Messages.pop_front();
   Text = Msg.Text;

   bool const IsError = (Msg.Type == ERROR || Msg.Type == FATAL);
   if (IsError == true && std::none_of(Messages.begin(), Messages.end(), [](Item const &m) {
	    return m.Type == ERROR || m.Type == FATAL; }))
      PendingFlag = false;
   return IsError;
}
									/*}}}*/
void GlobalError::DumpErrors(std::ostream &out, MsgType const threshold,	/*{{{*/
			     bool const mergeStack)
{
   if (mergeStack == true)
      while (Stacks.empty() == false)
	 MergeWithStack();

   for (auto const &Msg : Messages)
      if (Msg.Type >= threshold)
	 out << Msg << std::endl;
   Discard();
}
									/*}}}*/
void GlobalError::Discard()						/*{{{*/
{
   Messages.clear();
   PendingFlag = false;
}
									/*}}}*/
bool GlobalError::empty(MsgType const threshold) const			/*{{{*/
{
   if (PendingFlag == true)
      return false;
   return std::none_of(Messages.begin(), Messages.end(),
	 [&](Item const &m) { return m.Type >= threshold; });
}
									/*}}}*/
// GlobalError::PushToStack, RevertToStack, MergeWithStack		/*{{{*/
void GlobalError::PushToStack()
{
   Stacks.push_back(MsgStack{std::move(Messages), PendingFlag});
   Discard();
}
void GlobalError::RevertToStack()
{
   Discard();
   if (Stacks.empty() == true)
      return;
   Messages = std::move(Stacks.back().Messages);
   PendingFlag = Stacks.back().PendingFlag;
   Stacks.pop_back();
}
void GlobalError::MergeWithStack()
{
   if (Stacks.empty() == true)
      return;
   auto &Below = Stacks.back();
   Below.Messages.splice(Below.Messages.end(), Messages);
   Messages = std::move(Below.Messages);
   PendingFlag = PendingFlag || Below.PendingFlag;
   Stacks.pop_back();
}
									/*}}}*/
// operator<< - E: first line, following lines indented		/*{{{*/
std::ostream &operator<<(std::ostream &out, GlobalError::Item const &Msg)
{
   switch (Msg.Type)
   {
      case GlobalError::FATAL:
      case GlobalError::ERROR: out << "E: "; break;
      case GlobalError::WARNING: out << "W: "; break;
      case GlobalError::NOTICE: out << "N: "; break;
      case GlobalError::DEBUG: out << "D: "; break;
   }

   bool First = true;
   std::string::size_type Start = 0;
   while (Start < Msg.Text.length())
   {
      auto End = Msg.Text.find_first_of("\r\n", Start);
      if (End == std::string::npos)
	 End = Msg.Text.length();
      if (End != Start)
      {
	 if (First == false)
	    out << std::endl << "   ";
	 out << Msg.Text.substr(Start, End - Start);
	 First = false;
      }
      Start = End + 1;
   }
   return out;
}
									/*}}}*/
