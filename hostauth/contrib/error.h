// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - messages for the user, collected per thread

   Reading a credential store or a configuration file can go wrong in
   many small ways. The function noticing it adds a message here and
   returns false, the caller decides if the problem is fatal for it:
     if (open(..) == -1)
        return _error->Errno("open", _("Could not open file %s"), ..);

   Warnings and notices do not make PendingError() true. A caller which
   only tries something, like the lookup which has to cope with a missing
   netrc, wraps the attempt in PushToStack()/RevertToStack() so that
   whatever was added in between never reaches the user.

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_ERROR_H
#define HOSTAUTH_ERROR_H

#include <hostauth/macros.h>

#include <iostream>
#include <list>
#include <string>
#include <vector>

#include <cstdarg>
#include <cstddef>

class HOSTAUTH_PUBLIC GlobalError					/*{{{*/
{
   public:
   /** \brief severity of a message, ordered by importance */
   enum MsgType {
      /** \brief printed to std::clog when added, in addition to being stored */
      FATAL = 40,
      /** \brief the operation failed */
      ERROR = 30,
      /** \brief the operation went on, but might not do what was expected */
      WARNING = 20,
      /** \brief ignored settings and the like */
      NOTICE = 10,
      /** \brief for developers, printed to std::clog when added */
      DEBUG = 0
   };

   /** \brief add an error message which ends with the text for errno
    *
    *  \param Function name of the failed system call
    *  \param Description printf-like format of the message
    *  \return \b false
    */
   bool Errno(const char *Function, const char *Description, ...) HOSTAUTH_PRINTF(3) HOSTAUTH_COLD;
   /** \brief add a warning message which ends with the text for errno */
   bool WarningE(const char *Function, const char *Description, ...) HOSTAUTH_PRINTF(3) HOSTAUTH_COLD;

   bool Error(const char *Description, ...) HOSTAUTH_PRINTF(2) HOSTAUTH_COLD;
   bool Warning(const char *Description, ...) HOSTAUTH_PRINTF(2) HOSTAUTH_COLD;
   bool Notice(const char *Description, ...) HOSTAUTH_PRINTF(2) HOSTAUTH_COLD;
   /** \brief add a message of the given type, e.g. FATAL or DEBUG */
   bool Insert(MsgType const Type, const char *Description, ...) HOSTAUTH_PRINTF(3) HOSTAUTH_COLD;

   /** \brief was an ERROR or FATAL message added since the last Discard? */
   bool PendingError() const { return PendingFlag; }

   /** \brief \b true if no message with at least this severity is stored */
   bool empty(MsgType const threshold = WARNING) const HOSTAUTH_PURE;

   /** \brief removes the oldest message
    *
    *  \param[out] Text of the message
    *  \return \b true if it was an ERROR or FATAL message
    */
   bool PopMessage(std::string &Text);

   /** \brief forget all messages of the current level */
   void Discard();

   /** \brief print the messages and forget them
    *
    *  Messages below threshold are forgotten without being printed.
    *
    *  \param mergeStack include the messages of the pushed levels
    */
   void DumpErrors(std::ostream &out, MsgType const threshold = WARNING,
		   bool const mergeStack = true);
   void DumpErrors(MsgType const threshold = WARNING) { DumpErrors(std::cerr, threshold); }

   /** \brief start a new level, the current messages are kept aside */
   void PushToStack();
   /** \brief drop the current level, the kept aside messages are back */
   void RevertToStack();
   /** \brief drop the current level, but keep its messages */
   void MergeWithStack();
   size_t StackCount() const { return Stacks.size(); }

   GlobalError() : PendingFlag(false) {}

   struct Item
   {
      std::string Text;
      MsgType Type;
   };

   private:
   std::list<Item> Messages;
   bool PendingFlag;

   struct MsgStack
   {
      std::list<Item> Messages;
      bool PendingFlag;
   };
   std::vector<MsgStack> Stacks;

   HOSTAUTH_HIDDEN bool Add(MsgType const Type, std::string &&Text);
   HOSTAUTH_HIDDEN bool AddWithErrno(MsgType const Type, int const errsv,
				     const char *Function, std::string &&Text);
};
									/*}}}*/

HOSTAUTH_PUBLIC std::ostream &operator<<(std::ostream &out, GlobalError::Item const &Msg);

HOSTAUTH_PUBLIC GlobalError *_GetErrorObj();
// _error-> is the thread's GlobalError
static struct {
   inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error HOSTAUTH_UNUSED;

#endif
