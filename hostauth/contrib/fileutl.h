// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd reads the credential stores and configuration files line by
   line. Failures are reported on _error and remembered, so a caller
   which reads until ReadLine() returns false can ask Failed() whether
   it saw the whole file.

   ##################################################################### */
									/*}}}*/
#ifndef HOSTAUTH_FILEUTL_H
#define HOSTAUTH_FILEUTL_H

#include <hostauth/macros.h>

#include <string>

class HOSTAUTH_PUBLIC FileFd
{
   int iFd;
   enum LocalFlags {Fail = (1<<0), HitEof = (1<<1)};
   unsigned long Flags;
   std::string FileName;
   std::string Buffer;
   std::string::size_type BufferPos;

   HOSTAUTH_HIDDEN bool FillBuffer();
   HOSTAUTH_HIDDEN bool FileFdErrno(const char *Function, const char *Description) HOSTAUTH_COLD;

   public:
   /** \brief open FileName for reading, closing the file opened before */
   bool Open(std::string const &FileName);
   /** read a complete line from the file
    *
    *  Similar to std::getline() the string does \b not include
    *  the newline (nor a carriage return in front of it).
    *
    *  @param To string which will hold the line
    *  @return \b true if a line was read, \b false at the end of the
    *  file or on errors (check #Failed to tell them apart)
    */
   bool ReadLine(std::string &To);
   bool Close();

   bool IsOpen() const { return iFd >= 0; }
   bool Failed() const { return (Flags & Fail) == Fail; }
   bool Eof() const { return (Flags & HitEof) == HitEof; }
   std::string const &Name() const { return FileName; }

   FileFd();
   ~FileFd();
   FileFd(const FileFd &) = delete;
   FileFd &operator=(const FileFd &) = delete;
};

HOSTAUTH_PUBLIC bool RealFileExists(std::string const &File);

/** \brief the current directory with a trailing slash, empty on errors */
HOSTAUTH_PUBLIC std::string SafeGetCWD();

/** \brief removes superfluous /./ and // from path */
HOSTAUTH_PUBLIC std::string flNormalize(std::string const &File);

#endif
