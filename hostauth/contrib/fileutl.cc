// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <hostauth/error.h>
#include <hostauth/fileutl.h>
#include <hostauth/strutl.h>

#include <string>

#include <errno.h>
#include <fcntl.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <hostauthi18n.h>
									/*}}}*/

FileFd::FileFd() : iFd(-1), Flags(0), BufferPos(0)
{
}
FileFd::~FileFd()
{
   Close();
}
// FileFd::FileFdErrno - mark as failed and report errno		/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description)
{
   Flags |= Fail;
   return _error->Errno(Function, Description, FileName.c_str());
}
									/*}}}*/
bool FileFd::Open(std::string const &Name)				/*{{{*/
{
   Close();
   FileName = Name;
   do
      iFd = open(FileName.c_str(), O_RDONLY | O_CLOEXEC);
   while (iFd == -1 && errno == EINTR);
   if (iFd == -1)
      return FileFdErrno("open", _("Could not open file %s"));
   return true;
}
									/*}}}*/
// FileFd::FillBuffer - replace the consumed buffer with new data	/*{{{*/
bool FileFd::FillBuffer()
{
   char Buf[4096];
   ssize_t Res;
   do
      Res = read(iFd, Buf, sizeof(Buf));
   while (Res < 0 && errno == EINTR);
   if (Res < 0)
      return FileFdErrno("read", _("Read error on %s"));
   if (Res == 0)
      Flags |= HitEof;
   Buffer.assign(Buf, Res);
   BufferPos = 0;
   return true;
}
									/*}}}*/
bool FileFd::ReadLine(std::string &To)					/*{{{*/
{
   To.clear();
   if (IsOpen() == false || Failed() == true)
      return false;

   while (true)
   {
      if (BufferPos == Buffer.length())
      {
	 if (Eof() == true || FillBuffer() == false || Buffer.empty() == true)
	    break;
      }
      auto const Newline = Buffer.find('\n', BufferPos);
      if (Newline != std::string::npos)
      {
	 To.append(Buffer, BufferPos, Newline - BufferPos);
	 BufferPos = Newline + 1;
	 if (To.empty() == false && To.back() == '\r')
	    To.pop_back();
	 return true;
      }
      To.append(Buffer, BufferPos, std::string::npos);
      BufferPos = Buffer.length();
   }

   // the last line might not end in a newline
   if (Failed() == true || To.empty() == true)
      return false;
   if (To.back() == '\r')
      To.pop_back();
   return true;
}
									/*}}}*/
bool FileFd::Close()							/*{{{*/
{
   bool Res = true;
   if (iFd != -1 && close(iFd) != 0)
      Res = _error->Errno("close", _("Problem closing the file %s"), FileName.c_str());
   iFd = -1;
   Flags = 0;
   Buffer.clear();
   BufferPos = 0;
   return Res;
}
									/*}}}*/
// RealFileExists - Check if a file exists and if it is really a file	/*{{{*/
bool RealFileExists(std::string const &File)
{
   struct stat Buf;
   if (stat(File.c_str(), &Buf) != 0)
      return false;
   return S_ISREG(Buf.st_mode);
}
									/*}}}*/
std::string SafeGetCWD()						/*{{{*/
{
   std::string Dir(256, '\0');
   while (getcwd(&Dir[0], Dir.size()) == nullptr)
   {
      if (errno != ERANGE)
	 return "";
      Dir.resize(Dir.size() * 2);
   }
   Dir.resize(strlen(Dir.c_str()));
   if (Dir.empty() == true || Dir.back() != '/')
      Dir.push_back('/');
   return Dir;
}
									/*}}}*/
std::string flNormalize(std::string const &File)			/*{{{*/
{
   if (File.empty() == true)
      return File;

   std::string Res;
   if (File[0] == '/')
      Res = "/";
   for (auto const &Part : VectorizeString(File, '/'))
   {
      if (Part.empty() == true || Part == ".")
	 continue;
      if (Res.empty() == false && Res.back() != '/')
	 Res.push_back('/');
      Res.append(Part);
   }
   if (File.back() == '/' && Res.empty() == false && Res.back() != '/')
      Res.push_back('/');
   return Res;
}
									/*}}}*/
