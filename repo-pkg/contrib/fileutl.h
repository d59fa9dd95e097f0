// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd reads and writes plain files as well as the compressed .deb
   members and index files (gzip, bzip2, xz and lzma). The compression
   libraries run in-process, a compressed FileFd is strictly sequential.

   The free functions wrap the directory and process handling the
   repository builder needs, all of them report through _error.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_FILEUTL_H
#define REPO_FILEUTL_H

#include <repo-pkg/macros.h>
#include <repo-pkg/repoconfiguration.h>

#include <string>
#include <vector>
#include <sys/types.h>

class FileFdPrivate;
class REPO_PUBLIC FileFd
{
   friend class FileFdPrivate;
   friend class GzipFileFdPrivate;
   friend class Bz2FileFdPrivate;
   friend class LzmaFileFdPrivate;
   friend class DirectFileFdPrivate;
   protected:
   int iFd;

   enum LocalFlags {AutoClose = (1<<0),Fail = (1<<1),DelOnFail = (1<<2),
                    HitEof = (1<<3), Replace = (1<<4), Compressed = (1<<5) };
   unsigned long Flags;
   std::string FileName;
   std::string TemporaryFileName;

   public:
   enum OpenMode {
      ReadOnly = (1 << 0),
      WriteOnly = (1 << 1),
      ReadWrite = ReadOnly | WriteOnly,

      Create = (1 << 2),
      Empty = (1 << 3),
      Append = (1 << 4),
      // written to a temporary file which replaces FileName on Close()
      Atomic = (1 << 5),

      WriteAppend = WriteOnly | Create | Append,
      WriteAtomic = WriteOnly | Create | Atomic
   };
   enum CompressMode
   {
      None = 'N',
      // picked by the suffix of the file name
      Extension = 'E'
   };

   inline bool Read(void *To,unsigned long long Size,bool AllowEof)
   {
      unsigned long long Jnk;
      if (AllowEof)
	 return Read(To,Size,&Jnk);
      return Read(To,Size);
   }
   /** \brief read exactly Size bytes
    *
    *  With Actual a short read at the end of the file is fine, Actual
    *  then holds the number of bytes read and Eof() is set. */
   bool Read(void *To,unsigned long long Size,unsigned long long *Actual = 0);
   bool Write(const void *From,unsigned long long Size);
   bool static Write(int Fd, const void *From, unsigned long long Size);
   bool Seek(unsigned long long To);
   bool Skip(unsigned long long Over);
   unsigned long long Tell();
   // the size of the file on disk, compressed or not
   unsigned long long FileSize();

   bool Open(std::string FileName,unsigned int const Mode,CompressMode Compress,unsigned long const AccessMode = 0666);
   bool Open(std::string FileName,unsigned int const Mode,REPO::Configuration::Compressor const &compressor,unsigned long const AccessMode = 0666);
   inline bool Open(std::string const &FileName,unsigned int const Mode, unsigned long const AccessMode = 0666) {
      return Open(FileName, Mode, None, AccessMode);
   };
   /** \brief read or write through an already open descriptor
    *
    *  Without AutoClose the descriptor stays open after Close(), but
    *  it shares its offset with the FileFd while that is open. */
   bool OpenDescriptor(int Fd, unsigned int const Mode, REPO::Configuration::Compressor const &compressor, bool AutoClose=false);
   bool OpenDescriptor(int Fd, unsigned int const Mode, bool AutoClose=false);
   bool Close();
   bool Sync();

   // Simple manipulators
   inline int Fd() {return iFd;};

   inline bool IsOpen() {return iFd >= 0;};
   inline bool Failed() {return (Flags & Fail) == Fail;};
   inline void EraseOnFailure() {Flags |= DelOnFail;};
   inline void OpFail() {Flags |= Fail;};
   inline bool Eof() {return (Flags & HitEof) == HitEof;};
   inline bool IsCompressed() {return (Flags & Compressed) == Compressed;};
   inline std::string &Name() {return FileName;};

   FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode = 0666);
   FileFd();
   virtual ~FileFd();

   private:
   FileFdPrivate * d;
   FileFd(const FileFd &) = delete;
   FileFd & operator=(const FileFd &) = delete;
   REPO_HIDDEN bool OpenInternDescriptor(unsigned int const Mode, REPO::Configuration::Compressor const &compressor);

   // private helpers to set Fail flag and call _error->Error
   REPO_HIDDEN bool FileFdErrno(const char* Function, const char* Description,...) REPO_PRINTF(3) REPO_COLD;
   REPO_HIDDEN bool FileFdError(const char* Description,...) REPO_PRINTF(2) REPO_COLD;
};

/** \brief copy the rest of From into To */
REPO_PUBLIC bool CopyFile(FileFd &From,FileFd &To);
/** \brief unlink FileName, a missing file is not an error */
REPO_PUBLIC bool RemoveFile(char const * const Function, std::string const &FileName);
/** \brief remove Path and everything below it
 *
 *  Symlinks are removed, never followed. A missing Path is fine.
 */
REPO_PUBLIC bool RemoveDirectoryTree(char const * const Function, std::string const &Path);
REPO_PUBLIC bool FileExists(std::string const &File);
REPO_PUBLIC bool RealFileExists(std::string const &File);
REPO_PUBLIC bool DirectoryExists(std::string const &Path);
/** \brief mkdir -p of Path below the already existing Parent */
REPO_PUBLIC bool CreateDirectory(std::string const &Parent, std::string const &Path);
/** \brief mkdir -p of Path, creating every missing parent */
REPO_PUBLIC bool CreateDirectories(std::string const &Path);
REPO_PUBLIC bool Rename(std::string const &From, std::string const &To);

/** \brief fork a child for exec
 *
 *  The child gets the default signal handlers back and every
 *  descriptor above stderr is closed on exec.
 *  \return the pid as fork() does, -1 with errno set on failure */
REPO_PUBLIC pid_t ExecFork();
/** \brief wait for Pid, anything but exit code 0 is an error */
REPO_PUBLIC bool ExecWait(pid_t Pid,const char *Name);

// File string manipulators
REPO_PUBLIC std::string flNotDir(std::string const &File);
REPO_PUBLIC std::string flNotFile(std::string const &File);
REPO_PUBLIC std::string flCombine(std::string const &Dir,std::string const &File);

// sorted list of the paths matching pattern
REPO_PUBLIC std::vector<std::string> Glob(std::string const &pattern, int flags=0);

#endif
