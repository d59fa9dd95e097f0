// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   File Utilities

   FileFd keeps one FileFdPrivate per open file. The private is picked
   by the compressor and moves the bytes between the caller and the
   descriptor, FileFd itself only does the bookkeeping: retries on
   EINTR, the current offset, atomic replacement and error reporting.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/fileutl.h>
#include <repo-pkg/macros.h>
#include <repo-pkg/strutl.h>

#include <algorithm>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <dirent.h>
#include <errno.h>
#include <fcntl.h>
#include <ftw.h>
#include <glob.h>
#include <signal.h>
#include <stdarg.h>
#include <stdio.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#ifdef HAVE_ZLIB
#include <zlib.h>
#endif
#ifdef HAVE_BZ2
#include <bzlib.h>
#endif
#ifdef HAVE_LZMA
#include <lzma.h>
#endif

#include <repoi18n.h>
									/*}}}*/

// CopyFile - copy the rest of From into To				/*{{{*/
// ---------------------------------------------------------------------
/* A failure leaves To half written, callers use EraseOnFailure() */
bool CopyFile(FileFd &From,FileFd &To)
{
   if (From.IsOpen() == false || To.IsOpen() == false ||
       From.Failed() == true || To.Failed() == true)
      return false;

   std::unique_ptr<unsigned char[]> Buf(new unsigned char[REPO_BUFFER_SIZE]);
   while (true)
   {
      unsigned long long Got = 0;
      if (From.Read(Buf.get(), REPO_BUFFER_SIZE, &Got) == false)
	 return false;
      if (Got == 0)
	 return true;
      if (To.Write(Buf.get(), Got) == false)
	 return false;
   }
}
									/*}}}*/
// RemoveFile - unlink, but a missing file is fine			/*{{{*/
bool RemoveFile(char const * const Function, std::string const &FileName)
{
   if (unlink(FileName.c_str()) == 0 || errno == ENOENT)
      return true;
   return _error->WarningE(Function,_("Problem unlinking the file %s"), FileName.c_str());
}
									/*}}}*/
// RemoveDirectoryTree - rm -rf						/*{{{*/
static int RemoveTreeEntry(const char *Path, const struct stat *, int, struct FTW *)
{
   return remove(Path);
}
bool RemoveDirectoryTree(char const * const Function, std::string const &Path)
{
   struct stat Buf;
   if (lstat(Path.c_str(), &Buf) != 0)
   {
      if (errno == ENOENT)
	 return true;
      return _error->Errno(Function, _("Unable to stat %s"), Path.c_str());
   }
   if (S_ISDIR(Buf.st_mode) == false)
      return RemoveFile(Function, Path);

   // depth first, so every directory is empty once we get to it
   if (nftw(Path.c_str(), RemoveTreeEntry, 16, FTW_DEPTH | FTW_PHYS) != 0)
      return _error->Errno(Function, _("Unable to remove the directory %s"), Path.c_str());
   return true;
}
									/*}}}*/
// FileExists - anything, directories included				/*{{{*/
bool FileExists(std::string const &File)
{
   struct stat Buf;
   return stat(File.c_str(),&Buf) == 0;
}
									/*}}}*/
// RealFileExists - a regular file					/*{{{*/
bool RealFileExists(std::string const &File)
{
   struct stat Buf;
   return stat(File.c_str(),&Buf) == 0 && S_ISREG(Buf.st_mode);
}
									/*}}}*/
// DirectoryExists - a directory					/*{{{*/
bool DirectoryExists(std::string const &Path)
{
   struct stat Buf;
   return stat(Path.c_str(),&Buf) == 0 && S_ISDIR(Buf.st_mode);
}
									/*}}}*/
// MakePathBelow - create every component of Rest below Base		/*{{{*/
static bool MakePathBelow(std::string Base, std::string const &Rest)
{
   for (auto const &Part : VectorizeString(Rest, '/'))
   {
      if (Part.empty() == true)
	 continue;
      if (Base.empty() == false && Base.back() != '/')
	 Base.push_back('/');
      Base.append(Part);
      if (mkdir(Base.c_str(), 0755) == 0)
	 continue;
      if (errno == EEXIST && DirectoryExists(Base) == true)
	 continue;
      return _error->Errno("mkdir", _("Unable to create directory %s"), Base.c_str());
   }
   return true;
}
									/*}}}*/
// CreateDirectory - mkdir -p guarded by an existing parent		/*{{{*/
bool CreateDirectory(std::string const &Parent, std::string const &Path)
{
   if (Parent.empty() == true || Path.empty() == true)
      return _error->Error(_("Unable to create a directory without a name"));
   if (DirectoryExists(Path) == true)
      return true;
   if (DirectoryExists(Parent) == false)
      return _error->Error(_("Parent directory %s of %s does not exist"), Parent.c_str(), Path.c_str());
   if (Path.compare(0, Parent.length(), Parent) != 0)
      return _error->Error(_("Directory %s is not below %s"), Path.c_str(), Parent.c_str());
   return MakePathBelow(Parent, Path.substr(Parent.length()));
}
									/*}}}*/
// CreateDirectories - mkdir -p						/*{{{*/
bool CreateDirectories(std::string const &Path)
{
   if (Path.empty() == true)
      return _error->Error(_("Unable to create a directory without a name"));
   if (DirectoryExists(Path) == true)
      return true;
   return MakePathBelow(Path[0] == '/' ? "/" : "", Path);
}
									/*}}}*/
// Rename - rename a file with error reporting				/*{{{*/
bool Rename(std::string const &From, std::string const &To)
{
   if (rename(From.c_str(),To.c_str()) == 0)
      return true;
   return _error->Errno("rename",_("rename failed, %s (%s -> %s)."),strerror(errno),
			From.c_str(),To.c_str());
}
									/*}}}*/
// flNotDir - the file name without its directory			/*{{{*/
std::string flNotDir(std::string const &File)
{
   auto const Slash = File.rfind('/');
   return Slash == std::string::npos ? File : File.substr(Slash + 1);
}
									/*}}}*/
// flNotFile - the directory of a file, ending in a /			/*{{{*/
std::string flNotFile(std::string const &File)
{
   auto const Slash = File.rfind('/');
   return Slash == std::string::npos ? std::string("./") : File.substr(0, Slash + 1);
}
									/*}}}*/
// flCombine - File relative to Dir, absolute files stay as they are	/*{{{*/
std::string flCombine(std::string const &Dir,std::string const &File)
{
   if (File.empty() == true)
      return std::string();
   if (File[0] == '/' || Dir.empty() == true)
      return File;
   if (Dir.back() == '/')
      return Dir + File;
   return Dir + '/' + File;
}
									/*}}}*/
// ExecFork - fork a child ready to exec something			/*{{{*/
pid_t ExecFork()
{
   pid_t const Process = fork();
   if (Process != 0)
      return Process;

   for (int const Sig : {SIGPIPE, SIGQUIT, SIGINT, SIGWINCH, SIGCONT, SIGTSTP})
      signal(Sig, SIG_DFL);

   // nothing of ours but stdin, stdout and stderr survives the exec
   DIR * const Dir = opendir("/proc/self/fd");
   if (Dir == nullptr)
   {
      long const Max = sysconf(_SC_OPEN_MAX);
      for (int Fd = 3; Fd < Max; ++Fd)
	 fcntl(Fd, F_SETFD, FD_CLOEXEC);
      return Process;
   }
   for (struct dirent *Ent = readdir(Dir); Ent != nullptr; Ent = readdir(Dir))
   {
      int const Fd = atoi(Ent->d_name);
      if (Fd > 2 && Fd != dirfd(Dir))
	 fcntl(Fd, F_SETFD, FD_CLOEXEC);
   }
   closedir(Dir);
   return Process;
}
									/*}}}*/
// ExecWait - wait for a child and report how it ended			/*{{{*/
bool ExecWait(pid_t Pid,const char *Name)
{
   if (Pid <= 1)
      return true;

   int Status = 0;
   while (waitpid(Pid,&Status,0) != Pid)
      if (errno != EINTR)
	 return _error->Errno("waitpid", _("Waited for %s but it wasn't there"), Name);

   if (WIFEXITED(Status) != 0)
   {
      if (WEXITSTATUS(Status) == 0)
	 return true;
      return _error->Error(_("Sub-process %s returned an error code (%u)"), Name, WEXITSTATUS(Status));
   }
   if (WIFSIGNALED(Status) != 0)
      return _error->Error(_("Sub-process %s received signal %u."), Name, WTERMSIG(Status));
   return _error->Error(_("Sub-process %s exited unexpectedly"), Name);
}
									/*}}}*/
// Glob - sorted matches of a shell pattern				/*{{{*/
std::vector<std::string> Glob(std::string const &pattern, int flags)
{
   std::vector<std::string> Result;
   glob_t Matches;
   int const Res = glob(pattern.c_str(), flags, nullptr, &Matches);
   if (Res == 0)
      Result.assign(Matches.gl_pathv, Matches.gl_pathv + Matches.gl_pathc);
   else if (Res != GLOB_NOMATCH)
      _error->Errno("glob", _("Problem with glob %s"), pattern.c_str());
   globfree(&Matches);
   return Result;
}
									/*}}}*/

class REPO_HIDDEN FileFdPrivate						/*{{{*/
{
   protected:
   FileFd * const Owner;

   public:
   REPO::Configuration::Compressor Compressor;
   unsigned long long Position = 0;

   explicit FileFdPrivate(FileFd * const Owner) : Owner(Owner) {}
   virtual ~FileFdPrivate() {}

   virtual bool Begin(int const Fd, unsigned int const Mode) = 0;
   // like read(2) and write(2): -1 with errno set, or the bytes moved
   virtual ssize_t ReadSome(void * const To, unsigned long long const Size) = 0;
   virtual ssize_t WriteSome(void const * const From, unsigned long long const Size) = 0;
   virtual bool Finish() = 0;

   virtual bool ReadFailed() { return Owner->FileFdErrno("read",_("Read error")); }
   virtual bool WriteFailed() { return Owner->FileFdErrno("write",_("Write error")); }

   // streams only go forward, skipping is reading into the void
   virtual bool SkipOver(unsigned long long Over)
   {
      char Junk[4096];
      while (Over != 0)
      {
	 unsigned long long const Chunk = std::min<unsigned long long>(sizeof(Junk), Over);
	 if (Owner->Read(Junk, Chunk) == false)
	    return Owner->FileFdError(_("Unable to seek ahead %llu"), Over);
	 Over -= Chunk;
      }
      return true;
   }
   virtual bool SeekTo(unsigned long long const To)
   {
      if (To < Position)
	 return Owner->FileFdError(_("Unable to seek back in the compressed file %s"), Owner->FileName.c_str());
      return SkipOver(To - Position);
   }
   virtual unsigned long long Offset() { return Position; }
   // the library closes the descriptor it was handed
   virtual bool OwnsDescriptor() const { return true; }
};
									/*}}}*/
class REPO_HIDDEN DirectFileFdPrivate: public FileFdPrivate		/*{{{*/
{
   public:
   virtual bool Begin(int const, unsigned int const) override { return true; }
   virtual ssize_t ReadSome(void * const To, unsigned long long const Size) override
   {
      return read(Owner->iFd, To, Size);
   }
   virtual ssize_t WriteSome(void const * const From, unsigned long long const Size) override
   {
      return write(Owner->iFd, From, Size);
   }
   virtual bool Finish() override { return true; }
   virtual bool SkipOver(unsigned long long const Over) override
   {
      off_t const Res = lseek(Owner->iFd, Over, SEEK_CUR);
      if (Res < 0)
	 return Owner->FileFdErrno("lseek", _("Unable to seek ahead %llu"), Over);
      Position = Res;
      return true;
   }
   virtual bool SeekTo(unsigned long long const To) override
   {
      if (lseek(Owner->iFd, To, SEEK_SET) != static_cast<off_t>(To))
	 return Owner->FileFdErrno("lseek", _("Unable to seek to %llu"), To);
      Position = To;
      return true;
   }
   virtual unsigned long long Offset() override
   {
      off_t const Res = lseek(Owner->iFd, 0, SEEK_CUR);
      if (Res < 0)
      {
	 Owner->FileFdErrno("lseek", _("Failed to determine the current file position"));
	 return 0;
      }
      return Res;
   }
   virtual bool OwnsDescriptor() const override { return false; }

   explicit DirectFileFdPrivate(FileFd * const Owner) : FileFdPrivate(Owner) {}
};
									/*}}}*/
#ifdef HAVE_ZLIB
class REPO_HIDDEN GzipFileFdPrivate: public FileFdPrivate		/*{{{*/
{
   gzFile gz = nullptr;

   bool LibraryError(char const * const Function, char const * const What)
   {
      int Err = Z_OK;
      char const * const Msg = gzerror(gz, &Err);
      if (Err == Z_ERRNO)
	 return Owner->FileFdErrno(Function, "%s", What);
      return Owner->FileFdError("%s: %s (%d: %s)", Function, What, Err, Msg);
   }

   public:
   virtual bool Begin(int const Fd, unsigned int const Mode) override
   {
      gz = gzdopen(Fd, (Mode & FileFd::WriteOnly) != 0 ? "w" : "r");
      return gz != nullptr;
   }
   virtual ssize_t ReadSome(void * const To, unsigned long long const Size) override
   {
      return gzread(gz, To, Size);
   }
   virtual ssize_t WriteSome(void const * const From, unsigned long long const Size) override
   {
      return gzwrite(gz, From, Size);
   }
   virtual bool ReadFailed() override { return LibraryError("gzread", _("Read error")); }
   virtual bool WriteFailed() override { return LibraryError("gzwrite", _("Write error")); }
   virtual bool Finish() override
   {
      if (gz == nullptr)
	 return true;
      int const Res = gzclose(gz);
      gz = nullptr;
      // an empty stream reports a buffer error on close
      if (Res != Z_OK && Res != Z_BUF_ERROR)
	 return _error->Errno("gzclose",_("Problem closing the gzip file %s"), Owner->FileName.c_str());
      return true;
   }

   explicit GzipFileFdPrivate(FileFd * const Owner) : FileFdPrivate(Owner) {}
   virtual ~GzipFileFdPrivate() { Finish(); }
};
									/*}}}*/
#endif
#ifdef HAVE_BZ2
class REPO_HIDDEN Bz2FileFdPrivate: public FileFdPrivate		/*{{{*/
{
   BZFILE *bz2 = nullptr;

   bool LibraryError(char const * const Function, char const * const What)
   {
      int Err = BZ_OK;
      char const * const Msg = BZ2_bzerror(bz2, &Err);
      if (Err == BZ_IO_ERROR)
	 return Owner->FileFdErrno(Function, "%s", What);
      return Owner->FileFdError("%s: %s (%d: %s)", Function, What, Err, Msg);
   }

   public:
   virtual bool Begin(int const Fd, unsigned int const Mode) override
   {
      bz2 = BZ2_bzdopen(Fd, (Mode & FileFd::WriteOnly) != 0 ? "w" : "r");
      return bz2 != nullptr;
   }
   virtual ssize_t ReadSome(void * const To, unsigned long long const Size) override
   {
      return BZ2_bzread(bz2, To, Size);
   }
   virtual ssize_t WriteSome(void const * const From, unsigned long long const Size) override
   {
      return BZ2_bzwrite(bz2, const_cast<void *>(From), Size);
   }
   virtual bool ReadFailed() override { return LibraryError("BZ2_bzread", _("Read error")); }
   virtual bool WriteFailed() override { return LibraryError("BZ2_bzwrite", _("Write error")); }
   virtual bool Finish() override
   {
      if (bz2 != nullptr)
	 BZ2_bzclose(bz2);
      bz2 = nullptr;
      return true;
   }

   explicit Bz2FileFdPrivate(FileFd * const Owner) : FileFdPrivate(Owner) {}
   virtual ~Bz2FileFdPrivate() { Finish(); }
};
									/*}}}*/
#endif
#ifdef HAVE_LZMA
class REPO_HIDDEN LzmaFileFdPrivate: public FileFdPrivate		/*{{{*/
{
   int fd = -1;
   uint8_t buffer[4096];
   lzma_stream stream = LZMA_STREAM_INIT;
   lzma_ret err = LZMA_OK;
   bool eof = false;
   bool compressing = false;

   bool Drain(lzma_action const Action)
   {
      do {
	 stream.next_out = buffer;
	 stream.avail_out = sizeof(buffer);
	 err = lzma_code(&stream, Action);
	 if (err != LZMA_OK && err != LZMA_STREAM_END)
	    return false;
	 size_t const Pending = sizeof(buffer) - stream.avail_out;
	 if (Pending != 0 && FileFd::Write(fd, buffer, Pending) == false)
	    return false;
      } while (Action == LZMA_FINISH ? err != LZMA_STREAM_END : stream.avail_in != 0);
      return true;
   }

   public:
   virtual bool Begin(int const Fd, unsigned int const Mode) override
   {
      uint32_t const Level = _config->FindI("Repo::Compressor::xz::Level", 6);
      bool const xz = (Compressor.Name == "xz");
      compressing = (Mode & FileFd::WriteOnly) != 0;
      lzma_ret Init;
      if (compressing == true && xz == true)
	 Init = lzma_easy_encoder(&stream, Level, LZMA_CHECK_CRC64);
      else if (compressing == true)
      {
	 lzma_options_lzma Options;
	 if (lzma_lzma_preset(&Options, Level) != false)
	    return false;
	 Init = lzma_alone_encoder(&stream, &Options);
      }
      else if (xz == true)
	 Init = lzma_stream_decoder(&stream, UINT64_MAX, 0);
      else
	 Init = lzma_alone_decoder(&stream, UINT64_MAX);
      if (Init != LZMA_OK)
	 return false;
      fd = Fd;
      return true;
   }
   virtual ssize_t ReadSome(void * const To, unsigned long long const Size) override
   {
      if (eof == true)
	 return 0;
      stream.next_out = static_cast<uint8_t *>(To);
      stream.avail_out = Size;
      while (stream.avail_out == Size)
      {
	 if (stream.avail_in == 0)
	 {
	    ssize_t const Got = read(fd, buffer, sizeof(buffer));
	    if (Got < 0)
	       return -1;
	    stream.next_in = buffer;
	    stream.avail_in = Got;
	 }
	 // no more input, so a missing end marker is an error
	 err = lzma_code(&stream, stream.avail_in == 0 ? LZMA_FINISH : LZMA_RUN);
	 if (err == LZMA_STREAM_END)
	 {
	    eof = true;
	    break;
	 }
	 if (err != LZMA_OK)
	 {
	    errno = 0;
	    return -1;
	 }
      }
      return Size - stream.avail_out;
   }
   virtual ssize_t WriteSome(void const * const From, unsigned long long const Size) override
   {
      stream.next_in = static_cast<uint8_t const *>(From);
      stream.avail_in = Size;
      if (Drain(LZMA_RUN) == false)
      {
	 errno = 0;
	 return -1;
      }
      return Size;
   }
   virtual bool ReadFailed() override
   {
      if (errno != 0)
	 return FileFdPrivate::ReadFailed();
      return Owner->FileFdError("lzma_code: %s (%d)", _("Read error"), err);
   }
   virtual bool WriteFailed() override
   {
      if (errno != 0)
	 return FileFdPrivate::WriteFailed();
      return Owner->FileFdError("lzma_code: %s (%d)", _("Write error"), err);
   }
   virtual bool Finish() override
   {
      if (fd == -1)
	 return true;
      bool Res = true;
      if (compressing == true && Owner->Failed() == false && Drain(LZMA_FINISH) == false)
	 Res = _error->Error(_("Problem finishing the compressed file %s (%d)"), Owner->FileName.c_str(), err);
      lzma_end(&stream);
      if (close(fd) != 0)
	 Res = _error->Errno("close", _("Problem closing the file %s"), Owner->FileName.c_str());
      fd = -1;
      return Res;
   }

   explicit LzmaFileFdPrivate(FileFd * const Owner) : FileFdPrivate(Owner) {}
   virtual ~LzmaFileFdPrivate() { Finish(); }
};
									/*}}}*/
#endif

// FileFd Constructors							/*{{{*/
FileFd::FileFd(std::string FileName,unsigned int const Mode,unsigned long AccessMode) : iFd(-1), Flags(0), d(nullptr)
{
   Open(FileName, Mode, None, AccessMode);
}
FileFd::FileFd() : iFd(-1), Flags(AutoClose), d(nullptr) {}
FileFd::~FileFd()
{
   Close();
   delete d;
}
									/*}}}*/
// FileFd::Open - Open a file						/*{{{*/
bool FileFd::Open(std::string FileName,unsigned int const Mode,CompressMode Compress, unsigned long const AccessMode)
{
   std::vector<REPO::Configuration::Compressor> const Compressors = REPO::Configuration::getCompressors();
   // the first one is "." standing for no compression at all
   auto Comp = Compressors.begin();
   if (Compress == Extension)
   {
      auto const Known = std::find_if(Compressors.begin() + 1, Compressors.end(),
	    [&FileName](REPO::Configuration::Compressor const &C) {
	       return REPO::String::Endswith(FileName, C.Extension);
	    });
      if (Known != Compressors.end())
	 Comp = Known;
   }
   return Open(FileName, Mode, *Comp, AccessMode);
}
static int OpenFlags(unsigned int const Mode)
{
   int Res = O_CLOEXEC;
   if ((Mode & FileFd::ReadWrite) == FileFd::ReadWrite)
      Res |= O_RDWR;
   else if ((Mode & FileFd::WriteOnly) == FileFd::WriteOnly)
      Res |= O_WRONLY;
   else
      Res |= O_RDONLY;
   if ((Mode & FileFd::Create) == FileFd::Create)
      Res |= O_CREAT;
   if ((Mode & FileFd::Empty) == FileFd::Empty)
      Res |= O_TRUNC;
   if ((Mode & FileFd::Append) == FileFd::Append)
      Res |= O_APPEND;
   return Res;
}
bool FileFd::Open(std::string FileName,unsigned int const Mode,REPO::Configuration::Compressor const &compressor, unsigned long const AccessMode)
{
   Close();
   Flags = AutoClose;
   this->FileName = FileName;

   if ((Mode & ReadWrite) == 0)
      return FileFdError("No openmode provided in FileFd::Open for %s", FileName.c_str());
   if ((Mode & WriteOnly) == 0 && (Mode & (Create | Empty | Append | Atomic)) != 0)
      return FileFdError("ReadOnly mode for %s doesn't accept additional flags!", FileName.c_str());

   if ((Mode & Atomic) == Atomic)
   {
      // written next to the target, so the final rename can't cross devices
      TemporaryFileName = FileName + ".XXXXXX";
      iFd = mkostemp(&TemporaryFileName[0], O_CLOEXEC);
      if (iFd == -1)
	 return FileFdErrno("mkostemp", _("Could not create temporary file for %s"), FileName.c_str());
      Flags |= Replace;
      // mkostemp creates 0600, use what open() would have done
      mode_t const Umask = umask(0);
      umask(Umask);
      if (fchmod(iFd, AccessMode & ~Umask) != 0)
	 return FileFdErrno("fchmod", _("Could not change permissions for temporary file %s"), TemporaryFileName.c_str());
   }
   else
   {
      iFd = open(FileName.c_str(), OpenFlags(Mode), AccessMode);
      if (iFd == -1)
	 return FileFdErrno("open",_("Could not open file %s"), FileName.c_str());
   }

   if (OpenInternDescriptor(Mode, compressor) == false)
      return FileFdError(_("Could not open file %s"), FileName.c_str());
   return true;
}
									/*}}}*/
// FileFd::OpenDescriptor - Open a filedescriptor			/*{{{*/
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, bool AutoClose)
{
   return OpenDescriptor(Fd, Mode, REPO::Configuration::getCompressors().front(), AutoClose);
}
bool FileFd::OpenDescriptor(int Fd, unsigned int const Mode, REPO::Configuration::Compressor const &compressor, bool AutoClose)
{
   Close();
   Flags = (AutoClose == true) ? FileFd::AutoClose : 0;
   FileName.clear();
   iFd = Fd;
   if (OpenInternDescriptor(Mode, compressor) == false)
      return FileFdError(_("Could not open file descriptor %d"), Fd);
   return true;
}
									/*}}}*/
// FileFd::OpenInternDescriptor - pick the private for the compressor	/*{{{*/
bool FileFd::OpenInternDescriptor(unsigned int const Mode, REPO::Configuration::Compressor const &compressor)
{
   if (iFd == -1)
      return false;
   delete d;
   d = nullptr;

   if (compressor.Name == ".")
      d = new DirectFileFdPrivate(this);
#ifdef HAVE_ZLIB
   else if (compressor.Name == "gzip")
      d = new GzipFileFdPrivate(this);
#endif
#ifdef HAVE_BZ2
   else if (compressor.Name == "bzip2")
      d = new Bz2FileFdPrivate(this);
#endif
#ifdef HAVE_LZMA
   else if (compressor.Name == "xz" || compressor.Name == "lzma")
      d = new LzmaFileFdPrivate(this);
#endif
   else
      return FileFdError(_("Compressor %s is not supported by this build"), compressor.Name.c_str());
   d->Compressor = compressor;

   if (d->OwnsDescriptor() == true)
   {
      if ((Mode & ReadWrite) == ReadWrite)
	 return FileFdError(_("ReadWrite mode is not supported for compressed files %s"), FileName.c_str());
      // the library closes what it gets, the caller keeps its descriptor
      if ((Flags & AutoClose) != AutoClose)
      {
	 int const Dup = fcntl(iFd, F_DUPFD_CLOEXEC, 0);
	 if (Dup == -1)
	    return FileFdErrno("dup", _("Could not open file descriptor %d"), iFd);
	 iFd = Dup;
	 Flags |= AutoClose;
      }
   }
   if (d->Begin(iFd, Mode) == false)
      return false;
   if (d->OwnsDescriptor() == true)
      Flags |= Compressed;
   return true;
}
									/*}}}*/
// FileFd::Read - Read a bit of the file				/*{{{*/
bool FileFd::Read(void *To,unsigned long long Size,unsigned long long *Actual)
{
   if (Actual != nullptr)
      *Actual = 0;
   if (d == nullptr || Failed() == true)
      return false;

   char *Pos = static_cast<char *>(To);
   while (Size != 0)
   {
      errno = 0;
      ssize_t const Res = d->ReadSome(Pos, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return d->ReadFailed();
      }
      if (Res == 0)
	 break;
      Pos += Res;
      Size -= Res;
      d->Position += Res;
      if (Actual != nullptr)
	 *Actual += Res;
   }

   if (Size == 0)
      return true;
   if (Actual != nullptr)
   {
      Flags |= HitEof;
      return true;
   }
   return FileFdError(_("read, still have %llu to read but none left"), Size);
}
									/*}}}*/
// FileFd::Write - Write to the file					/*{{{*/
bool FileFd::Write(const void *From,unsigned long long Size)
{
   if (d == nullptr || Failed() == true)
      return false;

   char const *Pos = static_cast<char const *>(From);
   while (Size != 0)
   {
      errno = 0;
      ssize_t const Res = d->WriteSome(Pos, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return d->WriteFailed();
      }
      if (Res == 0)
	 return FileFdError(_("write, still have %llu to write but couldn't"), Size);
      Pos += Res;
      Size -= Res;
      d->Position += Res;
   }
   return true;
}
bool FileFd::Write(int Fd, const void *From, unsigned long long Size)
{
   char const *Pos = static_cast<char const *>(From);
   while (Size != 0)
   {
      ssize_t const Res = write(Fd, Pos, Size);
      if (Res < 0)
      {
	 if (errno == EINTR)
	    continue;
	 return _error->Errno("write",_("Write error"));
      }
      if (Res == 0)
	 return _error->Error(_("write, still have %llu to write but couldn't"), Size);
      Pos += Res;
      Size -= Res;
   }
   return true;
}
									/*}}}*/
// FileFd::Seek/Skip/Tell - positioning					/*{{{*/
bool FileFd::Seek(unsigned long long To)
{
   if (d == nullptr || Failed() == true)
      return false;
   Flags &= ~HitEof;
   return d->SeekTo(To);
}
bool FileFd::Skip(unsigned long long Over)
{
   if (d == nullptr || Failed() == true)
      return false;
   return d->SkipOver(Over);
}
unsigned long long FileFd::Tell()
{
   if (d == nullptr || Failed() == true)
      return 0;
   d->Position = d->Offset();
   return d->Position;
}
									/*}}}*/
// FileFd::FileSize - Return the size of the file			/*{{{*/
unsigned long long FileFd::FileSize()
{
   struct stat Buf;
   if (fstat(iFd,&Buf) != 0)
   {
      FileFdErrno("fstat", _("Unable to determine the file size of %s"), FileName.c_str());
      return 0;
   }
   return Buf.st_size;
}
									/*}}}*/
// FileFd::Close - Close the file if the close flag is set		/*{{{*/
// ---------------------------------------------------------------------
/* Atomic files replace their target now, unless something failed.
   With EraseOnFailure a failed file is removed. */
bool FileFd::Close()
{
   if (iFd == -1)
      return true;

   bool Res = true;
   if (d != nullptr)
   {
      Res &= d->Finish();
      // the compressor has closed iFd already
      if ((Flags & Compressed) == Compressed)
	 iFd = -1;
      delete d;
      d = nullptr;
   }
   if (iFd != -1 && (Flags & AutoClose) == AutoClose && close(iFd) != 0)
      Res &= _error->Errno("close",_("Problem closing the file %s"), FileName.c_str());
   iFd = -1;

   if ((Flags & Replace) == Replace)
   {
      if (Failed() == false && Res == true && rename(TemporaryFileName.c_str(), FileName.c_str()) != 0)
	 Res &= _error->Errno("rename",_("Problem renaming the file %s to %s"), TemporaryFileName.c_str(), FileName.c_str());
      if (Failed() == true || Res == false)
	 RemoveFile("FileFd::Close", TemporaryFileName);
      TemporaryFileName.clear();
   }

   if (Failed() == true && (Flags & DelOnFail) == DelOnFail && FileName.empty() == false)
      Res &= RemoveFile("FileFd::Close", FileName);

   if (Res == false)
      Flags |= Fail;
   return Res;
}
									/*}}}*/
// FileFd::Sync - Sync the file						/*{{{*/
bool FileFd::Sync()
{
   if (fsync(iFd) != 0)
      return FileFdErrno("sync",_("Problem syncing the file"));
   return true;
}
									/*}}}*/
// FileFd::FileFdErrno - set Fail and call _error->Errno		/*{{{*/
bool FileFd::FileFdErrno(const char *Function, const char *Description,...)
{
   Flags |= Fail;
   int const errsv = errno;
   va_list args;
   va_start(args,Description);
   _error->InsertErrno(GlobalError::ERROR, Function, Description, args, errsv);
   va_end(args);
   return false;
}
									/*}}}*/
// FileFd::FileFdError - set Fail and call _error->Error		/*{{{*/
bool FileFd::FileFdError(const char *Description,...) {
   Flags |= Fail;
   va_list args;
   va_start(args,Description);
   _error->Insert(GlobalError::ERROR, Description, args);
   va_end(args);
   return false;
}
									/*}}}*/
