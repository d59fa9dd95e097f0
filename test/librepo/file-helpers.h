#ifndef REPO_TESTS_FILE_HELPERS
#define REPO_TESTS_FILE_HELPERS

#include <string>

#include <gtest/gtest.h>

#define createTemporaryDirectory(id, dir) \
   ASSERT_NO_FATAL_FAILURE(helperCreateTemporaryDirectory(id, dir))
void helperCreateTemporaryDirectory(std::string const &id, std::string &dir);
#define removeDirectory(dir) \
   ASSERT_NO_FATAL_FAILURE(helperRemoveDirectory(dir))
void helperRemoveDirectory(std::string const &dir);
#define createFile(dir, name) \
   ASSERT_NO_FATAL_FAILURE(helperCreateFile(dir, name))
void helperCreateFile(std::string const &dir, std::string const &name);
#define createFileWithContent(dir, name, content) \
   ASSERT_NO_FATAL_FAILURE(helperCreateFileWithContent(dir, name, content))
void helperCreateFileWithContent(std::string const &dir, std::string const &name, std::string const &content);
#define createDirectory(dir, name) \
   ASSERT_NO_FATAL_FAILURE(helperCreateDirectory(dir, name))
void helperCreateDirectory(std::string const &dir, std::string const &name);

/** \brief the whole content of a file, uncompressed if the name says so */
std::string readFile(std::string const &file);

class ScopedFileDeleter {
   std::string _filename;
public:
   ScopedFileDeleter(std::string const &filename);
   ScopedFileDeleter(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter(ScopedFileDeleter &&);
   ScopedFileDeleter& operator=(ScopedFileDeleter const &) = delete;
   ScopedFileDeleter& operator=(ScopedFileDeleter &&);
   ~ScopedFileDeleter();

   std::string Name() const { return _filename; }
};
/** \brief a file in the temporary directory, removed with the returned deleter */
[[nodiscard]] ScopedFileDeleter createTemporaryFile(std::string const &id, char const * const content = nullptr);

#endif
