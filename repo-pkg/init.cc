// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Init - Initialize the repository library

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/init.h>

#include <string>
									/*}}}*/

const char *repoVersion = PACKAGE_VERSION;

// repoInitConfig - Initialize the configuration class			/*{{{*/
// ---------------------------------------------------------------------
/* Values already present, e.g. from a config file or an option given on
   the command line, are kept. */
bool repoInitConfig(Configuration &Cnf)
{
   // Layout of the generated repository
   Cnf.CndSet("Repo::Distribution", "termux");
   Cnf.CndSet("Repo::Component", "extras");
   if (Cnf.Exists("Repo::Architectures") == false)
   {
      Cnf.Set("Repo::Architectures::", "all");
      Cnf.Set("Repo::Architectures::", "arm");
      Cnf.Set("Repo::Architectures::", "aarch64");
   }
   Cnf.CndSet("Repo::Contents::Width", 80);

   // Compressed variants of the indexes, the plain file is always written
   Cnf.CndSet("Repo::Compress::Packages", "xz");
   Cnf.CndSet("Repo::Compress::Contents", "xz");

   // Release file
   Cnf.CndSet("Repo::Release::Version", "1");
   for (char const * const Index : {"Packages", "Release"})
      for (char const * const Hash : {"MD5", "SHA1", "SHA256", "SHA512"})
	 Cnf.CndSet((std::string("Repo::") + Index + "::" + Hash).c_str(), true);

   // Signing
   Cnf.CndSet("Dir::Bin::gpg", "gpg");
   Cnf.CndSet("Repo::Sign::DigestAlgo", "SHA256");
   Cnf.CndSet("Repo::Sign::Detached", false);

   return true;
}
									/*}}}*/
