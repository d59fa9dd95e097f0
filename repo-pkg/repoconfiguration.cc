// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Provide access methods to various configuration settings,
   setup defaults and returns validate settings.

   ##################################################################### */
									/*}}}*/
// Include Files							/*{{{*/
#include <config.h>

#include <repo-pkg/configuration.h>
#include <repo-pkg/error.h>
#include <repo-pkg/repoconfiguration.h>

#include <algorithm>
#include <limits>
#include <string>
#include <vector>

#include <repoi18n.h>
									/*}}}*/
namespace REPO {
// getArchitectures - Return Vector of supported Architectures		/*{{{*/
std::vector<std::string> const Configuration::getArchitectures() {
	std::vector<std::string> archs;
	for (auto const &a : _config->FindVector("Repo::Architectures", "all,arm,aarch64"))
	{
		if (a.empty() == true || std::find(archs.begin(), archs.end(), a) != archs.end())
			continue;
		archs.push_back(a);
	}
	return archs;
}
									/*}}}*/
// getCompressors - Return Vector of usable compressors			/*{{{*/
// ---------------------------------------------------------------------
/* Only compressors backed by a library we are linked against are
   listed, FileFd handles them in-process. */
std::vector<Configuration::Compressor>
const Configuration::getCompressors(bool const Cached) {
	static std::vector<Configuration::Compressor> compressors;
	if (compressors.empty() == false) {
		if (Cached == true)
			return compressors;
		compressors.clear();
	}

	compressors.emplace_back(".", "", 0);
#ifdef HAVE_ZLIB
	compressors.emplace_back("gzip", ".gz", 100);
#endif
#ifdef HAVE_LZMA
	compressors.emplace_back("xz", ".xz", 200);
#endif
#ifdef HAVE_BZ2
	compressors.emplace_back("bzip2", ".bz2", 300);
#endif
#ifdef HAVE_LZMA
	compressors.emplace_back("lzma", ".lzma", 400);
#endif
	std::stable_sort(compressors.begin() + 1, compressors.end(),
			 [](Compressor const &a, Compressor const &b) { return a.Cost < b.Cost; });
	return compressors;
}
									/*}}}*/
// getCompressorExtensions - supported data.tar extensions		/*{{{*/
std::vector<std::string> const Configuration::getCompressorExtensions() {
	std::vector<std::string> ext;
	for (auto const &c : getCompressors())
		if (c.Extension.empty() == false)
			ext.push_back(c.Extension);
	return ext;
}
									/*}}}*/
// findCompressor - lookup by name					/*{{{*/
bool Configuration::findCompressor(std::string const &Name, Compressor &Found) {
	for (auto const &c : getCompressors())
	{
		if (c.Name != Name)
			continue;
		Found = c;
		return true;
	}
	return _error->Error(_("Compressor %s is not supported by this build"), Name.c_str());
}
									/*}}}*/
// Compressor constructor						/*{{{*/
// ---------------------------------------------------------------------
/* Repo::Compressor::<name>::Cost allows to reorder the list */
Configuration::Compressor::Compressor(char const *name, char const *extension,
				      unsigned short const cost) {
	std::string const config = std::string("Repo::Compressor::").append(name).append("::");
	Name = name;
	Extension = extension;
	Cost = _config->FindI(std::string(config).append("Cost"), cost);
}
									/*}}}*/
}
