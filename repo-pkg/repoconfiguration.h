// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/** \class REPO::Configuration
 *  \brief Provide access methods to various configuration settings
 *
 *  This class and their methods providing a layer around the usual access
 *  methods with _config to ensure that settings are correct and to be able
 *  to set defaults without the need to recheck it in every method again.
 */
									/*}}}*/
#ifndef REPO_CONFIGURATION_H_
#define REPO_CONFIGURATION_H_
// Include Files							/*{{{*/
#include <repo-pkg/macros.h>

#include <limits>
#include <string>
#include <vector>
									/*}}}*/
namespace REPO {
namespace Configuration {						/*{{{*/
	/** \brief Returns the architectures packages may be built for
	 *
	 *  The list comes from Repo::Architectures and keeps its order.
	 *  Empty entries are dropped, duplicates are only reported once.
	 *
	 *  \return a vector of the supported architectures
	 */
	REPO_PUBLIC std::vector<std::string> const getArchitectures();

	/** \brief Representation of supported compressors */
	struct Compressor {
		std::string Name;
		std::string Extension;
		unsigned short Cost;

		Compressor(char const *name, char const *extension, unsigned short const cost);
		Compressor() : Cost(std::numeric_limits<unsigned short>::max()) {};
	};

	/** \brief Return a vector of the compressors this build can handle
	 *
	 *  The first entry is always the "." compressor standing for
	 *  uncompressed data. The others are ordered by cost, cheapest first.
	 *
	 *  \param Cached saves the result so we need to calculated it only once
	 *                this parameter should only be used for testing purposes.
	 *
	 *  \return a vector of Compressors
	 */
	REPO_PUBLIC std::vector<Compressor> const getCompressors(bool const Cached = true);

	/** \brief Return a vector of extensions supported for data.tar's */
	REPO_PUBLIC std::vector<std::string> const getCompressorExtensions();

	/** \brief Find a compressor by its name
	 *
	 *  \param Name like "xz" or "."
	 *  \param[out] Found the matching compressor
	 *  \return \b false (with an error) if no such compressor is built in
	 */
	REPO_PUBLIC bool findCompressor(std::string const &Name, Compressor &Found);
									/*}}}*/
}
									/*}}}*/
}
#endif
