// -*- mode: cpp; mode: fold -*-
// Description								/*{{{*/
/* ######################################################################

   Build - run all passes of a repository build

   ##################################################################### */
									/*}}}*/
#ifndef BUILD_H
#define BUILD_H

class PackageInspector;
class RepoBuildContext;

/** \brief tree, Packages, Release and (with Repo::Sign) the signature
 *
 *  Signing failures are reported as warnings only. */
bool BuildRepository(RepoBuildContext &Context, PackageInspector &Inspector);

#endif
