// -*- mode: cpp; mode: fold -*-
// SPDX-License-Identifier: GPL-2.0+
// Description								/*{{{*/
/* ######################################################################

   Global Error Class - messages of a repository build

   A single instance collects every error, warning and notice raised
   while building a repository. Functions report a failure by adding a
   message here and returning false, so the caller can unwind and the
   front end prints the whole account at the end:

     if (open(..) == -1)
        return _error->Errno("open", _("Could not open file %s"), Name);

   Messages are kept in the order they were added. A warning does not
   make PendingError() true.

   ##################################################################### */
									/*}}}*/
#ifndef REPO_ERROR_H
#define REPO_ERROR_H

#include <repo-pkg/macros.h>

#include <deque>
#include <iostream>
#include <string>
#include <vector>

#include <cstdarg>

class REPO_PUBLIC GlobalError						/*{{{*/
{
public:
	enum MsgType {
		FATAL = 40,
		/** \brief the run can not produce a correct result */
		ERROR = 30,
		/** \brief a problem the run continues after */
		WARNING = 20,
		/** \brief informational, e.g. a fallback was used */
		NOTICE = 10,
		DEBUG = 0
	};

	/** \brief add an error message with the text of errno
	 *
	 *  \param Function name of the failed system call
	 *  \param Description format string for the error message
	 *  \return \b false
	 */
	bool Errno(const char *Function,const char *Description,...) REPO_PRINTF(3) REPO_COLD;
	/** \brief like Errno, but only a warning */
	bool WarningE(const char *Function,const char *Description,...) REPO_PRINTF(3) REPO_COLD;

	/** \brief add an error message
	 *
	 *  \return \b false
	 */
	bool Error(const char *Description,...) REPO_PRINTF(2) REPO_COLD;
	bool Warning(const char *Description,...) REPO_PRINTF(2) REPO_COLD;
	bool Notice(const char *Description,...) REPO_PRINTF(2) REPO_COLD;

	/** \brief add a message for a printf-like caller
	 *
	 *  args is started and ended by the caller.
	 */
	bool Insert(MsgType type, const char* Description, va_list &args) REPO_COLD;
	/** \brief add a message with the text of errsv for a printf-like caller */
	bool InsertErrno(MsgType type, const char* Function,
			 const char* Description, va_list &args,
			 int const errsv) REPO_COLD;

	/** \brief is an error (not a warning) in the list? */
	bool PendingError() const REPO_PURE;

	/** \brief is the list free of messages of at least this severity?
	 *
	 *  A pending error always makes the list non-empty.
	 */
	bool empty(MsgType const &threshold = WARNING) const REPO_PURE;

	/** \brief remove the oldest message from the list
	 *
	 *  \param[out] Text message text
	 *  \return \b true if the message was an error
	 */
	bool PopMessage(std::string &Text);

	void Discard();

	/** \brief print the messages of at least threshold and clear the list
	 *
	 *  Each line is prefixed with E:, W:, N: or D:, continuation lines of
	 *  a message are indented below it.
	 *  \param mergeStack print the messages put aside by PushToStack first
	 */
	void DumpErrors(std::ostream &out, MsgType const &threshold = WARNING,
			bool const &mergeStack = true);
	void DumpErrors(MsgType const &threshold) {
		DumpErrors(std::cerr, threshold);
	}

	/** \brief put the current messages aside
	 *
	 *  What is added afterwards can be dropped with RevertToStack or
	 *  appended to the put aside messages with MergeWithStack.
	 */
	void PushToStack();
	void RevertToStack();
	void MergeWithStack();

private:
	struct Item {
		MsgType Type;
		std::string Text;
	};
	REPO_HIDDEN friend std::ostream &operator<<(std::ostream &out, Item const &i);

	std::deque<Item> Messages;
	std::vector<std::deque<Item>> Stacks;

	REPO_HIDDEN bool Append(MsgType type, std::string Text);
};
									/*}}}*/

// The 'extra-ansi' syntax is used to help with collisions.
REPO_PUBLIC GlobalError *_GetErrorObj();
static struct {
	inline GlobalError* operator ->() { return _GetErrorObj(); }
} _error REPO_UNUSED;

#endif
