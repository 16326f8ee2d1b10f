//
// batch.cc - jobfan batch system interface
//
// Copyright(c) 2008-2012 The Board of Trustees of The Leland Stanford
// Junior University.  All Rights Reserved.
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are
// met:
// 
//     * Redistributions of source code must retain the above copyright
//       notice, this list of conditions and the following disclaimer.
// 
//     * Redistributions in binary form must reproduce the above
//       copyright notice, this list of conditions and the following
//       disclaimer in the documentation and/or other materials provided
//       with the distribution.
// 
//     * Neither the name of Stanford University nor the names of its
//       contributors may be used to endorse or promote products derived
//       from this software without specific prior written permission.
// 
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS
// "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT
// LIMITED TO, THE IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR
// A PARTICULAR PURPOSE ARE DISCLAIMED. IN NO EVENT SHALL STANFORD
// UNIVERSITY BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL,
// EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO,
// PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR
// PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF
// LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING
// NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
// SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
//

static char const rcsid[] = "$Id$";

#include <iostream>
#include <sstream>
#include <string>

extern "C" {
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <sys/types.h>
#include <sys/wait.h>
}

#include "batch.hh"
#include "errors.hh"

using std::string;
using std::ostringstream;
using std::cout;
using std::cerr;
using std::flush;

ShellBatchSystem::ShellBatchSystem ()
{
}

void
ShellBatchSystem::submit (const string& commandLine)
{
    // keep buffered output from appearing twice
    cout << flush;
    cerr << flush;

    pid_t pid = fork();
    if (pid < 0) {
	ostringstream err;
	err << "cannot run " << commandLine << ": fork failed: "
	    << strerror(errno);
	throw SubmitCommandFailure(err.str());
    }
    if (pid == 0) {
	// child process only
	execl("/bin/sh", "sh", "-c", commandLine.c_str(), (char *)0);
	_exit(127);
    }

    int status = 0;
    while (waitpid(pid, &status, 0) < 0) {
	if (errno != EINTR) {
	    ostringstream err;
	    err << "cannot wait for " << commandLine << ": "
		<< strerror(errno);
	    throw SubmitCommandFailure(err.str());
	}
    }
    if (WIFEXITED(status)) {
	if (WEXITSTATUS(status) != 0) {
	    ostringstream err;
	    err << "submit command failed with exit status "
		<< WEXITSTATUS(status) << ": " << commandLine;
	    throw SubmitCommandFailure(err.str());
	}
    } else if (WIFSIGNALED(status)) {
	ostringstream err;
	err << "submit command killed by signal " << WTERMSIG(status)
	    << ": " << commandLine;
	throw SubmitCommandFailure(err.str());
    } else {
	throw SubmitCommandFailure("submit command did not exit: " +
				   commandLine);
    }
}

StubBatchSystem::StubBatchSystem ()
{
}

void
StubBatchSystem::submit (const string& commandLine)
{
    commands_.push_back(commandLine);
    for (CommandList::const_iterator iter = failPatterns_.begin();
	 iter != failPatterns_.end(); ++iter) {
	if (commandLine.find(*iter) != string::npos) {
	    throw SubmitCommandFailure("stub submission failed: " +
				       commandLine);
	}
    }
}

// make every later submission whose command line contains pattern fail
void
StubBatchSystem::failOn (const string& pattern)
{
    failPatterns_.push_back(pattern);
}
