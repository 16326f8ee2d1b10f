//
// dispatch.cc - jobfan script submission
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

#include <sstream>
#include <string>

#include "dispatch.hh"
#include "file_util.hh"

using std::string;
using std::ostringstream;

Dispatcher::Dispatcher (const RunInvocation& run, BatchSystem& batch,
			Logger& log):
    run_(run),
    batch_(batch),
    log_(log)
{
}

// return true if the record was submitted, false for a dry run
bool
Dispatcher::dispatch (const JobRecord& record)
{
    return dispatch(record.stem(), record.script(), record.stdoutLog(),
		    record.stderrLog());
}

bool
Dispatcher::dispatchArray ()
{
    ostringstream name;
    name << run_.arrayName() << "[1-" << run_.lastIndex() << "]";
    return dispatch(name.str(), run_.arrayScript(), run_.arrayStdoutLog(),
		    run_.arrayStderrLog());
}

// log redirection goes ahead of the script for managers that take it on
// the command line, since they stop parsing options at the command;
// bsub only honours embedded directives in a script read from stdin
string
Dispatcher::commandLine (const string& script, const string& stdoutLog,
			 const string& stderrLog) const
{
    ostringstream cmd;
    cmd << run_.submitCommand();
    if (run_.profile().logsOnCommandLine()) {
	cmd << " -o " << shellQuote(stdoutLog)
	    << " -e " << shellQuote(stderrLog);
    }
    if (run_.profile().scriptOnStdin()) {
	cmd << " <";
    }
    cmd << " " << shellQuote(script);
    return cmd.str();
}

bool
Dispatcher::dispatch (const string& name, const string& script,
		      const string& stdoutLog, const string& stderrLog)
{
    string cmd(commandLine(script, stdoutLog, stderrLog));
    if (run_.options().dryRun_) {
	log_.log(Logger::LogInfo, "dry run, not submitting " + name + ": " +
		 cmd);
	return false;
    }
    log_.log(Logger::LogVerbose, "running " + cmd);
    batch_.submit(cmd);
    log_.log(Logger::LogInfo, "submitted " + name);
    return true;
}
