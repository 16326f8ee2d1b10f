//
// run.cc - jobfan run configuration
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
#include <fstream>
#include <sstream>
#include <string>
#include <map>

#include "run.hh"
#include "errors.hh"
#include "file_util.hh"

using std::istream;
using std::ifstream;
using std::ostringstream;
using std::string;
using std::map;

const char* const RunInvocation::defaultArrayName = "jobfan";
const char* const RunInvocation::historyFilename = "jobfan.history";

RunOptions::RunOptions ():
    destIsDir_(false),
    array_(false),
    dryRun_(false),
    inheritEnv_(true)
{
}

RunInvocation::RunInvocation (const RunOptions& options):
    options_(options),
    profile_(0),
    lastIndex_(0)
{
    configure();
    if (options_.listFile_ == "-") {
	load(std::cin);
    } else {
	ifstream ifs(options_.listFile_.c_str());
	if (!ifs) {
	    throw ConfigError("cannot open input list " + options_.listFile_);
	}
	load(ifs);
    }
}

RunInvocation::RunInvocation (const RunOptions& options, istream& list):
    options_(options),
    profile_(0),
    lastIndex_(0)
{
    configure();
    load(list);
}

// validate the options and resolve everything derived from them;
// nothing is written to disk here
void
RunInvocation::configure ()
{
    profile_ = &SchedulerProfile::resolve(options_.manager_);

    if (options_.listFile_.empty()) {
	throw MissingRequiredArgument("listfile");
    }
    if (options_.command_.empty()) {
	throw MissingRequiredArgument("--command");
    }
    if (options_.outputDir_.empty()) {
	throw MissingRequiredArgument("--outdir");
    }
    if (options_.array_ && !profile_->supportsArrays()) {
	throw ArrayUnsupportedByManager(profile_->name());
    }

    if (options_.workDir_.empty()) {
	workDir_ = currentDirectory();
    } else {
	workDir_ = absolutePath(options_.workDir_, currentDirectory());
    }
    outputDir_ = absolutePath(options_.outputDir_, workDir_);
    if (options_.scriptDir_.empty()) {
	scriptDir_ = joinPath(outputDir_, "scripts");
    } else {
	scriptDir_ = absolutePath(options_.scriptDir_, workDir_);
    }
    if (options_.logDir_.empty()) {
	logDir_ = joinPath(outputDir_, "logs");
    } else {
	logDir_ = absolutePath(options_.logDir_, workDir_);
    }
    // directive values are split on whitespace and cannot be quoted
    if (!profile_->logsOnCommandLine() &&
	logDir_.find_first_of(" \t\n\r") != string::npos) {
	throw ConfigError("log directory " + logDir_ + " contains whitespace, "
			  "which " + profile_->name() + " directives cannot "
			  "express");
    }

    if (options_.submitCommand_.empty()) {
	submitCommand_ = profile_->submitCommand();
    } else {
	submitCommand_ = options_.submitCommand_;
    }

    if (options_.listFile_ == "-") {
	arrayName_ = defaultArrayName;
    } else {
	arrayName_ = JobListParser::jobName(
	    stripExtension(baseName(options_.listFile_)));
	if (arrayName_.empty()) {
	    arrayName_ = defaultArrayName;
	}
    }
    arrayScript_ = joinPath(scriptDir_, "array.sh");
}

void
RunInvocation::load (istream& list)
{
    JobListParser parser(outputDir_, options_.extension_,
			 options_.destIsDir_, scriptDir_, logDir_);
    parser.parse(list, records_);
    lastIndex_ = parser.lastIndex();
    checkCollisions();
}

// every path a record writes must belong to that record alone, or one
// record's success could hide another's failure
void
RunInvocation::checkCollisions () const
{
    PathOwners owners;
    for (RecordList::const_iterator iter = records_.begin();
	 iter != records_.end(); ++iter) {
	claimPath(owners, iter->output(), *iter);
	claimPath(owners, iter->marker(), *iter);
	claimPath(owners, iter->stdoutLog(), *iter);
	claimPath(owners, iter->stderrLog(), *iter);
    }
}

void
RunInvocation::claimPath (PathOwners& owners, const string& path,
			  const JobRecord& record)
{
    PathOwners::iterator found = owners.find(path);
    if (found != owners.end()) {
	ostringstream err;
	err << "inputs " << found->second->input() << " (record "
	    << found->second->index() << ") and " << record.input()
	    << " (record " << record.index() << ") both write " << path;
	throw DuplicateOutput(err.str());
    }
    owners[path] = &record;
}

string
RunInvocation::arrayStdoutLog () const
{
    return joinPath(logDir_, arrayName_ + ".array.out");
}

string
RunInvocation::arrayStderrLog () const
{
    return joinPath(logDir_, arrayName_ + ".array.err");
}

string
RunInvocation::historyFile () const
{
    return joinPath(scriptDir_, historyFilename);
}
