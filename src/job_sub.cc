//
// job_sub.cc - jobfan batch generation and submission
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
#include <stdexcept>
#include <string>

#include "job_sub.hh"
#include "file_util.hh"
#include "history.hh"

using std::ostream;
using std::ostringstream;
using std::runtime_error;
using std::string;
using std::flush;

JobSubmitter::JobSubmitter (Logger& log):
    log_(log),
    generatedCnt_(0),
    skippedCnt_(0),
    submittedCnt_(0),
    failedCnt_(0)
{
}

// generate and submit the scripts for every record that has not yet
// succeeded; return true if nothing failed
bool
JobSubmitter::submit (const RunInvocation& run, BatchSystem& batch)
{
    reset();
    try {
	ScriptWriter writer(run);
	CompletionTracker tracker(log_);
	Dispatcher dispatcher(run, batch, log_);
	initFiles(run);

	for (RunInvocation::RecordList::const_iterator iter =
		 run.records().begin();
	     iter != run.records().end(); ++iter) {
	    processRecord(run, *iter, tracker, writer, dispatcher);
	}
	processArray(run, writer, dispatcher);
    } catch (const runtime_error& err) {
	log_.log(Logger::LogError, err.what());
	return false;
    }

    logResults(run);
    return failedCnt_ == 0;
}

void
JobSubmitter::reset ()
{
    generatedCnt_ = 0;
    skippedCnt_ = 0;
    submittedCnt_ = 0;
    failedCnt_ = 0;
    failedJobs_.clear();
}

void
JobSubmitter::initFiles (const RunInvocation& run)
{
    makeDirs(run.outputDir());
    makeDirs(run.scriptDir());
    makeDirs(run.logDir());

    HistoryRecorder history(run.historyFile(), log_);
    history.record(run.options().commandLine_);
}

void
JobSubmitter::processRecord (const RunInvocation& run,
			     const JobRecord& record,
			     CompletionTracker& tracker, ScriptWriter& writer,
			     Dispatcher& dispatcher)
{
    if (!tracker.mustRun(record)) {
	++skippedCnt_;
	log_.log(Logger::LogVerbose, "skipping " + record.stem() +
		 ", already complete");
	// an array task must not find a script left by an earlier run
	if (run.options().array_) {
	    removeStaleScript(record.script());
	}
	return;
    }

    try {
	if (run.options().destIsDir_) {
	    makeDirs(record.output());
	}
	writer.writeJob(record);
	++generatedCnt_;
	log_.log(Logger::LogVerbose, "wrote " + record.script() + " for " +
		 record.stem());
	if (!run.options().array_ && dispatcher.dispatch(record)) {
	    ++submittedCnt_;
	}
    } catch (const runtime_error& err) {
	recordFailure(record.stem(), err.what());
	if (run.options().array_) {
	    removeStaleScript(record.script());
	}
    }
}

void
JobSubmitter::processArray (const RunInvocation& run, ScriptWriter& writer,
			    Dispatcher& dispatcher)
{
    if (!run.options().array_ || run.lastIndex() == 0) {
	return;
    }
    if (generatedCnt_ == 0) {
	log_.log(Logger::LogInfo, "no records need to run, not submitting "
		 "task array");
	return;
    }
    try {
	writer.writeArray(run.lastIndex());
	++generatedCnt_;
	if (dispatcher.dispatchArray()) {
	    ++submittedCnt_;
	}
    } catch (const runtime_error& err) {
	recordFailure(run.arrayName() + " (task array)", err.what());
    }
}

void
JobSubmitter::removeStaleScript (const string& script)
{
    try {
	removeFile(script);
    } catch (const runtime_error& err) {
	log_.log(Logger::LogWarning, err.what());
    }
}

void
JobSubmitter::recordFailure (const string& name, const string& msg)
{
    log_.log(Logger::LogError, name + ": " + msg);
    ++failedCnt_;
    failedJobs_.push_back(name);
}

void
JobSubmitter::collectStatus (ostream& msg, unsigned recordCnt)
{
    msg << recordCnt << (recordCnt == 1 ? " record: " : " records: ")
	<< generatedCnt_ << " generated, "
	<< skippedCnt_ << " skipped, "
	<< submittedCnt_ << " submitted, "
	<< failedCnt_ << " failed";
}

void
JobSubmitter::logResults (const RunInvocation& run)
{
    if (!failedJobs_.empty()) {
	ostream& os = log_.stream();
	os << "\nFailed jobs:\n";
	for (NameList::const_iterator iter = failedJobs_.begin();
	     iter != failedJobs_.end(); ++iter) {
	    os << *iter << '\n';
	}
	os << "\nTo retry the failed jobs, rerun jobfan with the same "
	   << "arguments.\n\n" << flush;
    }

    ostringstream msg;
    collectStatus(msg, run.records().size());
    if (run.options().dryRun_) {
	msg << " (dry run)";
    }
    log_.log(Logger::LogAlways, msg.str());
}
