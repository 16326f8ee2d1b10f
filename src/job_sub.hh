//
// job_sub.hh - jobfan batch generation and submission
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
// $Id$
//

#ifndef JOB_SUB_H
#define JOB_SUB_H

#include <iostream>
#include <string>
#include <vector>

#include "batch.hh"
#include "dispatch.hh"
#include "job_list.hh"
#include "log.hh"
#include "marker.hh"
#include "run.hh"
#include "script.hh"

class JobSubmitter {
public:
    typedef std::vector<std::string> NameList;

    explicit JobSubmitter(Logger& log);
    bool submit(const RunInvocation& run, BatchSystem& batch);
    unsigned generatedCount() const { return generatedCnt_; }
    unsigned skippedCount() const { return skippedCnt_; }
    unsigned submittedCount() const { return submittedCnt_; }
    unsigned failedCount() const { return failedCnt_; }
    const NameList& failedJobs() const { return failedJobs_; }

private:
    Logger& log_;
    unsigned generatedCnt_;	// scripts written
    unsigned skippedCnt_;	// records already complete
    unsigned submittedCnt_;	// successful submissions
    unsigned failedCnt_;	// records not written or not submitted
    NameList failedJobs_;

    void reset();
    void initFiles(const RunInvocation& run);
    void processRecord(const RunInvocation& run, const JobRecord& record,
		       CompletionTracker& tracker, ScriptWriter& writer,
		       Dispatcher& dispatcher);
    void processArray(const RunInvocation& run, ScriptWriter& writer,
		      Dispatcher& dispatcher);
    void removeStaleScript(const std::string& script);
    void recordFailure(const std::string& name, const std::string& msg);
    void collectStatus(std::ostream& msg, unsigned recordCnt);
    void logResults(const RunInvocation& run);
};

#endif // JOB_SUB_H
