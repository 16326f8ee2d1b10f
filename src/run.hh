//
// run.hh - jobfan run configuration
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

#ifndef RUN_H
#define RUN_H

#include <iostream>
#include <map>
#include <string>
#include <vector>

#include "job_list.hh"
#include "scheduler.hh"

// options for one invocation, as supplied by the command line
class RunOptions {
public:
    std::string manager_;	// resource manager name
    std::string listFile_;	// input list file ("-" for stdin)
    std::string command_;	// payload command
    std::string outputDir_;	// output directory
    std::string extension_;	// output file extension
    bool destIsDir_;		// each output is a directory
    bool array_;		// submit a single task array
    bool dryRun_;		// generate scripts without submitting
    std::string submitCommand_;	// submit command (empty for the default)
    std::string schedOptions_;	// extra scheduler options
    std::string prefix_;	// command prepended to the payload
    std::string scriptDir_;	// script directory (empty for the default)
    std::string logDir_;	// log directory (empty for the default)
    std::string moduleFile_;	// environment module statements
    bool inheritEnv_;		// export the submitter's environment
    std::string workDir_;	// directory the jobs run in
    std::string commandLine_;	// command line for the history file

    RunOptions();
};

// an immutable description of everything one run will do
class RunInvocation {
public:
    typedef std::vector<JobRecord> RecordList;

    static const char* const defaultArrayName;
    static const char* const historyFilename;

    explicit RunInvocation(const RunOptions& options);
    RunInvocation(const RunOptions& options, std::istream& list);

    const RunOptions& options() const { return options_; }
    const SchedulerProfile& profile() const { return *profile_; }
    const RecordList& records() const { return records_; }
    unsigned lastIndex() const { return lastIndex_; }
    const std::string& workDir() const { return workDir_; }
    const std::string& outputDir() const { return outputDir_; }
    const std::string& scriptDir() const { return scriptDir_; }
    const std::string& logDir() const { return logDir_; }
    const std::string& submitCommand() const { return submitCommand_; }
    const std::string& arrayName() const { return arrayName_; }
    const std::string& arrayScript() const { return arrayScript_; }
    std::string arrayStdoutLog() const;
    std::string arrayStderrLog() const;
    std::string historyFile() const;

private:
    RunOptions options_;
    const SchedulerProfile* profile_;
    RecordList records_;
    unsigned lastIndex_;
    std::string workDir_;
    std::string outputDir_;
    std::string scriptDir_;
    std::string logDir_;
    std::string submitCommand_;
    std::string arrayName_;
    std::string arrayScript_;

    void configure();
    void load(std::istream& list);
    typedef std::map<std::string,const JobRecord*> PathOwners;

    void checkCollisions() const;
    static void claimPath(PathOwners& owners, const std::string& path,
			  const JobRecord& record);
};

#endif // RUN_H
