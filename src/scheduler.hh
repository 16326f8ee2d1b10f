//
// scheduler.hh - jobfan resource manager profiles
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

#ifndef SCHEDULER_H
#define SCHEDULER_H

#include <string>

// directive syntax and run-time variables of one resource manager
class SchedulerProfile {
public:
    typedef enum {
	Sge = 0,
	Pbs,
	Lsf,
	Slurm,
	NumManagers
    } Manager;

    SchedulerProfile(Manager manager, const char* name,
		     const char* directive, const char* jobNameFlag,
		     const char* arrayFlag, const char* envFlag,
		     const char* jobIdToken, const char* jobNameToken,
		     const char* taskIndexToken, const char* submitCommand,
		     bool logsOnCommandLine, bool scriptOnStdin);

    Manager manager() const { return manager_; }
    const std::string& name() const { return name_; }
    const std::string& directive() const { return directive_; }
    const std::string& jobNameFlag() const { return jobNameFlag_; }
    const std::string& arrayFlag() const { return arrayFlag_; }
    bool supportsArrays() const { return !arrayFlag_.empty(); }
    const std::string& envFlag() const { return envFlag_; }
    const std::string& jobIdToken() const { return jobIdToken_; }
    const std::string& jobNameToken() const { return jobNameToken_; }
    const std::string& taskIndexToken() const { return taskIndexToken_; }
    const std::string& submitCommand() const { return submitCommand_; }
    bool logsOnCommandLine() const { return logsOnCommandLine_; }
    bool scriptOnStdin() const { return scriptOnStdin_; }

    static Manager parseManager(const std::string& name);
    static const SchedulerProfile& resolve(Manager manager);
    static const SchedulerProfile& resolve(const std::string& name);

private:
    Manager manager_;		// manager identity
    std::string name_;		// canonical manager name
    std::string directive_;	// prefix of directive lines in scripts
    std::string jobNameFlag_;	// sets the job name
    std::string arrayFlag_;	// declares a task array (empty if none)
    std::string envFlag_;	// exports the submitter's environment
    std::string jobIdToken_;	// job id variable at run time
    std::string jobNameToken_;	// job name variable at run time
    std::string taskIndexToken_; // array task index variable at run time
    std::string submitCommand_;	// default submit command
    bool logsOnCommandLine_;	// stdout/stderr paths go on the submit
				// command line instead of into directives
    bool scriptOnStdin_;	// directives are only read from a script
				// given on standard input
};

#endif // SCHEDULER_H
