//
// jobfan.cc - turn an input list into one cluster job per input
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
#include <string>
#include <cstdlib>
#include <stdexcept>

#include <tclap/CmdLine.h>

#include "config.h"
#include "errors.hh"
#include "file_util.hh"
#include "job_sub.hh"
#include "log.hh"
#include "run.hh"

using std::cerr;
using std::endl;
using std::string;

// class for storing command-line options
class Options {
public:
    RunOptions run_;		// options describing the run
    string logLevel_;		// log level

    void parseArgs(int argc, char **argv);
};

namespace {
    // the manager used when none is given on the command line
    string
    DefaultManager ()
    {
	char *manager = getenv("JOBFAN_MANAGER");
	if (manager != 0 && *manager != '\0') {
	    return manager;
	}
	return JOBFAN_DEFAULT_MANAGER;
    }

    string
    CommandLine (int argc, char **argv)
    {
	string line;
	for (int idx = 0; idx < argc; ++idx) {
	    if (idx > 0) {
		line += ' ';
	    }
	    line += shellQuote(argv[idx]);
	}
	return line;
    }
}

// parse the command-line options
void
Options::parseArgs (int argc, char **argv)
{
    try {
	using TCLAP::CmdLine;
	using TCLAP::SwitchArg;
	using TCLAP::ValueArg;
	using TCLAP::UnlabeledValueArg;

	CmdLine cmd("generate and submit one cluster job per input file",
		    ' ', JOBFAN_VERSION);
	ValueArg<string> command("c", "command", "payload command; the "
				 "input and output paths are appended unless "
				 "it contains {input} or {output}",
				 true, "", "command", cmd);
	ValueArg<string> outputDir("o", "outdir", "output directory",
				   true, "", "directory", cmd);
	ValueArg<string> manager("m", "manager", "resource manager",
				 false, DefaultManager(),
				 "sge|pbs|lsf|slurm", cmd);
	ValueArg<string> extension("e", "extension", "output file extension",
				   false, "", "extension", cmd);
	SwitchArg destIsDir("d", "dest_dir", "each output is a directory",
			    cmd, false);
	SwitchArg array("a", "array", "submit a single task array", cmd,
			false);
	SwitchArg dryRun("n", "dry_run", "write scripts without submitting",
			 cmd, false);
	ValueArg<string> submitCommand("s", "submit", "submit command",
				       false, "", "command", cmd);
	ValueArg<string> schedOptions("", "sched_options",
				      "extra scheduler options",
				      false, "", "options", cmd);
	ValueArg<string> prefix("p", "prefix", "command run in front of the "
				"payload", false, "", "command", cmd);
	ValueArg<string> scriptDir("", "script_dir", "script directory",
				   false, "", "directory", cmd);
	ValueArg<string> logDir("", "log_dir", "scheduler log directory",
				false, "", "directory", cmd);
	ValueArg<string> moduleFile("", "modules", "file of environment "
				    "module statements",
				    false, "", "filename", cmd);
	SwitchArg noEnv("", "no_env", "do not export the current environment",
			cmd, false);
	ValueArg<string> logLevel("", "log_level", "log level",
				  false, "", "verbose|info|warning|error",
				  cmd);
	UnlabeledValueArg<string> listFile("listfile", "input list, one path "
					   "per line (- for stdin)",
					   true, "", "filename", cmd);

	cmd.parse(argc, argv);
	run_.manager_ = manager.getValue();
	run_.listFile_ = listFile.getValue();
	run_.command_ = command.getValue();
	run_.outputDir_ = outputDir.getValue();
	run_.extension_ = extension.getValue();
	run_.destIsDir_ = destIsDir.getValue();
	run_.array_ = array.getValue();
	run_.dryRun_ = dryRun.getValue();
	run_.submitCommand_ = submitCommand.getValue();
	run_.schedOptions_ = schedOptions.getValue();
	run_.prefix_ = prefix.getValue();
	run_.scriptDir_ = scriptDir.getValue();
	run_.logDir_ = logDir.getValue();
	run_.moduleFile_ = moduleFile.getValue();
	run_.inheritEnv_ = !noEnv.getValue();
	run_.commandLine_ = CommandLine(argc, argv);
	logLevel_ = logLevel.getValue();
    } catch (TCLAP::ArgException &e) {
	cerr << "jobfan: " << e.error() << " for arg " << e.argId() << endl;
	exit(1);
    }
}

int
main (int argc, char **argv)
{
    // parse command-line options
    Options options;
    options.parseArgs(argc, argv);

    Logger log;
    if (!options.logLevel_.empty()) {
	Logger::LogLevel level;
	if (Logger::parseLevel(options.logLevel_, level)) {
	    log.setLevel(level);
	} else {
	    cerr << "jobfan: unknown log level " << options.logLevel_ << endl;
	}
    }

    try {
	RunInvocation run(options.run_);
	ShellBatchSystem batch;
	JobSubmitter submitter(log);
	if (!submitter.submit(run, batch)) {
	    exit(1);
	}
    } catch (const std::runtime_error& err) {
	cerr << "jobfan: " << err.what() << endl;
	exit(1);
    }
    exit(0);
}
