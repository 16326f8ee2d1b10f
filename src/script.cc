//
// script.cc - jobfan job script generation
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
#include <stdexcept>
#include <string>

#include <boost/algorithm/string.hpp>

#include "script.hh"
#include "errors.hh"
#include "file_util.hh"

using std::string;
using std::ostream;
using std::ifstream;
using std::ostringstream;
using std::runtime_error;

using boost::regex;
using boost::smatch;
using boost::regex_match;

// dotkit "use" fails if the kit is already loaded; "reuse" does not
const regex ScriptWriter::useRE("(\\s*)use(\\s.*)?");

ScriptWriter::ScriptWriter (const RunInvocation& run):
    run_(run),
    profile_(run.profile())
{
    if (!run.options().moduleFile_.empty()) {
	loadModules(run.options().moduleFile_);
    }
}

void
ScriptWriter::loadModules (const string& moduleFile)
{
    ifstream ifs(moduleFile.c_str());
    if (!ifs) {
	throw ConfigError("cannot open module file " + moduleFile);
    }
    string line;
    while (getline(ifs, line)) {
	if (!line.empty() && line[line.size() - 1] == '\r') {
	    line.erase(line.size() - 1);
	}
	modules_.push_back(rewriteModuleLine(line));
    }
}

string
ScriptWriter::rewriteModuleLine (const string& line)
{
    smatch matches;
    if (!regex_match(line, matches, useRE)) {
	return line;
    }
    string indent(matches[1].first, matches[1].second);
    string rest(matches[2].first, matches[2].second);
    return indent + "reuse" + rest;
}

// the payload command line with the record's input and output paths
string
ScriptWriter::payload (const JobRecord& record) const
{
    string command(run_.options().command_);
    bool substituted = false;
    if (boost::contains(command, "{input}")) {
	boost::replace_all(command, "{input}", shellQuote(record.input()));
	substituted = true;
    }
    if (boost::contains(command, "{output}")) {
	boost::replace_all(command, "{output}", shellQuote(record.output()));
	substituted = true;
    }
    if (!substituted) {
	command += " " + shellQuote(record.input()) + " " +
	    shellQuote(record.output());
    }
    if (!run_.options().prefix_.empty()) {
	command = run_.options().prefix_ + " " + command;
    }
    return command;
}

void
ScriptWriter::renderJob (const JobRecord& record, ostream& os) const
{
    renderHeader(os, record.jobName(), record.stdoutLog(),
		 record.stderrLog(), 0);
    for (ModuleList::const_iterator iter = modules_.begin();
	 iter != modules_.end(); ++iter) {
	os << *iter << '\n';
    }
    os << "set -o errexit -o nounset -o pipefail\n";

    // the record may have finished since this script was queued
    os << "marker=" << shellQuote(record.marker()) << '\n';
    os << "if [ -f \"$marker\" ] && "
       << "[ \"$(tr -d '[:space:]' < \"$marker\")\" = 0 ]; then\n";
    os << "    echo "
       << shellQuote("jobfan: " + record.stem() + " already complete")
       << " >&2\n";
    os << "    exit 0\n";
    os << "fi\n";

    os << "cd " << shellQuote(run_.workDir()) << '\n';
    os << "if " << payload(record) << "; then\n";
    os << "    status=0\n";
    os << "else\n";
    os << "    status=$?\n";
    os << "fi\n";
    os << "echo \"$status\" > \"$marker\"\n";
    os << "exit \"$status\"\n";
}

// one script that the manager runs once per array task; each task runs
// the record script named by its task index
void
ScriptWriter::renderArray (unsigned lastIndex, ostream& os) const
{
    if (!profile_.supportsArrays()) {
	throw ArrayUnsupportedByManager(profile_.name());
    }
    const string& task = profile_.taskIndexToken();
    string logBase(joinPath(shellQuote(run_.logDir()), "task.\"" + task +
			    "\""));

    renderHeader(os, run_.arrayName(), run_.arrayStdoutLog(),
		 run_.arrayStderrLog(), lastIndex);
    os << "set -o errexit -o nounset -o pipefail\n";
    os << "script="
       << JobListParser::scriptPath(shellQuote(run_.scriptDir()),
				    "\"" + task + "\"")
       << '\n';
    os << "if [ ! -f \"$script\" ]; then\n";
    os << "    echo \"jobfan: task " << task
       << " has no script, already complete\" >&2\n";
    os << "    exit 0\n";
    os << "fi\n";
    os << "exec /bin/bash \"$script\" > " << logBase << ".out 2> "
       << logBase << ".err\n";
}

void
ScriptWriter::renderHeader (ostream& os, const string& jobName,
			    const string& stdoutLog, const string& stderrLog,
			    unsigned arraySize) const
{
    os << "#!/bin/bash\n";
    renderDirective(os, profile_.jobNameFlag(), jobName);
    if (run_.options().inheritEnv_) {
	renderDirective(os, profile_.envFlag(), "");
    }
    if (!profile_.logsOnCommandLine()) {
	renderDirective(os, "-o", stdoutLog);
	renderDirective(os, "-e", stderrLog);
    }
    if (arraySize > 0) {
	ostringstream range;
	range << "1-" << arraySize;
	renderDirective(os, profile_.arrayFlag(), range.str());
    }
    if (!run_.options().schedOptions_.empty()) {
	renderDirective(os, run_.options().schedOptions_, "");
    }
    os << "ulimit -c 0\n";
    renderBanner(os);
}

void
ScriptWriter::renderDirective (ostream& os, const string& flag,
			       const string& value) const
{
    os << profile_.directive() << ' ' << flag;
    if (!value.empty()) {
	os << ' ' << value;
    }
    os << '\n';
}

// runs before strict mode, when the manager variables may be unset
void
ScriptWriter::renderBanner (ostream& os) const
{
    os << "echo \"jobfan: " << profile_.jobNameToken() << " ("
       << profile_.jobIdToken() << ") on $(hostname) at $(date)\" >&2\n";
}

void
ScriptWriter::writeJob (const JobRecord& record) const
{
    ostringstream text;
    renderJob(record, text);
    write(record.script(), text.str());
}

void
ScriptWriter::writeArray (unsigned lastIndex) const
{
    ostringstream text;
    renderArray(lastIndex, text);
    write(run_.arrayScript(), text.str());
}

void
ScriptWriter::write (const string& path, const string& text) const
{
    try {
	writeFile(path, text, scriptMode);
    } catch (const runtime_error& err) {
	throw ScriptWriteFailure(string("cannot write script: ") +
				 err.what());
    }
}
