//
// job_list.cc - jobfan input list records
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
#include <vector>

#include "job_list.hh"
#include "file_util.hh"

using std::istream;
using std::ostringstream;
using std::logic_error;
using std::string;
using std::vector;

using boost::regex;
using boost::smatch;
using boost::regex_match;
using boost::regex_replace;

const char* const JobListParser::markerSuffix = ".status";

const regex JobListParser::commentRE("([^#]*)#.*");
const regex JobListParser::blankRE("\\s*");
const regex JobListParser::pathRE("\\s*(\\S(.*\\S)?)\\s*");
// characters that break a directive line or that managers reject in names
const regex JobListParser::nameCharRE("[\\s'\"/:@\\\\*?#$;&|<>()\\[\\]]");

JobRecord::JobRecord ():
    index_(0)
{
}

JobListParser::JobListParser (const string& outputDir,
			      const string& extension, bool destIsDir,
			      const string& scriptDir, const string& logDir):
    outputDir_(outputDir),
    extension_(extension),
    destIsDir_(destIsDir),
    scriptDir_(scriptDir),
    logDir_(logDir),
    lineNum_(0),
    lastIndex_(0)
{
    // accept ".ext" as well as "ext"
    while (!extension_.empty() && extension_[0] == '.') {
	extension_.erase(0, 1);
    }
}

// read lines until the next record; return false at end of input
bool
JobListParser::next (istream& is, JobRecord& record)
{
    string line;
    while (getline(is, line)) {
	++lineNum_;
	if (parseLine(line, record)) {
	    return true;
	}
    }
    return false;
}

void
JobListParser::parse (istream& is, vector<JobRecord>& records)
{
    JobRecord record;
    while (next(is, record)) {
	records.push_back(record);
    }
}

// fill in a record from one line; return false for blank and comment lines
bool
JobListParser::parseLine (const string& line, JobRecord& record)
{
    smatch matches;
    string text(line);
    if (regex_match(line, matches, commentRE)) {
	text.assign(matches[1].first, matches[1].second);
    }
    if (regex_match(text, blankRE)) {
	return false;
    }
    if (!regex_match(text, matches, pathRE)) {
	ostringstream err;
	err << "line " << lineNum_ << ": cannot parse " << line;
	throw logic_error(err.str());
    }

    JobRecord parsed;
    parsed.input_.assign(matches[1].first, matches[1].second);
    parsed.stem_ = stripExtension(baseName(parsed.input_));
    parsed.jobName_ = jobName(parsed.stem_);
    if (destIsDir_ || extension_.empty()) {
	parsed.output_ = joinPath(outputDir_, parsed.stem_);
    } else {
	parsed.output_ = joinPath(outputDir_, parsed.stem_ + "." + extension_);
    }
    parsed.marker_ = parsed.output_ + markerSuffix;
    parsed.index_ = ++lastIndex_;
    ostringstream index;
    index << parsed.index_;
    parsed.script_ = scriptPath(scriptDir_, index.str());
    parsed.stdoutLog_ = joinPath(logDir_, parsed.jobName_ + ".out");
    parsed.stderrLog_ = joinPath(logDir_, parsed.jobName_ + ".err");
    record = parsed;
    return true;
}

// the index may be a literal number or a run-time variable
string
JobListParser::scriptPath (const string& scriptDir, const string& index)
{
    return joinPath(scriptDir, index + ".sh");
}

string
JobListParser::jobName (const string& stem)
{
    return regex_replace(stem, nameCharRE, "_");
}
