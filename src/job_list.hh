//
// job_list.hh - jobfan input list records
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

#ifndef JOB_LIST_H
#define JOB_LIST_H

#include <iostream>
#include <string>
#include <vector>
#include <boost/regex.hpp>

// one job derived from one line of the input list
class JobRecord {
    friend class JobListParser;

public:
    JobRecord();
    const std::string& input() const { return input_; }
    const std::string& stem() const { return stem_; }
    const std::string& jobName() const { return jobName_; }
    const std::string& output() const { return output_; }
    const std::string& marker() const { return marker_; }
    const std::string& script() const { return script_; }
    const std::string& stdoutLog() const { return stdoutLog_; }
    const std::string& stderrLog() const { return stderrLog_; }
    unsigned index() const { return index_; }

private:
    std::string input_;		// input path as listed
    std::string stem_;		// input basename without extension
    std::string jobName_;	// stem made safe for directives
    std::string output_;	// output file or directory
    std::string marker_;	// exit status of the last payload run
    std::string script_;	// generated job script
    std::string stdoutLog_;	// stdout log written by the manager
    std::string stderrLog_;	// stderr log written by the manager
    unsigned index_;		// 1-based position among the records
};

// turns lines of an input list into job records
class JobListParser {
public:
    static const char* const markerSuffix;

    JobListParser(const std::string& outputDir, const std::string& extension,
		  bool destIsDir, const std::string& scriptDir,
		  const std::string& logDir);
    bool next(std::istream& is, JobRecord& record);
    void parse(std::istream& is, std::vector<JobRecord>& records);
    bool parseLine(const std::string& line, JobRecord& record);
    unsigned lineNum() const { return lineNum_; }
    unsigned lastIndex() const { return lastIndex_; }
    static std::string scriptPath(const std::string& scriptDir,
				  const std::string& index);
    static std::string jobName(const std::string& stem);

private:
    static const boost::regex commentRE;
    static const boost::regex blankRE;
    static const boost::regex pathRE;
    static const boost::regex nameCharRE;

    std::string outputDir_;
    std::string extension_;
    bool destIsDir_;
    std::string scriptDir_;
    std::string logDir_;
    unsigned lineNum_;
    unsigned lastIndex_;
};

#endif // JOB_LIST_H
