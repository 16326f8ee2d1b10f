//
// script.hh - jobfan job script generation
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

#ifndef SCRIPT_H
#define SCRIPT_H

#include <iostream>
#include <string>
#include <vector>
#include <boost/regex.hpp>

extern "C" {
#include <sys/types.h>
}

#include "job_list.hh"
#include "run.hh"

class ScriptWriter {
public:
    typedef std::vector<std::string> ModuleList;

    explicit ScriptWriter(const RunInvocation& run);
    void renderJob(const JobRecord& record, std::ostream& os) const;
    void renderArray(unsigned lastIndex, std::ostream& os) const;
    void writeJob(const JobRecord& record) const;
    void writeArray(unsigned lastIndex) const;
    std::string payload(const JobRecord& record) const;
    const ModuleList& modules() const { return modules_; }
    static std::string rewriteModuleLine(const std::string& line);

private:
    static const boost::regex useRE;
    static const mode_t scriptMode = 0755;

    const RunInvocation& run_;
    const SchedulerProfile& profile_;
    ModuleList modules_;	// rewritten module statements

    void loadModules(const std::string& moduleFile);
    void renderHeader(std::ostream& os, const std::string& jobName,
		      const std::string& stdoutLog,
		      const std::string& stderrLog,
		      unsigned arraySize) const;
    void renderDirective(std::ostream& os, const std::string& flag,
			 const std::string& value) const;
    void renderBanner(std::ostream& os) const;
    void write(const std::string& path, const std::string& text) const;
};

#endif // SCRIPT_H
