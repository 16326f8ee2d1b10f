//
// history.cc - jobfan command history
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

#include <fstream>
#include <string>

extern "C" {
#include <time.h>
}

#include "history.hh"

using std::string;
using std::ofstream;

HistoryRecorder::HistoryRecorder (const string& historyFile, Logger& log):
    historyFile_(historyFile),
    log_(log)
{
}

// failures are only logged; the history never stops a run
void
HistoryRecorder::record (const string& commandLine)
{
    if (commandLine.empty()) {
	return;
    }
    ofstream ofs(historyFile_.c_str(), std::ios::out | std::ios::app);
    if (!ofs) {
	log_.log(Logger::LogWarning, "cannot open history file " +
		 historyFile_);
	return;
    }
    time_t clock = time(0);
    struct tm tm;
    localtime_r(&clock, &tm);
    char now[64];
    strftime(now, sizeof(now), "%Y-%m-%d %H:%M:%S", &tm);
    ofs << "# " << now << '\n' << commandLine << '\n';
    ofs.close();
    if (!ofs) {
	log_.log(Logger::LogWarning, "cannot write history file " +
		 historyFile_);
    }
}
