//
// log.cc - jobfan logging
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

#include <string>

extern "C" {
#include <time.h>
}

#include <boost/algorithm/string.hpp>

#include "log.hh"

using std::string;
using std::ostream;
using std::endl;
using std::flush;

Logger::Logger ():
    os_(&std::cerr),
    level_(LogInfo),
    timestamps_(true)
{
}

Logger::Logger (ostream& os):
    os_(&os),
    level_(LogInfo),
    timestamps_(true)
{
}

void
Logger::log (LogLevel level, const string& msg)
{
    if (level < level_) {
	return;
    }
    if (timestamps_) {
	time_t clock = time(0);
	char buf[32];
	string curTime(ctime_r(&clock, buf));
	curTime.erase(curTime.size() - 1);
	*os_ << curTime << ": ";
    }
    *os_ << msg << endl << flush;
}

// map a log level name to a level; return false if the name is unknown
bool
Logger::parseLevel (const string& name, LogLevel& level)
{
    string lower(boost::to_lower_copy(name));
    if (lower == "verbose") {
	level = LogVerbose;
    } else if (lower == "info") {
	level = LogInfo;
    } else if (lower == "warning") {
	level = LogWarning;
    } else if (lower == "error") {
	level = LogError;
    } else {
	return false;
    }
    return true;
}
