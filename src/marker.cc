//
// marker.cc - jobfan completion markers
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
#include <sstream>

#include <boost/algorithm/string.hpp>

#include "marker.hh"
#include "file_util.hh"

using std::string;
using std::ostringstream;

using boost::regex;
using boost::regex_match;

const regex CompletionTracker::exitStatusRE("-?\\d+");

namespace {
    const string missingString("missing");
    const string succeededString("succeeded");
    const string failedString("failed");
    const string ambiguousString("ambiguous");
}

CompletionTracker::CompletionTracker (Logger& log):
    log_(log)
{
}

bool
CompletionTracker::mustRun (const JobRecord& record)
{
    return mustRun(record.marker());
}

// anything short of a marker that reads exactly 0 means the payload has
// to run again
bool
CompletionTracker::mustRun (const string& markerPath)
{
    string contents;
    MarkerState state = readMarker(markerPath, contents);
    if (state == Ambiguous) {
	ostringstream msg;
	msg << "unreadable exit status in " << markerPath << ": \""
	    << contents << "\", rerunning";
	log_.log(Logger::LogWarning, msg.str());
    } else {
	log_.log(Logger::LogVerbose,
		 markerPath + " is " + stateString(state));
    }
    return state != Succeeded;
}

CompletionTracker::MarkerState
CompletionTracker::readMarker (const string& markerPath, string& contents)
{
    contents.clear();
    if (!readFile(markerPath, contents)) {
	return Missing;
    }
    boost::trim(contents);
    if (contents == "0") {
	return Succeeded;
    }
    if (regex_match(contents, exitStatusRE)) {
	return Failed;
    }
    return Ambiguous;
}

const string&
CompletionTracker::stateString (MarkerState state)
{
    switch (state) {
    case Missing:
	return missingString;
    case Succeeded:
	return succeededString;
    case Failed:
	return failedString;
    default:
	return ambiguousString;
    }
}
