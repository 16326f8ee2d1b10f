//
// marker_test.cc - tests for completion markers
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

#include <sstream>
#include <string>

#include <gtest/gtest.h>

#include "log.hh"
#include "marker.hh"
#include "test_util.hh"

using std::ostringstream;
using std::string;

class CompletionTrackerTest: public ::testing::Test {
protected:
    TempDir dir_;
    ostringstream logText_;
    Logger log_;
    CompletionTracker tracker_;

    CompletionTrackerTest():
	log_(logText_),
	tracker_(log_)
    {
	log_.setTimestamps(false);
    }

    string marker(const string& contents)
    {
	string path(dir_.file("job.status"));
	writeText(path, contents);
	return path;
    }
};

TEST_F(CompletionTrackerTest, MissingMarkerMustRun)
{
    EXPECT_TRUE(tracker_.mustRun(dir_.file("absent.status")));
    string contents;
    EXPECT_EQ(CompletionTracker::Missing,
	      CompletionTracker::readMarker(dir_.file("absent.status"),
					    contents));
}

TEST_F(CompletionTrackerTest, ZeroMarkerIsSkipped)
{
    EXPECT_FALSE(tracker_.mustRun(marker("0\n")));
    EXPECT_FALSE(tracker_.mustRun(marker("0")));
    EXPECT_FALSE(tracker_.mustRun(marker("  0 \n")));
}

TEST_F(CompletionTrackerTest, NonzeroMarkerMustRun)
{
    EXPECT_TRUE(tracker_.mustRun(marker("1\n")));
    EXPECT_TRUE(tracker_.mustRun(marker("137\n")));
    string contents;
    EXPECT_EQ(CompletionTracker::Failed,
	      CompletionTracker::readMarker(marker("2\n"), contents));
    EXPECT_EQ("2", contents);
}

TEST_F(CompletionTrackerTest, NonNumericMarkerMustRunWithWarning)
{
    EXPECT_TRUE(tracker_.mustRun(marker("done\n")));
    EXPECT_NE(string::npos, logText_.str().find("unreadable exit status"));
    string contents;
    EXPECT_EQ(CompletionTracker::Ambiguous,
	      CompletionTracker::readMarker(marker("0 0\n"), contents));
}

TEST_F(CompletionTrackerTest, EmptyMarkerMustRun)
{
    EXPECT_TRUE(tracker_.mustRun(marker("")));
}

TEST_F(CompletionTrackerTest, DirectoryAsMarkerMustRun)
{
    EXPECT_TRUE(tracker_.mustRun(dir_.path()));
}
