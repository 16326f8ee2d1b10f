//
// dispatch_test.cc - tests for script submission
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

#include "batch.hh"
#include "dispatch.hh"
#include "errors.hh"
#include "log.hh"
#include "run.hh"
#include "test_util.hh"

using std::istringstream;
using std::ostringstream;
using std::string;

class DispatcherTest: public ::testing::Test {
protected:
    TempDir dir_;
    RunOptions options_;
    ostringstream logText_;
    Logger log_;
    StubBatchSystem batch_;

    DispatcherTest():
	log_(logText_)
    {
	log_.setTimestamps(false);
	options_.manager_ = "sge";
	options_.listFile_ = dir_.file("lanes.txt");
	options_.command_ = "align";
	options_.outputDir_ = dir_.file("out");
	options_.extension_ = "bam";
	options_.workDir_ = dir_.path();
    }
};

TEST_F(DispatcherTest, GridEngineSubmitsScriptOnly)
{
    istringstream is("a.fq\nb.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    EXPECT_TRUE(dispatcher.dispatch(run.records()[1]));
    ASSERT_EQ(1u, batch_.commands().size());
    EXPECT_EQ("qsub " + dir_.file("out/scripts/2.sh"), batch_.commands()[0]);
}

TEST_F(DispatcherTest, LsfReadsScriptFromStdin)
{
    options_.manager_ = "lsf";
    istringstream is("a.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    const JobRecord& record = run.records().front();
    EXPECT_EQ("bsub -o " + dir_.file("out/logs/a.out") + " -e " +
	      dir_.file("out/logs/a.err") + " < " +
	      dir_.file("out/scripts/1.sh"),
	      dispatcher.commandLine(record.script(), record.stdoutLog(),
				     record.stderrLog()));
}

TEST_F(DispatcherTest, LsfLogPathsAreQuoted)
{
    options_.manager_ = "lsf";
    options_.logDir_ = "job logs";
    istringstream is("my sample.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    EXPECT_TRUE(dispatcher.dispatch(run.records().front()));
    ASSERT_EQ(1u, batch_.commands().size());
    EXPECT_EQ("bsub -o '" + dir_.file("job logs/my_sample.out") + "' -e '" +
	      dir_.file("job logs/my_sample.err") + "' < " +
	      dir_.file("out/scripts/1.sh"),
	      batch_.commands()[0]);
}

TEST_F(DispatcherTest, SubmitCommandOverride)
{
    options_.manager_ = "slurm";
    options_.submitCommand_ = "sbatch --parsable";
    istringstream is("a.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    EXPECT_TRUE(dispatcher.dispatch(run.records().front()));
    ASSERT_EQ(1u, batch_.commands().size());
    EXPECT_EQ("sbatch --parsable " + dir_.file("out/scripts/1.sh"),
	      batch_.commands()[0]);
}

TEST_F(DispatcherTest, DryRunNeverSubmits)
{
    options_.dryRun_ = true;
    istringstream is("a.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    EXPECT_FALSE(dispatcher.dispatch(run.records().front()));
    EXPECT_TRUE(batch_.commands().empty());
    EXPECT_NE(string::npos, logText_.str().find("dry run, not submitting a"));
}

TEST_F(DispatcherTest, ArrayIsNamedAfterList)
{
    options_.array_ = true;
    istringstream is("a.fq\nb.fq\nc.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    EXPECT_TRUE(dispatcher.dispatchArray());
    ASSERT_EQ(1u, batch_.commands().size());
    EXPECT_EQ("qsub " + dir_.file("out/scripts/array.sh"),
	      batch_.commands()[0]);
    EXPECT_NE(string::npos, logText_.str().find("submitted lanes[1-3]"));
}

TEST_F(DispatcherTest, StubFailureIsReported)
{
    istringstream is("a.fq\nb.fq\n");
    RunInvocation run(options_, is);
    Dispatcher dispatcher(run, batch_, log_);
    batch_.failOn("/2.sh");
    EXPECT_TRUE(dispatcher.dispatch(run.records()[0]));
    EXPECT_THROW(dispatcher.dispatch(run.records()[1]), SubmitCommandFailure);
}

TEST(ShellBatchSystemTest, ExitStatusDecidesSuccess)
{
    ShellBatchSystem batch;
    EXPECT_NO_THROW(batch.submit("true"));
    EXPECT_THROW(batch.submit("exit 3"), SubmitCommandFailure);
    EXPECT_THROW(batch.submit("/no/such/submit/command"),
		 SubmitCommandFailure);
}

TEST(ShellBatchSystemTest, CommandRunsThroughShell)
{
    TempDir dir;
    string flag(dir.file("ran"));
    ShellBatchSystem batch;
    batch.submit("echo submitted > " + flag);
    EXPECT_EQ("submitted\n", readText(flag));
}
