//
// scheduler_test.cc - tests for resource manager profiles
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

#include <gtest/gtest.h>

#include "errors.hh"
#include "scheduler.hh"

using std::string;

TEST(SchedulerProfileTest, EveryManagerHasCompleteProfile)
{
    for (unsigned idx = SchedulerProfile::Sge;
	 idx < SchedulerProfile::NumManagers; ++idx) {
	SchedulerProfile::Manager manager = (SchedulerProfile::Manager)idx;
	const SchedulerProfile& profile = SchedulerProfile::resolve(manager);
	EXPECT_EQ(manager, profile.manager());
	EXPECT_FALSE(profile.name().empty());
	EXPECT_FALSE(profile.directive().empty());
	EXPECT_EQ('#', profile.directive()[0]);
	EXPECT_FALSE(profile.jobNameFlag().empty());
	EXPECT_FALSE(profile.envFlag().empty());
	EXPECT_FALSE(profile.jobIdToken().empty());
	EXPECT_FALSE(profile.jobNameToken().empty());
	EXPECT_FALSE(profile.taskIndexToken().empty());
	EXPECT_FALSE(profile.submitCommand().empty());
	EXPECT_EQ(&profile, &SchedulerProfile::resolve(profile.name()));
    }
}

TEST(SchedulerProfileTest, GridEngineSyntax)
{
    const SchedulerProfile& sge = SchedulerProfile::resolve("sge");
    EXPECT_EQ(SchedulerProfile::Sge, sge.manager());
    EXPECT_EQ("#$", sge.directive());
    EXPECT_EQ("-N", sge.jobNameFlag());
    EXPECT_EQ("-t", sge.arrayFlag());
    EXPECT_EQ("-V", sge.envFlag());
    EXPECT_EQ("$SGE_TASK_ID", sge.taskIndexToken());
    EXPECT_EQ("qsub", sge.submitCommand());
    EXPECT_FALSE(sge.logsOnCommandLine());
    EXPECT_FALSE(sge.scriptOnStdin());
}

TEST(SchedulerProfileTest, SlurmSyntax)
{
    const SchedulerProfile& slurm = SchedulerProfile::resolve("slurm");
    EXPECT_EQ("#SBATCH", slurm.directive());
    EXPECT_EQ("$SLURM_ARRAY_TASK_ID", slurm.taskIndexToken());
    EXPECT_EQ("sbatch", slurm.submitCommand());
    EXPECT_TRUE(slurm.supportsArrays());
}

TEST(SchedulerProfileTest, LsfHasNoArraysAndTakesLogsOnCommandLine)
{
    const SchedulerProfile& lsf = SchedulerProfile::resolve("lsf");
    EXPECT_EQ("#BSUB", lsf.directive());
    EXPECT_FALSE(lsf.supportsArrays());
    EXPECT_TRUE(lsf.arrayFlag().empty());
    EXPECT_TRUE(lsf.logsOnCommandLine());
    EXPECT_TRUE(lsf.scriptOnStdin());
    EXPECT_EQ("bsub", lsf.submitCommand());
}

TEST(SchedulerProfileTest, NamesAreCaseInsensitiveWithAliases)
{
    EXPECT_EQ(SchedulerProfile::Sge, SchedulerProfile::parseManager("SGE"));
    EXPECT_EQ(SchedulerProfile::Sge,
	      SchedulerProfile::parseManager("GridEngine"));
    EXPECT_EQ(SchedulerProfile::Pbs, SchedulerProfile::parseManager("torque"));
    EXPECT_EQ(SchedulerProfile::Slurm,
	      SchedulerProfile::parseManager(" Slurm "));
}

TEST(SchedulerProfileTest, UnknownManagerIsRejected)
{
    EXPECT_THROW(SchedulerProfile::resolve("condor"), UnsupportedManager);
    EXPECT_THROW(SchedulerProfile::resolve(""), UnsupportedManager);
    EXPECT_THROW(SchedulerProfile::parseManager("sge2"), ConfigError);
}
