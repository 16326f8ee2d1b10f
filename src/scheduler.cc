//
// scheduler.cc - jobfan resource manager profiles
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
#include <stdexcept>

#include <boost/algorithm/string.hpp>

#include "scheduler.hh"
#include "errors.hh"

using std::string;
using std::logic_error;

namespace {
    // alternate names accepted on the command line
    struct ManagerAlias {
	const char* alias;
	SchedulerProfile::Manager manager;
    };

    const ManagerAlias managerAliases[] = {
	{ "sge", SchedulerProfile::Sge },
	{ "gridengine", SchedulerProfile::Sge },
	{ "pbs", SchedulerProfile::Pbs },
	{ "torque", SchedulerProfile::Pbs },
	{ "lsf", SchedulerProfile::Lsf },
	{ "slurm", SchedulerProfile::Slurm }
    };

    const SchedulerProfile*
    ProfileTable ()
    {
	// indexed by SchedulerProfile::Manager
	static const SchedulerProfile
	    profiles[SchedulerProfile::NumManagers] = {
	    SchedulerProfile(SchedulerProfile::Sge, "sge",
			     "#$", "-N", "-t", "-V",
			     "$JOB_ID", "$JOB_NAME", "$SGE_TASK_ID",
			     "qsub", false, false),
	    SchedulerProfile(SchedulerProfile::Pbs, "pbs",
			     "#PBS", "-N", "-t", "-V",
			     "$PBS_JOBID", "$PBS_JOBNAME", "$PBS_ARRAYID",
			     "qsub", false, false),
	    SchedulerProfile(SchedulerProfile::Lsf, "lsf",
			     "#BSUB", "-J", "", "-env all",
			     "$LSB_JOBID", "$LSB_JOBNAME", "$LSB_JOBINDEX",
			     "bsub", true, true),
	    SchedulerProfile(SchedulerProfile::Slurm, "slurm",
			     "#SBATCH", "-J", "-a", "--export=ALL",
			     "$SLURM_JOB_ID", "$SLURM_JOB_NAME",
			     "$SLURM_ARRAY_TASK_ID",
			     "sbatch", false, false)
	};
	return profiles;
    }
}

SchedulerProfile::SchedulerProfile (Manager manager, const char* name,
				    const char* directive,
				    const char* jobNameFlag,
				    const char* arrayFlag,
				    const char* envFlag,
				    const char* jobIdToken,
				    const char* jobNameToken,
				    const char* taskIndexToken,
				    const char* submitCommand,
				    bool logsOnCommandLine,
				    bool scriptOnStdin):
    manager_(manager),
    name_(name),
    directive_(directive),
    jobNameFlag_(jobNameFlag),
    arrayFlag_(arrayFlag),
    envFlag_(envFlag),
    jobIdToken_(jobIdToken),
    jobNameToken_(jobNameToken),
    taskIndexToken_(taskIndexToken),
    submitCommand_(submitCommand),
    logsOnCommandLine_(logsOnCommandLine),
    scriptOnStdin_(scriptOnStdin)
{
}

// map a manager name to its identity; names are case-insensitive
SchedulerProfile::Manager
SchedulerProfile::parseManager (const string& name)
{
    string key(boost::to_lower_copy(boost::trim_copy(name)));
    unsigned count = sizeof(managerAliases) / sizeof(managerAliases[0]);
    for (unsigned idx = 0; idx < count; ++idx) {
	if (key == managerAliases[idx].alias) {
	    return managerAliases[idx].manager;
	}
    }
    throw UnsupportedManager(name.empty() ? "(none)" : name);
}

const SchedulerProfile&
SchedulerProfile::resolve (Manager manager)
{
    if (manager < Sge || manager >= NumManagers) {
	throw logic_error("invalid manager identity");
    }
    const SchedulerProfile& profile = ProfileTable()[manager];
    if (profile.manager() != manager) {
	throw logic_error("profile table out of order");
    }
    return profile;
}

const SchedulerProfile&
SchedulerProfile::resolve (const string& name)
{
    return resolve(parseManager(name));
}
