//
// job_list_test.cc - tests for input list parsing
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
#include <vector>

#include <gtest/gtest.h>

#include "job_list.hh"

using std::istringstream;
using std::string;
using std::vector;

namespace {
    const char* const sampleList = "a.txt\nb.txt\n# comment\n\nc.txt";

    vector<JobRecord>
    Parse (const string& text, const string& extension, bool destIsDir)
    {
	JobListParser parser("out", extension, destIsDir, "out/scripts",
			     "out/logs");
	istringstream is(text);
	vector<JobRecord> records;
	parser.parse(is, records);
	return records;
    }
}

TEST(JobListTest, FileDestinations)
{
    vector<JobRecord> records = Parse(sampleList, "out", false);
    ASSERT_EQ(3u, records.size());
    const char* stems[] = { "a", "b", "c" };
    for (unsigned idx = 0; idx < records.size(); ++idx) {
	EXPECT_EQ(idx + 1, records[idx].index());
	EXPECT_EQ(stems[idx], records[idx].stem());
	EXPECT_EQ(string("out/") + stems[idx] + ".out", records[idx].output());
	EXPECT_EQ(records[idx].output() + ".status", records[idx].marker());
    }
    EXPECT_EQ("a.txt", records[0].input());
    EXPECT_EQ("out/scripts/1.sh", records[0].script());
    EXPECT_EQ("out/scripts/3.sh", records[2].script());
    EXPECT_EQ("out/logs/b.out", records[1].stdoutLog());
    EXPECT_EQ("out/logs/b.err", records[1].stderrLog());
}

TEST(JobListTest, DirectoryDestinations)
{
    vector<JobRecord> records = Parse(sampleList, "out", true);
    ASSERT_EQ(3u, records.size());
    EXPECT_EQ("out/a", records[0].output());
    EXPECT_EQ("out/b", records[1].output());
    EXPECT_EQ("out/c", records[2].output());
    EXPECT_EQ("out/c.status", records[2].marker());
}

TEST(JobListTest, EmptyExtensionUsesStem)
{
    vector<JobRecord> records = Parse("data/sample.fastq.gz\n", "", false);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("sample.fastq", records[0].stem());
    EXPECT_EQ("out/sample.fastq", records[0].output());
}

TEST(JobListTest, LeadingDotInExtensionIsIgnored)
{
    vector<JobRecord> records = Parse("x.bam\n", ".vcf", false);
    ASSERT_EQ(1u, records.size());
    EXPECT_EQ("out/x.vcf", records[0].output());
}

TEST(JobListTest, TrailingCommentsAndWhitespaceAreStripped)
{
    vector<JobRecord> records =
	Parse("  /data/run1/a.txt   # first lane\r\n\t\n   # only a comment\n"
	      "b.txt#no space\n", "out", false);
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("/data/run1/a.txt", records[0].input());
    EXPECT_EQ("b.txt", records[1].input());
    EXPECT_EQ(2u, records[1].index());
}

TEST(JobListTest, IndicesSkipBlankLines)
{
    JobListParser parser("out", "", false, "s", "l");
    istringstream is("\n\n# x\nfirst\n\n\nsecond\n#\nthird\n");
    JobRecord record;
    unsigned expected = 0;
    while (parser.next(is, record)) {
	++expected;
	EXPECT_EQ(expected, record.index());
    }
    EXPECT_EQ(3u, expected);
    EXPECT_EQ(3u, parser.lastIndex());
    EXPECT_EQ(9u, parser.lineNum());
}

TEST(JobListTest, EmptyListHasNoRecords)
{
    EXPECT_TRUE(Parse("", "out", false).empty());
    EXPECT_TRUE(Parse("# nothing\n\n   \n", "out", false).empty());
}

TEST(JobListTest, JobNameIsSafeForDirectives)
{
    vector<JobRecord> records =
	Parse("data/my sample.txt\nrun:1@host*?.txt\n", "out", false);
    ASSERT_EQ(2u, records.size());
    EXPECT_EQ("my sample", records[0].stem());
    EXPECT_EQ("my_sample", records[0].jobName());
    EXPECT_EQ("out/my sample.out", records[0].output());
    EXPECT_EQ("out/logs/my_sample.out", records[0].stdoutLog());
    EXPECT_EQ("out/logs/my_sample.err", records[0].stderrLog());
    EXPECT_EQ("run_1_host__", records[1].jobName());
    EXPECT_EQ("plain-name.v2", JobListParser::jobName("plain-name.v2"));
    EXPECT_EQ("a_b_c_d", JobListParser::jobName("a\tb'c$d"));
}

TEST(JobListTest, ScriptPathAcceptsVariable)
{
    EXPECT_EQ("/s/\"$SGE_TASK_ID\".sh",
	      JobListParser::scriptPath("/s", "\"$SGE_TASK_ID\""));
}
