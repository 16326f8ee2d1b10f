//
// test_util.cc - jobfan test helpers
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

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

extern "C" {
#include <ftw.h>
#include <stdio.h>
#include <unistd.h>
}

#include "test_util.hh"
#include "file_util.hh"

using std::string;
using std::vector;
using std::ifstream;
using std::ofstream;
using std::ostringstream;
using std::runtime_error;

namespace {
    int
    RemoveEntry (const char* path, const struct stat* sb, int type,
		 struct FTW* ftw)
    {
	return remove(path);
    }
}

TempDir::TempDir ()
{
    const char* tmp = getenv("TMPDIR");
    string pattern(joinPath(tmp != 0 && *tmp != '\0' ? tmp : "/tmp",
			    "jobfan_test.XXXXXX"));
    vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');
    if (mkdtemp(&buf[0]) == 0) {
	throw runtime_error("mkdtemp failed for " + pattern);
    }
    path_.assign(&buf[0]);
}

TempDir::~TempDir ()
{
    nftw(path_.c_str(), RemoveEntry, 16, FTW_DEPTH | FTW_PHYS);
}

string
TempDir::file (const string& name) const
{
    return joinPath(path_, name);
}

void
writeText (const string& path, const string& text)
{
    ofstream ofs(path.c_str());
    if (!ofs) {
	throw runtime_error("cannot open " + path);
    }
    ofs << text;
}

string
readText (const string& path)
{
    ifstream ifs(path.c_str());
    if (!ifs) {
	throw runtime_error("cannot open " + path);
    }
    ostringstream buf;
    buf << ifs.rdbuf();
    return buf.str();
}
