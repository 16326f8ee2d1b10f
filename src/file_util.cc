//
// file_util.cc - jobfan file and path helpers
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
#include <fstream>
#include <stdexcept>

extern "C" {
#include <unistd.h>
#include <errno.h>
#include <string.h>
#include <limits.h>
#include <sys/stat.h>
}

#include "file_util.hh"

using std::string;
using std::ifstream;
using std::ofstream;
using std::ostringstream;
using std::runtime_error;

void
makeDirs (const string& path, mode_t mode)
{
    if (path.empty() || isDirectory(path)) {
	return;
    }
    string::size_type slash = path.find_last_of('/');
    if (slash != string::npos && slash > 0) {
	makeDirs(path.substr(0, slash), mode);
    }
    if (mkdir(path.c_str(), mode) < 0 && errno != EEXIST) {
	ostringstream err;
	err << "cannot create directory " << path << ": " << strerror(errno);
	throw runtime_error(err.str());
    }
    if (!isDirectory(path)) {
	throw runtime_error("not a directory: " + path);
    }
}

bool
fileExists (const string& path)
{
    struct stat sb;
    return stat(path.c_str(), &sb) == 0;
}

bool
isDirectory (const string& path)
{
    struct stat sb;
    if (stat(path.c_str(), &sb) < 0) {
	return false;
    }
    return S_ISDIR(sb.st_mode);
}

bool
readFile (const string& path, string& contents)
{
    if (isDirectory(path)) {
	return false;
    }
    ifstream ifs(path.c_str());
    if (!ifs) {
	return false;
    }
    ostringstream buf;
    buf << ifs.rdbuf();
    if (ifs.bad()) {
	return false;
    }
    contents = buf.str();
    return true;
}

void
writeFile (const string& path, const string& contents, mode_t mode)
{
    ofstream ofs(path.c_str(), std::ios::out | std::ios::trunc);
    if (!ofs) {
	ostringstream err;
	err << "cannot open " << path << ": " << strerror(errno);
	throw runtime_error(err.str());
    }
    ofs << contents;
    ofs.close();
    if (!ofs) {
	throw runtime_error("cannot write " + path);
    }
    if (chmod(path.c_str(), mode) < 0) {
	ostringstream err;
	err << "cannot set permissions on " << path << ": "
	    << strerror(errno);
	throw runtime_error(err.str());
    }
}

void
removeFile (const string& path)
{
    if (unlink(path.c_str()) < 0 && errno != ENOENT) {
	ostringstream err;
	err << "cannot remove " << path << ": " << strerror(errno);
	throw runtime_error(err.str());
    }
}

string
currentDirectory ()
{
    char buf[PATH_MAX];
    if (getcwd(buf, sizeof(buf)) == 0) {
	ostringstream err;
	err << "cannot determine current directory: " << strerror(errno);
	throw runtime_error(err.str());
    }
    return string(buf);
}

string
joinPath (const string& dir, const string& name)
{
    if (dir.empty()) {
	return name;
    }
    if (dir[dir.size() - 1] == '/') {
	return dir + name;
    }
    return dir + "/" + name;
}

string
absolutePath (const string& path, const string& base)
{
    if (path.empty() || path[0] == '/') {
	return path;
    }
    string relative(path);
    while (relative.compare(0, 2, "./") == 0) {
	relative.erase(0, 2);
    }
    if (relative.empty() || relative == ".") {
	return base;
    }
    return joinPath(base, relative);
}

string
baseName (const string& path)
{
    string trimmed(path);
    while (trimmed.size() > 1 && trimmed[trimmed.size() - 1] == '/') {
	trimmed.erase(trimmed.size() - 1);
    }
    string::size_type slash = trimmed.find_last_of('/');
    if (slash == string::npos) {
	return trimmed;
    }
    return trimmed.substr(slash + 1);
}

// remove the last extension; a leading dot does not start an extension
string
stripExtension (const string& filename)
{
    string::size_type dot = filename.find_last_of('.');
    if (dot == string::npos || dot == 0) {
	return filename;
    }
    return filename.substr(0, dot);
}

string
shellQuote (const string& word)
{
    if (!word.empty() &&
	word.find_first_not_of("abcdefghijklmnopqrstuvwxyz"
			       "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
			       "0123456789_-./=:,+@%") == string::npos) {
	return word;
    }
    string quoted("'");
    for (string::const_iterator iter = word.begin(); iter != word.end();
	 ++iter) {
	if (*iter == '\'') {
	    quoted += "'\\''";
	} else {
	    quoted += *iter;
	}
    }
    quoted += "'";
    return quoted;
}
