//
// file_util.hh - jobfan file and path helpers
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
// $Id$
//

#ifndef FILE_UTIL_H
#define FILE_UTIL_H

#include <string>

extern "C" {
#include <sys/types.h>
}

// create a directory and any missing parents
void makeDirs(const std::string& path, mode_t mode = 0777);

bool fileExists(const std::string& path);
bool isDirectory(const std::string& path);

// read a whole file; return false if it cannot be read
bool readFile(const std::string& path, std::string& contents);

// replace the contents of a file and set its permissions
void writeFile(const std::string& path, const std::string& contents,
	       mode_t mode);

// remove a file if it exists
void removeFile(const std::string& path);

std::string currentDirectory();
std::string joinPath(const std::string& dir, const std::string& name);
std::string absolutePath(const std::string& path, const std::string& base);
std::string baseName(const std::string& path);
std::string stripExtension(const std::string& filename);

// quote a string for use as a single POSIX shell word
std::string shellQuote(const std::string& word);

#endif // FILE_UTIL_H
