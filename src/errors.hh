//
// errors.hh - jobfan error types
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

#ifndef ERRORS_H
#define ERRORS_H

#include <string>
#include <stdexcept>

// errors in the run configuration; these abort the run before any
// record is processed
class ConfigError: public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg):
	std::runtime_error(msg) { }
};

class UnsupportedManager: public ConfigError {
public:
    explicit UnsupportedManager(const std::string& manager):
	ConfigError("unsupported resource manager " + manager) { }
};

class MissingRequiredArgument: public ConfigError {
public:
    explicit MissingRequiredArgument(const std::string& argument):
	ConfigError("missing required argument " + argument) { }
};

class ArrayUnsupportedByManager: public ConfigError {
public:
    explicit ArrayUnsupportedByManager(const std::string& manager):
	ConfigError("resource manager " + manager +
		    " does not support task arrays") { }
};

class DuplicateOutput: public ConfigError {
public:
    explicit DuplicateOutput(const std::string& msg):
	ConfigError(msg) { }
};

// errors that affect a single record; the rest of the batch still runs
class RecordError: public std::runtime_error {
public:
    explicit RecordError(const std::string& msg):
	std::runtime_error(msg) { }
};

class ScriptWriteFailure: public RecordError {
public:
    explicit ScriptWriteFailure(const std::string& msg):
	RecordError(msg) { }
};

class SubmitCommandFailure: public RecordError {
public:
    explicit SubmitCommandFailure(const std::string& msg):
	RecordError(msg) { }
};

#endif // ERRORS_H
