//
// batch.hh - jobfan batch system interface
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

#ifndef BATCH_H
#define BATCH_H

#include <string>
#include <vector>

// interface definition for all batch systems
class BatchSystem {
public:
    virtual ~BatchSystem() { }
    // run one complete submit command line; a failed submission throws
    // SubmitCommandFailure
    virtual void submit(const std::string& commandLine) = 0;
};

// runs submit commands through /bin/sh
class ShellBatchSystem: public BatchSystem {
public:
    ShellBatchSystem();
    virtual void submit(const std::string& commandLine);
};

// stubs for testing without a batch system
class StubBatchSystem: public BatchSystem {
public:
    typedef std::vector<std::string> CommandList;

    StubBatchSystem();
    virtual void submit(const std::string& commandLine);
    void failOn(const std::string& pattern);
    const CommandList& commands() const { return commands_; }

private:
    CommandList commands_;	// submitted command lines, in order
    CommandList failPatterns_;	// commands containing these fail
};

#endif // BATCH_H
