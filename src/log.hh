//
// log.hh - jobfan logging
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

#ifndef LOG_H
#define LOG_H

#include <iostream>
#include <string>

class Logger {
public:
    typedef enum {
	LogVerbose = 1,
	LogInfo,
	LogWarning,
	LogError,
	LogAlways
    } LogLevel;

    Logger();
    explicit Logger(std::ostream& os);
    void setLevel(LogLevel level) { level_ = level; }
    LogLevel level() const { return level_; }
    void setStream(std::ostream& os) { os_ = &os; }
    void setTimestamps(bool timestamps) { timestamps_ = timestamps; }
    void log(LogLevel level, const std::string& msg);
    std::ostream& stream() { return *os_; }
    static bool parseLevel(const std::string& name, LogLevel& level);

private:
    std::ostream* os_;		// destination for log messages
    LogLevel level_;		// messages below this level are dropped
    bool timestamps_;		// prefix each message with the time
};

#endif // LOG_H
