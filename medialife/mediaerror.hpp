#pragma once

/// Media_error describes why a player could not be configured or
/// initialized, and whether the condition may be retried.

/*   Part of the medialife package.
 *   Copyright 2026 The medialife authors
 *
 *   Licensed under the Apache License, Version 2.0 (the "License");
 *   you may not use this file except in compliance with the License.
 *   You may obtain a copy of the License at
 *
 *       http://www.apache.org/licenses/LICENSE-2.0
 *
 *   Unless required by applicable law or agreed to in writing, software
 *   distributed under the License is distributed on an "AS IS" BASIS,
 *   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 *   See the License for the specific language governing permissions and
 *   limitations under the License.
 */

#include <iosfwd>
#include <string>
#include <boost/system/error_code.hpp>
#include "common.hpp"

namespace Json {
    class Value;
}

/// Error categories visible to callers
enum class Error_kind {
    device,       // capability not supported; never retryable
    network,      // transient fetch failure
    decode,       // malformed or unsupported media payload
    unsupported,  // invalid configuration shape; never retryable
    unknown       // catch-all for unexpected engine failures
};


/// Error record. retryable==true implies recoverable==true; the
/// constructor enforces this.
///
class Media_error {
private:
    Error_kind m_kind { Error_kind::unknown };
    std::string m_message {};
    bool m_recoverable { true };
    bool m_retryable { true };
    std::string m_code {};
public:
    Error_kind kind() const { return m_kind; }
    const std::string& message() const { return m_message; }
    bool recoverable() const { return m_recoverable; }
    bool retryable() const { return m_retryable; }
    const std::string& code() const { return m_code; }
    Json::Value to_json() const;
    //
    static Media_error device( const std::string& );
    static Media_error unsupported( const std::string& );
    static Media_error from_engine( const boost::system::error_code&,
                                    bool lower_quality_available );
    //
    Media_error();
    Media_error( Error_kind, const std::string&, bool recoverable,
                 bool retryable, const std::string& code = std::string() );
};

bool operator==( const Media_error&, const Media_error& );
std::ostream& operator<<( std::ostream&, const Media_error& );

extern const char* error_kind_name( Error_kind );


/// Thrown when a media configuration is rejected before any engine
/// is touched. Carries the Media_error describing the defect.
///
class Media_config_exception : public Media_exception {
private:
    Media_error m_error;
public:
    explicit Media_config_exception( const Media_error &e ) : m_error(e) {}
    const Media_error& error() const { return m_error; }
    const char* what() const throw() { return "Invalid media configuration"; }
};
