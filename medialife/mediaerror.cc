/**
 * Methods for Media_error and helpers naming the common enums.
 */

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

#include <ostream>
#include <jsoncpp/json/json.h>
#include "mediaerror.hpp"
#include "engineerror.hpp"
#include "logging.hpp"

//////////////////////////// Utility ////////////////////////////////////

/// String canonically naming a media type.
/// * Will not throw
///
const char* media_type_name( Media_type t )
{
    switch(t) {
    case Media_type::video: return "video";
    case Media_type::engine3d: return "engine3d";
    case Media_type::ar: return "ar";
    default: return "unknown";
    }
}

/// Convert a type string to a Media_type. This is case *sensitive*.
/// "playcanvas" is accepted as an older name for engine3d.
/// * May throw Media_type_exception
///
Media_type strtomediatype( const std::string &s )
{
    if (s == "video") {
        return Media_type::video;
    } else if ((s == "engine3d") or (s == "playcanvas")) {
        return Media_type::engine3d;
    } else if (s == "ar") {
        return Media_type::ar;
    }
    LOG_ERROR(Lgr) << "Unknown media type '" << s << "'";
    throw Media_type_exception();
}

/// Name an instance phase.
///
const char* phase_name( Instance_phase ph )
{
    switch(ph) {
    case Instance_phase::Uninitialized: return "Uninitialized";
    case Instance_phase::Initializing: return "Initializing";
    case Instance_phase::Ready: return "Ready";
    case Instance_phase::Failed: return "Failed";
    case Instance_phase::Destroyed: return "Destroyed";
    default: return "unknown";
    }
}

/// Name an error kind.
///
const char* error_kind_name( Error_kind k )
{
    switch(k) {
    case Error_kind::device: return "device";
    case Error_kind::network: return "network";
    case Error_kind::decode: return "decode";
    case Error_kind::unsupported: return "unsupported";
    case Error_kind::unknown: return "unknown";
    default: return "?";
    }
}

//////////////////////////// Media_error ////////////////////////////////

/// Default: an unknown, retryable error with no message
///
Media_error::Media_error()
{ }

/// CTOR. A retryable error is always recoverable.
///
Media_error::Media_error( Error_kind k, const std::string &msg,
                          bool recoverable, bool retryable,
                          const std::string &code )
    : m_kind(k),
      m_message(msg),
      m_recoverable(recoverable or retryable),
      m_retryable(retryable),
      m_code(code)
{
    if (retryable and not recoverable) {
        LOG_WARNING(Lgr) << "Media_error '" << msg
                         << "' is retryable; marking it recoverable";
    }
}

/// Capability missing on this device: never recoverable or retryable.
///
Media_error Media_error::device( const std::string &msg )
{
    return Media_error( Error_kind::device, msg, false, false, "device" );
}

/// Invalid configuration shape: never recoverable or retryable.
///
Media_error Media_error::unsupported( const std::string &msg )
{
    return Media_error( Error_kind::unsupported, msg, false, false,
                        "unsupported" );
}

/// Classify an engine completion error.  A decode failure is retryable
/// only if the caller could fall back to a lower quality.  Error codes
/// from foreign categories are treated as unknown (retryable).
///
Media_error Media_error::from_engine( const boost::system::error_code &ec,
                                      bool lower_quality_available )
{
    std::string msg { ec.message() };
    if (ec.category() != engine_category()) {
        return Media_error( Error_kind::unknown, msg, true, true,
                            ec.category().name() );
    }
    switch (static_cast<Engine_errc>(ec.value())) {
    case Engine_errc::network_unreachable:
    case Engine_errc::timed_out:
        return Media_error( Error_kind::network, msg, true, true, "network" );
    case Engine_errc::decode_failed:
    case Engine_errc::unsupported_format:
        return Media_error( Error_kind::decode, msg, true,
                            lower_quality_available, "decode" );
    case Engine_errc::device_unsupported:
    case Engine_errc::permission_denied:
        return Media_error( Error_kind::device, msg, false, false, "device" );
    default:
        return Media_error( Error_kind::unknown, msg, true, true, "engine" );
    }
}

/// Render as a JSON object for get_state()
///
Json::Value Media_error::to_json() const
{
    Json::Value jv { Json::objectValue };
    jv["type"] = error_kind_name(m_kind);
    jv["message"] = m_message;
    jv["recoverable"] = m_recoverable;
    jv["retryable"] = m_retryable;
    if (not m_code.empty()) {
        jv["code"] = m_code;
    }
    return jv;
}

bool operator==( const Media_error &a, const Media_error &b )
{
    return (a.kind() == b.kind())
        and (a.message() == b.message())
        and (a.recoverable() == b.recoverable())
        and (a.retryable() == b.retryable());
}

std::ostream& operator<<( std::ostream &os, const Media_error &e )
{
    os << error_kind_name(e.kind()) << " error: " << e.message()
       << " (recoverable=" << (e.recoverable() ? 'y' : 'n')
       << ", retryable=" << (e.retryable() ? 'y' : 'n') << ")";
    return os;
}
