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

#include <string>
#include "engineerror.hpp"

namespace {

class Engine_category : public boost::system::error_category {
public:
    const char* name() const noexcept { return "media_engine"; }
    std::string message( int ev ) const;
};

std::string Engine_category::message( int ev ) const
{
    switch (static_cast<Engine_errc>(ev)) {
    case Engine_errc::success: return "success";
    case Engine_errc::network_unreachable: return "media source unreachable";
    case Engine_errc::timed_out: return "engine bootstrap timed out";
    case Engine_errc::decode_failed: return "media could not be decoded";
    case Engine_errc::unsupported_format: return "media format not supported";
    case Engine_errc::device_unsupported: return "device lacks capability";
    case Engine_errc::permission_denied: return "permission denied";
    case Engine_errc::engine_fault: return "engine fault";
    default:
        return "unknown engine error";
    }
}

}

/// The (unique) category object for Engine_errc values.
///
const boost::system::error_category& engine_category()
{
    static Engine_category instance;
    return instance;
}

boost::system::error_code make_error_code( Engine_errc e )
{
    return boost::system::error_code( static_cast<int>(e), engine_category() );
}
