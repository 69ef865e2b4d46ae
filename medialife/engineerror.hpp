#pragma once

/// Error codes reported by playback engine backends through their
/// completion handlers.  These plug into boost::system so that a
/// backend may also pass through any other error_code it receives
/// (e.g. from an asio socket), which classifies as Error_kind::unknown.

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

#include <boost/system/error_code.hpp>

enum class Engine_errc {
    success = 0,
    network_unreachable,  // media or asset fetch failed
    timed_out,            // engine bootstrap took too long
    decode_failed,        // media payload could not be decoded
    unsupported_format,   // container/codec/asset format not handled
    device_unsupported,   // the device lacks a required capability
    permission_denied,    // e.g. camera access refused for AR
    engine_fault          // anything else the engine reports
};

const boost::system::error_category& engine_category();

boost::system::error_code make_error_code( Engine_errc );

namespace boost {
namespace system {
    template<>
    struct is_error_code_enum<Engine_errc> {
        static const bool value = true;
    };
}
}
