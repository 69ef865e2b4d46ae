#pragma once

/// Device capability tiers derived from runtime device and network
/// signals.

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
#include "mediaconfig.hpp"

class Config;

enum class Tier {
    low,
    medium,
    high,
    ultra
};

/// Network connection classes as reported by the host environment
enum class Connection_class {
    slow_2g,
    c2g,
    c3g,
    c4g,
    wifi,
    ethernet,
    unknown
};

/// Optional hardware measurements; zero means unknown.
struct Hardware_hints {
    double memory_gb { 0.0 };
    unsigned cpu_cores { 0 };
};

/// Raw signals supplied by the hosting environment for each creation.
///
struct Device_signals {
    bool is_mobile { false };
    bool reduce_animations { false };
    Connection_class connection { Connection_class::unknown };
    Hardware_hints hints {};
    //
    static Device_signals from_config( Config& );
};


/// Resolved capabilities.  Immutable once built by resolve_profile().
///
struct Device_profile {
    Tier tier { Tier::high };
    bool is_mobile { false };
    bool enable_ar { true };
    bool enable_3d { true };
    bool reduce_animations { false };
    Connection_class connection { Connection_class::unknown };
    Video_quality video_quality { Video_quality::q1080p };
    Ar_mode preferred_ar_mode { Ar_mode::automatic };
    unsigned long max_buffer_bytes { 120ul * 1000 * 1000 };
    bool background_video { true };
    bool worker_threads { true };
    //
    Json::Value to_json() const;
};


extern Device_profile resolve_profile( bool is_mobile, bool reduce_animations,
                                       Connection_class,
                                       const Hardware_hints& = Hardware_hints() );
extern Device_profile resolve_profile( const Device_signals& );

extern const char* tier_name( Tier );
extern const char* connection_name( Connection_class );
extern Connection_class strtoconnection( const std::string& );
extern bool is_slow_connection( Connection_class );
