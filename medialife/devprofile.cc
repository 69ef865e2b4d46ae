/**
 * Device profile resolution.
 *
 * Tier selection:
 *   - A slow connection (slow-2g, 2g) always forces the low tier.
 *   - Mobile: >=8GB or >=8 cores high; >=4GB or >=4 cores medium;
 *     both hints known and below that is low-end, i.e. low tier;
 *     unknown hardware is medium.
 *   - Desktop: >=16GB and >=8 cores ultra; >=8GB or >=6 cores high;
 *     >=4GB or >=4 cores medium; anything else (or unknown) high.
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

#include "devprofile.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace {

constexpr unsigned long MB { 1000ul * 1000 };

/// Per-tier capability rows
struct Tier_row {
    Tier tier;
    Video_quality quality;
    bool enable_3d;
    bool enable_ar;
    Ar_mode ar_mode;
    unsigned long buffer_bytes;
    bool background_video;
    bool worker_threads;
};

const Tier_row TierTable[] {
    { Tier::low,    Video_quality::q480p,  false, false, Ar_mode::object,
      30*MB,  false, false },
    { Tier::medium, Video_quality::q720p,  true,  true,  Ar_mode::object,
      60*MB,  true,  true },
    { Tier::high,   Video_quality::q1080p, true,  true,  Ar_mode::automatic,
      120*MB, true,  true },
    { Tier::ultra,  Video_quality::q4k,    true,  true,  Ar_mode::automatic,
      240*MB, true,  true },
};

const Tier_row& tier_row( Tier t )
{
    for (const Tier_row &row : TierTable) {
        if (row.tier == t) return row;
    }
    return TierTable[0];
}

Tier mobile_tier( const Hardware_hints &h )
{
    bool mem_known = (h.memory_gb > 0.0);
    bool cpu_known = (h.cpu_cores > 0);
    if ((h.memory_gb >= 8.0) or (h.cpu_cores >= 8)) return Tier::high;
    if ((h.memory_gb >= 4.0) or (h.cpu_cores >= 4)) return Tier::medium;
    if (mem_known and cpu_known) return Tier::low;  // low-end mobile
    return Tier::medium;
}

Tier desktop_tier( const Hardware_hints &h )
{
    if ((h.memory_gb >= 16.0) and (h.cpu_cores >= 8)) return Tier::ultra;
    if ((h.memory_gb >= 8.0) or (h.cpu_cores >= 6)) return Tier::high;
    if ((h.memory_gb >= 4.0) or (h.cpu_cores >= 4)) return Tier::medium;
    return Tier::high;
}

}

const char* tier_name( Tier t )
{
    switch(t) {
    case Tier::low: return "low";
    case Tier::medium: return "medium";
    case Tier::high: return "high";
    case Tier::ultra: return "ultra";
    default: return "?";
    }
}

const char* connection_name( Connection_class c )
{
    switch(c) {
    case Connection_class::slow_2g: return "slow-2g";
    case Connection_class::c2g: return "2g";
    case Connection_class::c3g: return "3g";
    case Connection_class::c4g: return "4g";
    case Connection_class::wifi: return "wifi";
    case Connection_class::ethernet: return "ethernet";
    default: return "unknown";
    }
}

/// Parse a connection class name; unrecognized names are unknown.
/// * Will not throw
///
Connection_class strtoconnection( const std::string &s )
{
    if (s == "slow-2g") return Connection_class::slow_2g;
    if (s == "2g") return Connection_class::c2g;
    if (s == "3g") return Connection_class::c3g;
    if (s == "4g") return Connection_class::c4g;
    if (s == "wifi") return Connection_class::wifi;
    if (s == "ethernet") return Connection_class::ethernet;
    if (s != "unknown") {
        LOG_WARNING(Lgr) << "Unrecognized connection class '" << s
                         << "' treated as unknown";
    }
    return Connection_class::unknown;
}

bool is_slow_connection( Connection_class c )
{
    return (c == Connection_class::slow_2g) or (c == Connection_class::c2g);
}

/// Resolve a device profile.  Pure: no side effects, no failure.
///
Device_profile resolve_profile( bool is_mobile, bool reduce_animations,
                                Connection_class conn,
                                const Hardware_hints &hints )
{
    Tier tier { Tier::low };
    if (not is_slow_connection(conn)) {
        tier = is_mobile ? mobile_tier(hints) : desktop_tier(hints);
    }
    const Tier_row &row = tier_row( tier );
    Device_profile prof {};
    prof.tier = tier;
    prof.is_mobile = is_mobile;
    prof.enable_ar = row.enable_ar;
    prof.enable_3d = row.enable_3d;
    prof.reduce_animations = reduce_animations or (tier == Tier::low);
    prof.connection = conn;
    prof.video_quality = row.quality;
    prof.preferred_ar_mode = row.ar_mode;
    prof.max_buffer_bytes = row.buffer_bytes;
    prof.background_video = row.background_video;
    prof.worker_threads = row.worker_threads;
    return prof;
}

Device_profile resolve_profile( const Device_signals &sig )
{
    return resolve_profile( sig.is_mobile, sig.reduce_animations,
                            sig.connection, sig.hints );
}

/// Read the Device section of the configuration.  Missing parameters
/// leave the defaults (desktop, unknown connection, unknown hardware).
/// * May throw Config_error
///
Device_signals Device_signals::from_config( Config &cfg )
{
    Device_signals sig {};
    cfg.get_bool( "Device", "mobile", sig.is_mobile );
    cfg.get_bool( "Device", "reduce_animations", sig.reduce_animations );
    std::string cstr {"unknown"};
    cfg.get_string( "Device", "connection", cstr );
    sig.connection = strtoconnection( cstr );
    double mem {0.0};
    cfg.get_double( "Device", "memory_gb", mem );
    sig.hints.memory_gb = mem;
    unsigned cores {0};
    cfg.get_unsigned( "Device", "cpu_cores", cores );
    sig.hints.cpu_cores = cores;
    return sig;
}

Json::Value Device_profile::to_json() const
{
    Json::Value jv { Json::objectValue };
    jv["tier"] = tier_name(tier);
    jv["isMobile"] = is_mobile;
    jv["enableAR"] = enable_ar;
    jv["enable3D"] = enable_3d;
    jv["reduceAnimations"] = reduce_animations;
    jv["connection"] = connection_name(connection);
    jv["videoQuality"] = quality_name(video_quality);
    jv["preferredARMode"] = ar_mode_name(preferred_ar_mode);
    jv["maxBufferBytes"] = Json::UInt64(max_buffer_bytes);
    jv["backgroundVideo"] = background_video;
    jv["workerThreads"] = worker_threads;
    return jv;
}
