/**
 * Config optimizer: validate a caller's config, fill unset optional
 * fields from application defaults, then clamp what the device
 * profile cannot support.  Never touches an engine.
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

#include <algorithm>
#include "optimizer.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace {

constexpr unsigned long MobileBufferCap { 30ul * 1000 * 1000 };

void optimize_video( Video_payload &vp, const App_defaults &defs,
                     const Device_profile &prof )
{
    if (not vp.controls) vp.controls = defs.show_controls;
    if (not vp.adaptive) vp.adaptive = defs.adaptive_streaming;
    vp.volume = std::min( 1.0, std::max( 0.0,
                                         vp.volume.value_or(defs.default_volume) ) );
    Video_quality q = vp.quality.value_or( defs.max_video_quality );
    q = std::min( { q, defs.max_video_quality, prof.video_quality } );
    vp.quality = q;
    bool lean = prof.is_mobile or prof.reduce_animations;
    vp.max_buffer_bytes = prof.max_buffer_bytes;
    if (prof.is_mobile) {
        vp.max_buffer_bytes = std::min( vp.max_buffer_bytes, MobileBufferCap );
    }
    vp.back_buffer_secs = lean ? 30 : 90;
    vp.max_buffer_secs = lean ? 60 : 120;
}

void optimize_engine3d( Engine3d_payload &ep, const Device_profile &prof )
{
    switch (prof.tier) {
    case Tier::low:
        ep.antialias = false;
        ep.prefer_gpu = false;
        ep.preload = false;
        ep.high_performance = false;
        break;
    case Tier::medium:
        ep.antialias = true;
        ep.prefer_gpu = true;
        ep.preload = true;
        ep.high_performance = false;
        break;
    default:
        ep.antialias = true;
        ep.prefer_gpu = true;
        ep.preload = true;
        ep.high_performance = true;
        break;
    }
    ep.fill_window = true;
}

void optimize_ar( Ar_payload &ap, const Device_profile &prof )
{
    if (ap.mode == Ar_mode::automatic) {
        ap.mode = prof.preferred_ar_mode;
    }
    bool strong = (prof.tier == Tier::high) or (prof.tier == Tier::ultra);
    ap.performance = strong ? Ar_performance::high : Ar_performance::low;
    ap.max_fps = std::min( ap.max_fps, strong ? 60u : 30u );
    if (prof.reduce_animations) {
        ap.max_fps = std::min( ap.max_fps, 30u );
    }
    ap.lighting = (prof.tier != Tier::low);
    ap.occlusion = strong;
    ap.session_allowed = prof.enable_ar;
    if (not prof.enable_ar) {
        ap.mode = Ar_mode::object;
    }
}

}

/// Read the Media_defaults section.
/// * May throw Config_error
///
App_defaults App_defaults::from_config( Config &cfg )
{
    App_defaults defs {};
    cfg.get_bool( "Media_defaults", "default_active", defs.default_active );
    cfg.get_bool( "Media_defaults", "show_controls", defs.show_controls );
    cfg.get_bool( "Media_defaults", "adaptive_streaming",
                  defs.adaptive_streaming );
    std::string qstr {};
    if (cfg.get_string( "Media_defaults", "max_video_quality", qstr )) {
        try {
            defs.max_video_quality = strtoquality( qstr );
        } catch (const Media_exception&) {
            LOG_ERROR(Lgr) << "Config Media_defaults.max_video_quality invalid";
            throw Config_error();
        }
    }
    if (cfg.get_double( "Media_defaults", "default_volume",
                        defs.default_volume )) {
        defs.default_volume = std::min( 1.0, std::max( 0.0, defs.default_volume ) );
    }
    return defs;
}

/// Produce the effective config for a player from what the caller asked
/// for.  The input is not modified.
/// * May throw Media_config_exception (kind unsupported)
///
Media_config optimize( const Media_config &user_cfg,
                       const App_defaults &defs,
                       const Device_profile &prof )
{
    user_cfg.validate();
    Media_config cfg { user_cfg };
    if (not cfg.active_flag()) {
        cfg.set_active( defs.default_active );
    }
    switch (cfg.type()) {
    case Media_type::video:
        optimize_video( cfg.video_payload(), defs, prof );
        break;
    case Media_type::engine3d:
        optimize_engine3d( cfg.engine3d_payload(), prof );
        break;
    case Media_type::ar:
        optimize_ar( cfg.ar_payload(), prof );
        break;
    }
    LOG_DEBUG(Lgr) << "Optimized " << media_type_name(cfg.type())
                   << " config for tier " << tier_name(prof.tier);
    return cfg;
}
