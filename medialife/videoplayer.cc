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
#include "videoplayer.hpp"
#include "logging.hpp"


/// CTOR
Video_player::Video_player( const std::string &id, const Media_config &cfg,
                            const Device_profile &prof,
                            spEngine_provider provider )
    : Base_player(id, cfg, prof, provider)
{ }

/// DTOR
Video_player::~Video_player()
{
    try {
        release_handle();
    }
    catch (const std::exception &e) {
        LOG_ERROR(Lgr) << m_id << " decoder close failed: " << e.what();
    }
}

/// Obtain a fresh decoder.
/// * May throw Media_exception
///
void Video_player::acquire_handle()
{
    m_decoder = m_provider->make_video();
    if (not m_decoder) {
        LOG_ERROR(Lgr) << m_id << " no video decoder available";
        throw Media_exception();
    }
}

void Video_player::open_handle( Progress_handler progress, Done_handler done )
{
    std::weak_ptr<unsigned> wk { attempt_token() };
    m_decoder->on_ended( [this,wk]() {
            if (wk.lock()) notify_ended();
        });
    m_decoder->open( m_config.video_payload(), progress, done );
}

/// * May throw (from the engine)
void Video_player::release_handle()
{
    close_handle( m_decoder );
}

/// A decode failure may be retried if there is a lower quality to try.
///
bool Video_player::lower_quality_available() const
{
    const auto &vp = m_config.video();
    return vp and vp->quality and (*vp->quality > Video_quality::q480p);
}

/// Apply configured volume and mute, then honor autoplay.
///
void Video_player::on_ready()
{
    const Video_payload &vp = m_config.video_payload();
    m_decoder->set_volume( vp.volume.value_or(1.0) );
    m_decoder->set_muted( vp.muted );
    if (vp.autoplay) {
        m_decoder->play();
    }
}

/// Looping media restart rather than ending.
///
void Video_player::on_ended()
{
    if (m_config.video_payload().loop) {
        LOG_DEBUG(Lgr) << m_id << " looping";
        m_decoder->seek( 0.0 );
        m_decoder->play();
        return;
    }
    Base_player::on_ended();
}

void Video_player::play()
{
    if (not is_ready()) return;
    m_decoder->play();
}

void Video_player::pause()
{
    if (not is_ready()) return;
    m_decoder->pause();
}

/// Pause and rewind
void Video_player::stop()
{
    if (not is_ready()) return;
    m_decoder->pause();
    m_decoder->seek( 0.0 );
}

/// Seek to t seconds, clamped to the media
///
void Video_player::seek( double t )
{
    if (not is_ready()) return;
    double d = m_decoder->duration();
    t = std::max( 0.0, t );
    if (d > 0.0) { t = std::min( t, d ); }
    m_decoder->seek( t );
}

/// Volume in [0,1]
///
void Video_player::set_volume( double v )
{
    if (not is_ready()) return;
    m_decoder->set_volume( std::min( 1.0, std::max( 0.0, v ) ) );
}

/// Only acts if the platform offers fullscreen.
///
void Video_player::toggle_fullscreen()
{
    if (not is_ready()) return;
    if (not m_decoder->fullscreen_available()) {
        LOG_DEBUG(Lgr) << m_id << " fullscreen not available";
        return;
    }
    m_decoder->set_fullscreen( not m_decoder->fullscreen() );
}

/// {currentTime, duration, paused, volume, muted, fullscreen}
///
Json::Value Video_player::get_state() const
{
    Json::Value jv { Json::objectValue };
    if (is_ready()) {
        jv["currentTime"] = m_decoder->current_time();
        jv["duration"] = m_decoder->duration();
        jv["paused"] = m_decoder->paused();
        jv["volume"] = m_decoder->volume();
        jv["muted"] = m_decoder->muted();
        jv["fullscreen"] = m_decoder->fullscreen();
    } else {
        const auto &vp = m_config.video();
        jv["currentTime"] = 0.0;
        jv["duration"] = 0.0;
        jv["paused"] = true;
        jv["volume"] = (vp ? vp->volume.value_or(1.0) : 1.0);
        jv["muted"] = (vp ? vp->muted : false);
        jv["fullscreen"] = false;
    }
    return jv;
}

/// Accepts currentTime, volume, muted.  Others are ignored.
///
void Video_player::set_state( const Json::Value &jv )
{
    if (not is_ready() or not jv.isObject()) return;
    if (jv["currentTime"].isNumeric()) {
        seek( jv["currentTime"].asDouble() );
    }
    if (jv["volume"].isNumeric()) {
        set_volume( jv["volume"].asDouble() );
    }
    if (jv["muted"].isBool()) {
        m_decoder->set_muted( jv["muted"].asBool() );
    }
}
