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

#include "arplayer.hpp"
#include "logging.hpp"

/// CTOR
Ar_player::Ar_player( const std::string &id, const Media_config &cfg,
                      const Device_profile &prof,
                      spEngine_provider provider )
    : Base_player(id, cfg, prof, provider)
{ }

/// DTOR
Ar_player::~Ar_player()
{
    try {
        release_handle();
    }
    catch (const std::exception &e) {
        LOG_ERROR(Lgr) << m_id << " AR session close failed: " << e.what();
    }
}

/// Refuse ineligible devices, and configs the optimizer barred.
///
bool Ar_player::precheck( Media_error &err )
{
    if (not m_profile.enable_ar) {
        err = Media_error::device( "AR is not supported on this device" );
        return false;
    }
    const auto &ap = m_config.ar();
    if (ap and not ap->session_allowed) {
        err = Media_error::device( "AR session not allowed for this device" );
        return false;
    }
    return true;
}

/// * May throw Media_exception
void Ar_player::acquire_handle()
{
    m_session = m_provider->make_ar();
    if (not m_session) {
        LOG_ERROR(Lgr) << m_id << " no AR session available";
        throw Media_exception();
    }
}

void Ar_player::open_handle( Progress_handler progress, Done_handler done )
{
    m_session->open( m_config.ar_payload(), progress, done );
}

void Ar_player::release_handle()
{
    close_handle( m_session );
}

/// Start tracking, but only if the session is marked open.
///
void Ar_player::play()
{
    if (not is_ready()) return;
    if (not m_config.ar_payload().is_open) {
        LOG_DEBUG(Lgr) << m_id << " play ignored: session not open";
        return;
    }
    m_session->start();
}

void Ar_player::pause()
{
    if (is_ready()) m_session->pause_tracking();
}

/// End the session and release every loaded model.  Unlike other
/// controls this acts in any phase that still holds a session.  A
/// session still opening is abandoned and the instance fails.
///
void Ar_player::stop()
{
    if (not m_session) return;
    LOG_INFO(Lgr) << m_id << " ending AR session";
    m_session->end();
    if (m_phase == Instance_phase::Initializing) {
        abandon_initialization( Media_error( Error_kind::unknown,
                                             "AR session stopped while opening",
                                             true, true, "stopped" ) );
    }
}

/// {isActive, hasSession, modelsLoaded, isOpen}
///
Json::Value Ar_player::get_state() const
{
    Json::Value jv { Json::objectValue };
    bool live = static_cast<bool>(m_session)
        and (m_phase != Instance_phase::Destroyed);
    jv["isActive"] = live and m_session->active();
    jv["hasSession"] = live and m_session->has_session();
    jv["modelsLoaded"] = live ? m_session->models_loaded() : 0u;
    const auto &ap = m_config.ar();
    jv["isOpen"] = ap ? ap->is_open : false;
    return jv;
}

/// Accepts isOpen.  Opening a Ready session does not start it;
/// closing one pauses tracking.
///
void Ar_player::set_state( const Json::Value &jv )
{
    if (not jv.isObject() or (m_phase == Instance_phase::Destroyed)) return;
    if (jv["isOpen"].isBool() and m_config.ar()) {
        bool open = jv["isOpen"].asBool();
        m_config.ar_payload().is_open = open;
        if (not open and is_ready()) {
            m_session->pause_tracking();
        }
    }
}
