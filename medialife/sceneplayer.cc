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

#include "sceneplayer.hpp"
#include "logging.hpp"

/// CTOR
Scene_player::Scene_player( const std::string &id, const Media_config &cfg,
                            const Device_profile &prof,
                            spEngine_provider provider )
    : Base_player(id, cfg, prof, provider)
{ }

/// DTOR
Scene_player::~Scene_player()
{
    try {
        release_handle();
    }
    catch (const std::exception &e) {
        LOG_ERROR(Lgr) << m_id << " scene engine close failed: " << e.what();
    }
}

/// * May throw Media_exception
void Scene_player::acquire_handle()
{
    m_engine = m_provider->make_scene();
    if (not m_engine) {
        LOG_ERROR(Lgr) << m_id << " no 3D engine available";
        throw Media_exception();
    }
}

void Scene_player::open_handle( Progress_handler progress, Done_handler done )
{
    m_engine->open( m_config.engine3d_payload(), progress, done );
}

void Scene_player::release_handle()
{
    close_handle( m_engine );
}

void Scene_player::play()
{
    if (is_ready()) m_engine->set_running( true );
}

void Scene_player::pause()
{
    if (is_ready()) m_engine->set_running( false );
}

void Scene_player::stop()
{
    if (is_ready()) m_engine->set_running( false );
}

/// {isRunning, fps, drawCalls} from the engine's frame statistics
///
Json::Value Scene_player::get_state() const
{
    Json::Value jv { Json::objectValue };
    Frame_stats fs {};
    bool running { false };
    if (is_ready()) {
        fs = m_engine->frame_stats();
        running = m_engine->running();
    }
    jv["isRunning"] = running;
    jv["fps"] = fs.fps;
    jv["drawCalls"] = fs.draw_calls;
    return jv;
}

/// Accepts isRunning
void Scene_player::set_state( const Json::Value &jv )
{
    if (not is_ready() or not jv.isObject()) return;
    if (jv["isRunning"].isBool()) {
        m_engine->set_running( jv["isRunning"].asBool() );
    }
}
