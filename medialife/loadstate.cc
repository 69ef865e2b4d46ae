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
#include <jsoncpp/json/json.h>
#include "loadstate.hpp"

const char* load_stage_name( Load_stage st )
{
    switch(st) {
    case Load_stage::initializing: return "initializing";
    case Load_stage::loading: return "loading";
    case Load_stage::processing: return "processing";
    case Load_stage::ready: return "ready";
    case Load_stage::error: return "error";
    default: return "unknown";
    }
}

/// Start a new attempt: loading, progress back to zero.
///
void Loading_state::begin( const std::string &msg )
{
    m_loading = true;
    m_progress = 0.0;
    m_stage = Load_stage::initializing;
    m_message = msg;
}

/// Report progress p (clamped to [0,1]) at stage st.  Values lower
/// than the current progress are ignored.  Returns true iff the
/// progress value increased.
///
bool Loading_state::advance( double p, Load_stage st, const std::string &msg )
{
    if (not m_loading) { return false; }
    p = std::min( 1.0, std::max( 0.0, p ) );
    m_stage = st;
    if (not msg.empty()) { m_message = msg; }
    if (p > m_progress) {
        m_progress = p;
        return true;
    }
    return false;
}

/// Attempt succeeded
void Loading_state::finish_ready()
{
    m_loading = false;
    m_progress = 1.0;
    m_stage = Load_stage::ready;
    m_message.clear();
}

/// Attempt failed; progress is left where it stopped.
void Loading_state::finish_error( const std::string &msg )
{
    m_loading = false;
    m_stage = Load_stage::error;
    m_message = msg;
}

void Loading_state::clear()
{
    *this = Loading_state();
}

Json::Value Loading_state::to_json() const
{
    Json::Value jv { Json::objectValue };
    jv["isLoading"] = m_loading;
    jv["progress"] = m_progress;
    jv["stage"] = load_stage_name(m_stage);
    jv["message"] = m_message;
    return jv;
}
