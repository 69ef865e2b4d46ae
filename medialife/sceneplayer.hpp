#pragma once

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

#include "baseplayer.hpp"

/// Real-time 3D viewport.  Play, pause and stop toggle the engine's
/// run flag; seek, volume and fullscreen do nothing.
///
class Scene_player : public Base_player {
private:
    std::unique_ptr<Scene_engine> m_engine {};
protected:
    virtual void acquire_handle();
    virtual void open_handle( Progress_handler, Done_handler );
    virtual void release_handle();
public:
    Scene_player( const std::string&, const Media_config&,
                  const Device_profile&, spEngine_provider );
    virtual ~Scene_player();
    //
    virtual void play();
    virtual void pause();
    virtual void stop();
    virtual Json::Value get_state() const;
    virtual void set_state( const Json::Value& );
};
