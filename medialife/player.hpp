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

#include <functional>
#include <memory>
#include <string>
#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>
#include "common.hpp"
#include "mediaconfig.hpp"
#include "mediaerror.hpp"
#include "loadstate.hpp"
#include "devprofile.hpp"


/// Notifications from a player to whoever drives it.  Any may be empty.
///   progress : loading state changed during initialization
///   settled  : initialization finished; none means Ready
///   ended    : playback reached the end of the media
///
struct Player_callbacks {
    std::function<void(const Loading_state&)> progress {};
    std::function<void(const boost::optional<Media_error>&)> settled {};
    std::function<void()> ended {};
    std::function<void()> evicted {};   // after memory eviction destroyed it
};


/**
 * Abstract Player interface: one live wrapper around one native
 * engine handle.  Control operations that make no sense for a
 * particular media type are no-ops, as are all controls on an
 * instance that is not Ready.
 */
class Player {
public:
    virtual ~Player()=0;
    //
    virtual const std::string& id() const = 0;
    virtual Media_type type() const = 0;
    virtual Instance_phase phase() const = 0;
    virtual const Media_config& config() const = 0;
    virtual const Device_profile& profile() const = 0;
    virtual const boost::optional<Media_error>& error() const = 0;
    virtual const Loading_state& loading_state() const = 0;
    //
    virtual void initialize( const Player_callbacks& )=0;
    virtual void cleanup()=0;
    virtual void evict()=0;
    virtual void reset()=0;
    //
    virtual void play()=0;
    virtual void pause()=0;
    virtual void stop()=0;
    virtual void seek( double )=0;
    virtual void set_volume( double )=0;
    virtual void toggle_fullscreen()=0;
    virtual Json::Value get_state() const = 0;
    virtual void set_state( const Json::Value& )=0;
};

/// Shared pointer to a Player.
using spPlayer = std::shared_ptr<Player>;
