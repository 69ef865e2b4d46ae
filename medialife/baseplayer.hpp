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

#include "player.hpp"
#include "engine.hpp"


/// Base class for the media players.  Implements the instance state
/// machine shared by all of them:
///
///   Uninitialized -> Initializing -> Ready | Failed -> Destroyed
///
/// Subclasses own the typed engine handle and supply the hooks.
/// Not instantiable.
///
class Base_player : public Player {
private:
    std::shared_ptr<unsigned> m_attempt {};  // liveness of current attempt
    void handle_progress( double, const std::string& );
    void handle_done( const boost::system::error_code& );
    void fail( const Media_error& );
protected:
    std::string m_id;
    Media_config m_config;
    Device_profile m_profile;
    spEngine_provider m_provider;
    Instance_phase m_phase { Instance_phase::Uninitialized };
    boost::optional<Media_error> m_error {};
    Loading_state m_loading {};
    Player_callbacks m_callbacks {};
    //
    bool is_ready() const { return m_phase == Instance_phase::Ready; }
    std::weak_ptr<unsigned> attempt_token() const { return m_attempt; }
    void notify_ended();
    void abandon_initialization( const Media_error& );
    /// Hooks
    virtual bool precheck( Media_error& ) { return true; }
    virtual void acquire_handle()=0;
    virtual void open_handle( Progress_handler, Done_handler )=0;
    virtual void release_handle()=0;
    virtual bool lower_quality_available() const { return false; }
    virtual void on_ready() {}
    virtual void on_ended();
    //
    /// Close and drop a handle.  The handle is freed even if close throws.
    template<class H> static void close_handle( std::unique_ptr<H> &h ) {
        if (h) {
            std::unique_ptr<H> doomed { std::move(h) };
            doomed->close();
        }
    }
public:
    Base_player( const std::string&, const Media_config&,
                 const Device_profile&, spEngine_provider );
    virtual ~Base_player();
    Base_player(const Base_player&) = delete;
    void operator=(Base_player const&) = delete;
    //
    virtual const std::string& id() const { return m_id; }
    virtual Media_type type() const { return m_config.type(); }
    virtual Instance_phase phase() const { return m_phase; }
    virtual const Media_config& config() const { return m_config; }
    virtual const Device_profile& profile() const { return m_profile; }
    virtual const boost::optional<Media_error>& error() const { return m_error; }
    virtual const Loading_state& loading_state() const { return m_loading; }
    //
    virtual void initialize( const Player_callbacks& );
    virtual void cleanup();
    virtual void evict();
    virtual void reset();
    //
    virtual void seek( double ) {}
    virtual void set_volume( double ) {}
    virtual void toggle_fullscreen() {}
};
