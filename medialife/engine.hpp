#pragma once

/**
 * Playback engine seam.  Each player owns exactly one engine handle,
 * obtained fresh from an Engine_provider for every initialization.
 * Handles report bootstrap progress and completion asynchronously via
 * the handlers given to open(); completion carries an error_code in
 * the engine category (see engineerror.hpp) or any other category.
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

#include <functional>
#include <memory>
#include <string>
#include <boost/system/error_code.hpp>
#include "mediaconfig.hpp"

/// Progress during bootstrap: fraction in [0,1] and a stage message
using Progress_handler = std::function<void(double, const std::string&)>;

/// Bootstrap finished; a false error_code means success
using Done_handler = std::function<void(const boost::system::error_code&)>;

using End_handler = std::function<void()>;


/// Common part of all native handles.
///
class Engine_handle {
public:
    virtual ~Engine_handle()=0;
    /// Release native resources. Handlers given to open() must not be
    /// invoked afterward.
    /// * May throw (any std::exception) if the engine misbehaves
    virtual void close()=0;
};


/// Video decoder / element.
///
class Video_decoder : public Engine_handle {
public:
    virtual void open( const Video_payload&, Progress_handler, Done_handler )=0;
    virtual void play()=0;
    virtual void pause()=0;
    virtual void seek( double )=0;
    virtual void set_volume( double )=0;
    virtual void set_muted( bool )=0;
    virtual bool fullscreen_available() const=0;
    virtual void set_fullscreen( bool )=0;
    virtual void on_ended( End_handler )=0;
    //
    virtual double current_time() const=0;
    virtual double duration() const=0;
    virtual bool paused() const=0;
    virtual double volume() const=0;
    virtual bool muted() const=0;
    virtual bool fullscreen() const=0;
};


/// Frame statistics sampled from a 3D engine
struct Frame_stats {
    double fps { 0.0 };
    unsigned draw_calls { 0 };
};

/// 3D engine application plus scene.
///
class Scene_engine : public Engine_handle {
public:
    virtual void open( const Engine3d_payload&, Progress_handler, Done_handler )=0;
    virtual void set_running( bool )=0;
    virtual bool running() const=0;
    virtual Frame_stats frame_stats() const=0;
};


/// AR session plus loaded model references.
///
class Ar_session : public Engine_handle {
public:
    /// Open the session and load every model named by the payload
    virtual void open( const Ar_payload&, Progress_handler, Done_handler )=0;
    virtual void start()=0;
    virtual void pause_tracking()=0;
    /// End the session and release all loaded models.  A pending
    /// open() is abandoned; its completion never arrives.
    virtual void end()=0;
    virtual bool active() const=0;
    virtual bool has_session() const=0;
    virtual unsigned models_loaded() const=0;
};


/// Manufactures fresh, exclusively owned engine handles.
///
class Engine_provider {
public:
    virtual ~Engine_provider()=0;
    virtual std::unique_ptr<Video_decoder> make_video()=0;
    virtual std::unique_ptr<Scene_engine> make_scene()=0;
    virtual std::unique_ptr<Ar_session> make_ar()=0;
};

using spEngine_provider = std::shared_ptr<Engine_provider>;
