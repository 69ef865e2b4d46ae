/**
 * Silent engines.  Each handle runs a simulated bootstrap on a
 * deadline_timer.  Pending timer handlers hold only a weak reference
 * to the handle's liveness token, so a closed or destroyed handle is
 * never called back into.
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
#include <chrono>
#include "silentengine.hpp"
#include "engineerror.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace bpt = boost::posix_time;

/// Pro forma destructors for the pure interfaces
Engine_handle::~Engine_handle() { }
Engine_provider::~Engine_provider() { }

namespace {

/// Liveness token: handlers proceed only while the weak ref locks
using Token = std::shared_ptr<int>;


/// Timer-driven bootstrap shared by all silent handles.
///
class Silent_bootstrap {
private:
    boost::asio::io_service &m_io;
    unsigned m_ms;
    std::shared_ptr<boost::asio::deadline_timer> m_timer;
    Token m_token { std::make_shared<int>(0) };
public:
    Silent_bootstrap( boost::asio::io_service &io, unsigned ms )
        : m_io(io), m_ms(ms),
          m_timer( std::make_shared<boost::asio::deadline_timer>(io) ) {}
    ~Silent_bootstrap() { cancel(); }
    boost::asio::io_service& io() { return m_io; }
    const Token& token() const { return m_token; }
    //
    void start( Progress_handler, Done_handler, std::function<void()> on_ok );
    void cancel();
};

/// Post initial progress, then complete after the bootstrap delay.
/// on_ok runs just before a successful completion is reported.
///
void Silent_bootstrap::start( Progress_handler progress, Done_handler done,
                              std::function<void()> on_ok )
{
    std::weak_ptr<int> wk { m_token };
    m_io.post( [wk,progress]() {
            if (wk.lock() and progress) progress( 0.1, "loading" );
        });
    auto timer = m_timer;   // keep the timer alive for the handler
    m_timer->expires_from_now( bpt::milliseconds(m_ms) );
    m_timer->async_wait(
        [wk,timer,progress,done,on_ok]( const boost::system::error_code &ec ) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (not wk.lock()) return;
            if (progress) progress( 0.9, "processing" );
            if (not wk.lock()) return;
            if (on_ok) on_ok();
            if (done) done( make_error_code(Engine_errc::success) );
        });
}

/// Drop pending handlers
void Silent_bootstrap::cancel()
{
    m_token = std::make_shared<int>(0);
    boost::system::error_code ec;
    m_timer->cancel( ec );
}

////////////////////////////////////////////////////////////////////////////

class Silent_video : public Video_decoder {
private:
    using Clock = std::chrono::steady_clock;
    Silent_bootstrap m_boot;
    Silent_options m_opts;
    boost::asio::deadline_timer m_end_timer;
    End_handler m_ended {};
    bool m_open { false };
    bool m_paused { true };
    bool m_muted { false };
    bool m_fullscreen { false };
    double m_volume { 1.0 };
    double m_pos { 0.0 };
    Clock::time_point m_started {};
    void arm_end_timer();
public:
    Silent_video( boost::asio::io_service &io, const Silent_options &opts )
        : m_boot(io, opts.bootstrap_ms), m_opts(opts), m_end_timer(io) {}
    virtual ~Silent_video() { close(); }
    //
    virtual void open( const Video_payload&, Progress_handler, Done_handler );
    virtual void close();
    virtual void play();
    virtual void pause();
    virtual void seek( double t );
    virtual void set_volume( double v ) { m_volume = v; }
    virtual void set_muted( bool m ) { m_muted = m; }
    virtual bool fullscreen_available() const { return m_opts.fullscreen; }
    virtual void set_fullscreen( bool f ) { m_fullscreen = f; }
    virtual void on_ended( End_handler h ) { m_ended = h; }
    //
    virtual double current_time() const;
    virtual double duration() const { return m_opts.clip_secs; }
    virtual bool paused() const { return m_paused; }
    virtual double volume() const { return m_volume; }
    virtual bool muted() const { return m_muted; }
    virtual bool fullscreen() const { return m_fullscreen; }
};

void Silent_video::open( const Video_payload &vp, Progress_handler progress,
                         Done_handler done )
{
    LOG_DEBUG(Lgr) << "Silent_video opening " << vp.url;
    m_muted = vp.muted;
    m_boot.start( progress, done, [this]() { m_open = true; } );
}

void Silent_video::close()
{
    m_boot.cancel();
    boost::system::error_code ec;
    m_end_timer.cancel( ec );
    m_ended = nullptr;
    m_open = false;
    m_paused = true;
}

/// Position in seconds, capped at the clip length if there is one
///
double Silent_video::current_time() const
{
    double t = m_pos;
    if (not m_paused) {
        std::chrono::duration<double> dt = Clock::now() - m_started;
        t += dt.count();
    }
    if (m_opts.clip_secs > 0) {
        t = std::min( t, double(m_opts.clip_secs) );
    }
    return t;
}

void Silent_video::play()
{
    if (not m_open or not m_paused) return;
    m_paused = false;
    m_started = Clock::now();
    arm_end_timer();
}

void Silent_video::pause()
{
    if (m_paused) return;
    m_pos = current_time();
    m_paused = true;
    boost::system::error_code ec;
    m_end_timer.cancel( ec );
}

void Silent_video::seek( double t )
{
    bool was_playing = not m_paused;
    pause();
    m_pos = std::max( 0.0, t );
    if (m_opts.clip_secs > 0) {
        m_pos = std::min( m_pos, double(m_opts.clip_secs) );
    }
    if (was_playing) play();
}

/// Endless clips never end.
///
void Silent_video::arm_end_timer()
{
    if (m_opts.clip_secs == 0) return;
    double remaining = double(m_opts.clip_secs) - current_time();
    std::weak_ptr<int> wk { m_boot.token() };
    m_end_timer.expires_from_now(
        bpt::milliseconds( static_cast<long>(remaining * 1000.0) ) );
    m_end_timer.async_wait( [this,wk]( const boost::system::error_code &ec ) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (not wk.lock()) return;
            m_pos = m_opts.clip_secs;
            m_paused = true;
            if (m_ended) m_ended();
        });
}

////////////////////////////////////////////////////////////////////////////

class Silent_scene : public Scene_engine {
private:
    Silent_bootstrap m_boot;
    bool m_open { false };
    bool m_running { false };
    unsigned m_draw_calls { 0 };
public:
    Silent_scene( boost::asio::io_service &io, const Silent_options &opts )
        : m_boot(io, opts.bootstrap_ms) {}
    virtual ~Silent_scene() { close(); }
    //
    virtual void open( const Engine3d_payload&, Progress_handler, Done_handler );
    virtual void close();
    virtual void set_running( bool r ) { m_running = m_open and r; }
    virtual bool running() const { return m_running; }
    virtual Frame_stats frame_stats() const;
};

/// The engine starts running as soon as the scene is up.
///
void Silent_scene::open( const Engine3d_payload &ep, Progress_handler progress,
                         Done_handler done )
{
    unsigned nodes = ep.scene_config.isObject() ? ep.scene_config.size() : 0;
    LOG_DEBUG(Lgr) << "Silent_scene opening project '" << ep.project_id << "'";
    m_boot.start( progress, done, [this,nodes]() {
            m_open = true;
            m_running = true;
            m_draw_calls = 1 + nodes;
        });
}

void Silent_scene::close()
{
    m_boot.cancel();
    m_open = false;
    m_running = false;
}

Frame_stats Silent_scene::frame_stats() const
{
    Frame_stats fs {};
    if (m_running) {
        fs.fps = 60.0;
        fs.draw_calls = m_draw_calls;
    }
    return fs;
}

////////////////////////////////////////////////////////////////////////////

class Silent_ar : public Ar_session {
private:
    Silent_bootstrap m_boot;
    bool m_session { false };
    bool m_active { false };
    unsigned m_models { 0 };
public:
    Silent_ar( boost::asio::io_service &io, const Silent_options &opts )
        : m_boot(io, opts.bootstrap_ms) {}
    virtual ~Silent_ar() { close(); }
    //
    virtual void open( const Ar_payload&, Progress_handler, Done_handler );
    virtual void close();
    virtual void start() { m_active = m_session; }
    virtual void pause_tracking() { m_active = false; }
    virtual void end();
    virtual bool active() const { return m_active; }
    virtual bool has_session() const { return m_session; }
    virtual unsigned models_loaded() const { return m_models; }
};

void Silent_ar::open( const Ar_payload &ap, Progress_handler progress,
                      Done_handler done )
{
    unsigned n = ap.model_count();
    m_boot.start( progress, done, [this,n]() {
            m_session = true;
            m_models = n;
        });
}

/// Also abandons an open still in progress
void Silent_ar::end()
{
    m_boot.cancel();
    m_active = false;
    m_session = false;
    m_models = 0;
}

void Silent_ar::close()
{
    end();
}

}

////////////////////////////////////////////////////////////////////////////
///                           Silent_provider

/// Read the Silent_engine section.
/// * May throw Config_error
///
Silent_options Silent_options::from_config( Config &cfg )
{
    Silent_options opts {};
    cfg.get_unsigned( "Silent_engine", "bootstrap_ms", opts.bootstrap_ms );
    cfg.get_bool( "Silent_engine", "fullscreen", opts.fullscreen );
    cfg.get_unsigned( "Silent_engine", "clip_secs", opts.clip_secs );
    return opts;
}

/// CTOR
Silent_provider::Silent_provider( boost::asio::io_service &io,
                                  const Silent_options &opts )
    : m_io(io), m_opts(opts)
{ }

/// DTOR
Silent_provider::~Silent_provider()
{ }

std::unique_ptr<Video_decoder> Silent_provider::make_video()
{
    return std::make_unique<Silent_video>( m_io, m_opts );
}

std::unique_ptr<Scene_engine> Silent_provider::make_scene()
{
    return std::make_unique<Silent_scene>( m_io, m_opts );
}

std::unique_ptr<Ar_session> Silent_provider::make_ar()
{
    return std::make_unique<Silent_ar>( m_io, m_opts );
}
