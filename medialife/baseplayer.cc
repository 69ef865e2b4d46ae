/**
 * Base_player: the instance state machine common to all media players.
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

#include "baseplayer.hpp"
#include "logging.hpp"

/// Pro forma destructor is required even though pure virtual interface.
Player::~Player() { }


/// CTOR
Base_player::Base_player( const std::string &id, const Media_config &cfg,
                          const Device_profile &prof,
                          spEngine_provider provider )
    : m_id(id),
      m_config(cfg),
      m_profile(prof),
      m_provider(provider)
{
    LOG_DEBUG(Lgr) << m_id << " created";
}

/// DTOR.  Subclasses must release their handles in their own DTORs;
/// by now only pending callbacks remain to be dropped.
///
Base_player::~Base_player()
{
    m_attempt.reset();
}

/// Begin asynchronous initialization.  Only an Uninitialized instance
/// may be initialized; otherwise this logs and does nothing.  The
/// settled callback runs exactly once per attempt, possibly before
/// this returns (e.g. an AR request on an ineligible device).
///
void Base_player::initialize( const Player_callbacks &cbs )
{
    if (m_phase != Instance_phase::Uninitialized) {
        LOG_WARNING(Lgr) << m_id << " initialize ignored in phase "
                         << phase_name(m_phase);
        return;
    }
    m_callbacks = cbs;
    m_error.reset();
    auto token = std::make_shared<unsigned>(0);
    m_attempt = token;
    std::weak_ptr<unsigned> wk { token };
    m_phase = Instance_phase::Initializing;
    m_loading.begin( "initializing" );
    LOG_INFO(Lgr) << m_id << " initializing";
    if (m_callbacks.progress) { m_callbacks.progress( m_loading ); }
    if (not wk.lock()) return;
    //
    Media_error perr {};
    if (not precheck(perr)) {
        fail( perr );
        return;
    }
    try {
        acquire_handle();
        open_handle(
            [this,wk]( double p, const std::string &msg ) {
                if (wk.lock()) handle_progress( p, msg );
            },
            [this,wk]( const boost::system::error_code &ec ) {
                if (wk.lock()) handle_done( ec );
            });
    }
    catch (const std::exception &e) {
        if (not wk.lock()) return;
        LOG_ERROR(Lgr) << m_id << " engine raised during initialize: "
                       << e.what();
        fail( Media_error( Error_kind::unknown, e.what(), true, true,
                           "exception" ) );
    }
}

/// Engine reported progress
///
void Base_player::handle_progress( double p, const std::string &msg )
{
    if (m_phase != Instance_phase::Initializing) return;
    Load_stage st = (p < 0.5) ? Load_stage::loading : Load_stage::processing;
    if (m_loading.advance( p, st, msg ) and m_callbacks.progress) {
        m_callbacks.progress( m_loading );
    }
}

/// Engine finished bootstrap.  Completions arriving in any phase but
/// Initializing are stale and ignored.
///
void Base_player::handle_done( const boost::system::error_code &ec )
{
    if (m_phase != Instance_phase::Initializing) {
        LOG_DEBUG(Lgr) << m_id << " ignoring stale engine completion";
        return;
    }
    if (ec) {
        fail( Media_error::from_engine( ec, lower_quality_available() ) );
        return;
    }
    m_phase = Instance_phase::Ready;
    m_loading.finish_ready();
    LOG_INFO(Lgr) << m_id << " ready";
    on_ready();
    auto settled = m_callbacks.settled;
    if (settled) { settled( boost::none ); }
    // *this may be gone now
}

/// Enter Failed with error e, and tell the caller.
///
void Base_player::fail( const Media_error &e )
{
    m_phase = Instance_phase::Failed;
    m_error = e;
    m_loading.finish_error( e.message() );
    LOG_ERROR(Lgr) << m_id << " failed: " << e;
    auto settled = m_callbacks.settled;
    if (settled) { settled( m_error ); }
    // *this may be gone now
}

/// Media ran to the end
///
void Base_player::notify_ended()
{
    if (not is_ready()) return;
    LOG_INFO(Lgr) << m_id << " reached end of media";
    on_ended();
}

void Base_player::on_ended()
{
    auto ended = m_callbacks.ended;
    if (ended) { ended(); }
}

/// Release the engine handle and enter Destroyed.  Idempotent.
/// Pending engine callbacks are dropped.  The instance is Destroyed
/// even if the engine fails to close cleanly.
/// * May throw Media_cleanup_exception
///
void Base_player::cleanup()
{
    if (m_phase == Instance_phase::Destroyed) return;
    m_attempt.reset();
    m_callbacks = Player_callbacks();
    m_phase = Instance_phase::Destroyed;
    m_error.reset();
    m_loading.clear();
    try {
        release_handle();
    }
    catch (const std::exception &e) {
        LOG_ERROR(Lgr) << m_id << " engine failed to close: " << e.what();
        throw Media_cleanup_exception();
    }
    LOG_INFO(Lgr) << m_id << " destroyed";
}

/// Destroy on behalf of the memory sweep, then tell the caller through
/// the evicted callback, whether or not the engine closed cleanly.
/// * May throw Media_cleanup_exception
///
void Base_player::evict()
{
    if (m_phase == Instance_phase::Destroyed) return;
    auto evicted = m_callbacks.evicted;
    LOG_INFO(Lgr) << m_id << " evicted in phase " << phase_name(m_phase);
    try {
        cleanup();
    }
    catch (const Media_cleanup_exception&) {
        if (evicted) { evicted(); }
        throw;
    }
    if (evicted) { evicted(); }
}

/// Give up an initialization still in progress: the engine's pending
/// callbacks are dropped and the instance fails with e.
///
void Base_player::abandon_initialization( const Media_error &e )
{
    if (m_phase != Instance_phase::Initializing) return;
    m_attempt.reset();
    fail( e );
}

/// Release the handle and initialize again with a fresh one, keeping
/// the callbacks.  A no-op once Destroyed.
///
void Base_player::reset()
{
    if (m_phase == Instance_phase::Destroyed) {
        LOG_DEBUG(Lgr) << m_id << " reset ignored: destroyed";
        return;
    }
    Player_callbacks cbs { m_callbacks };
    m_attempt.reset();
    try {
        release_handle();
    }
    catch (const std::exception &e) {
        LOG_WARNING(Lgr) << m_id << " engine failed to close on reset: "
                         << e.what();
    }
    m_phase = Instance_phase::Uninitialized;
    m_error.reset();
    m_loading.clear();
    LOG_INFO(Lgr) << m_id << " reset";
    initialize( cbs );
}
