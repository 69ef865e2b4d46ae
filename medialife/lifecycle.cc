/**
 * Lifecycle_controller : drives one player instance through creation,
 * retry with exponential backoff, reset and cleanup.
 *
 * Timer and engine callbacks capture weak references only: m_alive
 * for the controller itself and m_generation for the instance that
 * issued them.  Anything arriving for a superseded instance or a
 * destroyed controller is dropped.
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
#include <cstdint>
#include "lifecycle.hpp"
#include "config.hpp"
#include "logging.hpp"

namespace bpt = boost::posix_time;

/// Pro forma
Media_listener::~Media_listener() { }

/// base_ms * 2^(retry-1), saturating at MaxRetryDelayMs
///
unsigned backoff_delay_ms( unsigned base_ms, unsigned retry )
{
    std::uint64_t delay { base_ms };
    for (unsigned i = 1; (i < retry) and (delay < MaxRetryDelayMs); ++i) {
        delay *= 2;
    }
    return static_cast<unsigned>( std::min<std::uint64_t>( delay, MaxRetryDelayMs ) );
}


/// Read the Lifecycle section.
/// * May throw Config_error
///
Lifecycle_options Lifecycle_options::from_config( Config &cfg )
{
    Lifecycle_options opts {};
    cfg.get_unsigned( "Lifecycle", "max_retries", opts.max_retries );
    cfg.get_unsigned( "Lifecycle", "retry_delay_ms", opts.retry_delay_ms );
    cfg.get_bool( "Lifecycle", "memory_optimization", opts.memory_optimization );
    cfg.get_unsigned( "Lifecycle", "cleanup_interval_secs",
                      opts.cleanup_interval_secs );
    cfg.get_unsigned( "Lifecycle", "memory_budget_mb", opts.memory_budget_mb );
    cfg.get_bool( "Lifecycle", "auto_initialize", opts.auto_initialize );
    cfg.get_bool( "Lifecycle", "cleanup_on_destroy", opts.cleanup_on_destroy );
    if (opts.max_retries > MaxRetries) {
        LOG_ERROR(Lgr) << "Config Lifecycle.max_retries must be <= " << MaxRetries;
        throw Config_error();
    }
    if (opts.cleanup_interval_secs == 0) {
        LOG_ERROR(Lgr) << "Config Lifecycle.cleanup_interval_secs must be > 0";
        throw Config_error();
    }
    return opts;
}

/// CTOR.  Nothing happens until start() or initialize().
///
Lifecycle_controller::Lifecycle_controller( boost::asio::io_service &io,
                                            Player_factory &factory,
                                            const Media_config &cfg,
                                            const Device_signals &sig,
                                            const Lifecycle_options &opts )
    : m_io(io),
      m_factory(factory),
      m_config(cfg),
      m_signals(sig),
      m_opts(opts),
      m_retry_timer(io),
      m_cleanup_timer(io)
{ }

/// DTOR
Lifecycle_controller::~Lifecycle_controller()
{
    m_alive.reset();
    stop_periodic_cleanup();
    if (m_opts.cleanup_on_destroy) {
        cleanup();
    } else {
        cancel_retry();
        m_generation.reset();
    }
}

void Lifecycle_controller::add_listener( spMedia_listener l )
{
    if (l) m_listeners.push_back( l );
}

void Lifecycle_controller::remove_listener( const spMedia_listener &l )
{
    m_listeners.erase( std::remove( m_listeners.begin(), m_listeners.end(), l ),
                       m_listeners.end() );
}

/// Invoke f on a snapshot of the listeners
///
template<class F> void Lifecycle_controller::notify( F f )
{
    std::vector<spMedia_listener> snapshot { m_listeners };
    for (auto &l : snapshot) {
        f( *l );
    }
}

/// Begin periodic memory cleanup (if enabled) and, if so configured,
/// initialization.
///
void Lifecycle_controller::start()
{
    if (m_opts.memory_optimization) {
        arm_cleanup_timer();
    }
    if (m_opts.auto_initialize) {
        initialize();
    }
}

/// Schedule the next memory cleanup sweep
///
void Lifecycle_controller::arm_cleanup_timer()
{
    std::weak_ptr<int> wk { m_alive };
    m_cleanup_timer.expires_from_now(
        bpt::seconds( m_opts.cleanup_interval_secs ) );
    m_cleanup_timer.async_wait( [this,wk]( const boost::system::error_code &ec ) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (not wk.lock()) return;
            m_factory.perform_memory_cleanup( m_opts.memory_budget_mb );
            arm_cleanup_timer();
        });
}

void Lifecycle_controller::stop_periodic_cleanup()
{
    boost::system::error_code ec;
    m_cleanup_timer.cancel( ec );
}

void Lifecycle_controller::cancel_retry()
{
    if (m_retry_pending) {
        LOG_DEBUG(Lgr) << "Lifecycle: cancelling pending retry";
    }
    m_retry_pending = false;
    boost::system::error_code ec;
    m_retry_timer.cancel( ec );
}

/// Hand the instance back to the factory for destruction.
///
void Lifecycle_controller::destroy_instance()
{
    m_generation.reset();
    if (not m_instance) return;
    spPlayer doomed { m_instance };
    m_instance.reset();
    try {
        if (not m_factory.destroy_instance( doomed )) {
            doomed->cleanup();      // evicted earlier; make sure
        }
    }
    catch (const Media_cleanup_exception &e) {
        LOG_ERROR(Lgr) << "Lifecycle: " << e.what() << " for " << doomed->id();
    }
}

/// Create the instance through the factory.  Runs at most once per
/// session; cleanup() or reset() starts a new session.  A rejected
/// configuration surfaces as an unsupported error.
///
void Lifecycle_controller::initialize()
{
    if (m_instance and (m_instance->phase() == Instance_phase::Destroyed)) {
        // destroyed behind our back, e.g. through the factory
        handle_evicted();
    }
    if (m_init_requested) {
        LOG_DEBUG(Lgr) << "Lifecycle: already initialized this session";
        return;
    }
    m_init_requested = true;
    m_initialized = false;
    m_error.reset();
    m_loading.begin( "initializing" );
    auto gen = std::make_shared<unsigned>(0);
    m_generation = gen;
    std::weak_ptr<unsigned> wk { gen };
    Player_callbacks cbs {};
    cbs.progress = [this,wk]( const Loading_state &ls ) {
        if (wk.lock()) handle_progress( ls );
    };
    cbs.settled = [this,wk]( const boost::optional<Media_error> &e ) {
        if (wk.lock()) handle_settled( e );
    };
    cbs.ended = [this,wk]() {
        if (wk.lock()) handle_ended();
    };
    cbs.evicted = [this,wk]() {
        if (wk.lock()) handle_evicted();
    };
    try {
        spPlayer p = m_factory.create_player( m_config, m_signals, cbs );
        if (wk.lock()) {
            m_instance = p;
        } else {
            // superseded while creating; give it back
            m_factory.destroy_instance( p );
        }
    }
    catch (const Media_config_exception &e) {
        m_loading.finish_error( e.error().message() );
        surface_error( e.error() );
    }
    catch (const Media_cleanup_exception &e) {
        LOG_ERROR(Lgr) << "Lifecycle: " << e.what();
    }
}

void Lifecycle_controller::handle_progress( const Loading_state &ls )
{
    m_loading = ls;
    double p = ls.progress();
    notify( [p]( Media_listener &l ) { l.on_progress(p); } );
}

/// The instance finished initializing.  Listeners hear about it on
/// the next turn of the io_service, after the factory call returns.
///
void Lifecycle_controller::handle_settled( const boost::optional<Media_error> &e )
{
    if (e) {
        m_loading.finish_error( e->message() );
        surface_error( *e );
        return;
    }
    m_initialized = true;
    m_retry_count = 0;
    m_out_of_retries = false;
    m_error.reset();
    m_loading.finish_ready();
    LOG_INFO(Lgr) << "Lifecycle: instance ready";
    std::weak_ptr<int> wk { m_alive };
    m_io.post( [this,wk]() {
            if (wk.lock()) notify( []( Media_listener &l ) { l.on_load(); } );
        });
}

/// Record e as the latest error and post it to listeners.
///
void Lifecycle_controller::surface_error( const Media_error &e )
{
    m_error = e;
    LOG_WARNING(Lgr) << "Lifecycle: " << e;
    std::weak_ptr<int> wk { m_alive };
    m_io.post( [this,wk,e]() {
            if (wk.lock()) notify( [&e]( Media_listener &l ) { l.on_error(e); } );
        });
}

void Lifecycle_controller::handle_ended()
{
    notify( []( Media_listener &l ) { l.on_end(); } );
}

/// The instance is gone, destroyed by a memory sweep (ours or another
/// controller's).  Forget it so the next initialize() starts afresh.
/// An eviction that interrupts initialization is surfaced as a
/// retryable error.
///
void Lifecycle_controller::handle_evicted()
{
    LOG_WARNING(Lgr) << "Lifecycle: "
                     << (m_instance ? m_instance->id() : std::string("instance"))
                     << " was evicted";
    bool was_loading = m_loading.is_loading();
    m_generation.reset();
    m_instance.reset();
    m_init_requested = false;
    m_initialized = false;
    if (was_loading) {
        Media_error e { Error_kind::unknown, "Evicted during initialization",
                        true, true, "evicted" };
        m_loading.finish_error( e.message() );
        surface_error( e );
    } else {
        m_loading.clear();
    }
}

/// Try again after a failure.  Refused (returning false) when the
/// latest error is not retryable.  When max_retries retries have been
/// spent, surfaces a terminal error and returns false.  Otherwise the
/// current instance is destroyed now and initialize() runs after
///   retry_delay_ms * 2^(retry_count-1), at most MaxRetryDelayMs
/// on the retry timer.
///
bool Lifecycle_controller::retry()
{
    if (m_error and not m_error->retryable()) {
        LOG_WARNING(Lgr) << "Lifecycle: retry refused, error not retryable";
        return false;
    }
    if (m_retry_count >= m_opts.max_retries) {
        m_out_of_retries = true;
        surface_error( Media_error( Error_kind::unknown,
                                    "Failed to initialize after "
                                    + std::to_string(m_opts.max_retries)
                                    + " retries",
                                    false, false, "retries_exhausted" ) );
        return false;
    }
    ++m_retry_count;
    unsigned delay = backoff_delay_ms( m_opts.retry_delay_ms, m_retry_count );
    m_last_retry_delay_ms = delay;
    LOG_INFO(Lgr) << "Lifecycle: retry " << m_retry_count << " of "
                  << m_opts.max_retries << " in " << delay << "ms";
    cancel_retry();
    destroy_instance();
    m_init_requested = false;
    m_initialized = false;
    m_retry_pending = true;
    std::weak_ptr<int> wk { m_alive };
    m_retry_timer.expires_from_now( bpt::milliseconds(delay) );
    m_retry_timer.async_wait( [this,wk]( const boost::system::error_code &ec ) {
            if (ec == boost::asio::error::operation_aborted) return;
            if (not wk.lock() or not m_retry_pending) return;
            m_retry_pending = false;
            initialize();
        });
    return true;
}

/// Start over: cleanup() then initialize().  Retry bookkeeping is
/// cleared, not consumed.
///
void Lifecycle_controller::reset()
{
    LOG_INFO(Lgr) << "Lifecycle: reset";
    cancel_retry();
    cleanup();
    initialize();
}

/// Cancel any pending retry, destroy the instance, and return all
/// local state to defaults.  Safe to repeat.
///
void Lifecycle_controller::cleanup()
{
    cancel_retry();
    destroy_instance();
    m_init_requested = false;
    m_initialized = false;
    m_retry_count = 0;
    m_last_retry_delay_ms = 0;
    m_out_of_retries = false;
    m_error.reset();
    m_loading.clear();
    m_local_state = Json::Value( Json::objectValue );
}

/// The host became hidden (or visible).  Hiding pauses a video
/// instance; other media types are left alone.
///
void Lifecycle_controller::set_visibility( bool hidden )
{
    m_hidden = hidden;
    if (hidden and m_instance and (m_instance->type() == Media_type::video)
        and (m_instance->phase() == Instance_phase::Ready)) {
        LOG_INFO(Lgr) << "Lifecycle: hidden, pausing " << m_instance->id();
        m_instance->pause();
    }
}

/// Local state merged with the instance's state, plus loading and
/// error information.
///
Json::Value Lifecycle_controller::get_state() const
{
    Json::Value jv { m_local_state };
    if (m_instance) {
        Json::Value inst = m_instance->get_state();
        for (const auto &name : inst.getMemberNames()) {
            jv[name] = inst[name];
        }
        jv["id"] = m_instance->id();
        jv["phase"] = phase_name( m_instance->phase() );
    }
    jv["isLoading"] = m_loading.is_loading();
    jv["progress"] = m_loading.progress();
    jv["error"] = m_error ? m_error->to_json() : Json::Value();
    jv["retryCount"] = m_retry_count;
    jv["outOfRetries"] = m_out_of_retries;
    return jv;
}

/// Merge partial into local state, forward it to the instance, and
/// announce the result.
///
void Lifecycle_controller::set_state( const Json::Value &partial )
{
    if (not partial.isObject()) {
        LOG_WARNING(Lgr) << "Lifecycle: set_state needs an object";
        return;
    }
    for (const auto &name : partial.getMemberNames()) {
        m_local_state[name] = partial[name];
    }
    if (m_instance) {
        m_instance->set_state( partial );
    }
    Json::Value state = get_state();
    notify( [&state]( Media_listener &l ) { l.on_state_change(state); } );
}

/// {memory_usage_mb, is_active, type, device_profile}
///
Json::Value Lifecycle_controller::get_stats() const
{
    Json::Value jv { Json::objectValue };
    bool live = m_instance
        and (m_instance->phase() != Instance_phase::Destroyed);
    jv["memory_usage_mb"] = live ? Player_factory::cost_mb(m_config.type()) : 0u;
    jv["is_active"] = live ? m_instance->config().is_active()
        : m_config.active_flag().value_or( m_factory.defaults().default_active );
    jv["type"] = media_type_name( m_config.type() );
    jv["device_profile"] = m_instance ? m_instance->profile().to_json()
        : resolve_profile( m_signals ).to_json();
    return jv;
}
