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

#include <memory>
#include <vector>
#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include "playerfactory.hpp"

class Config;


/// Upper bound on Lifecycle.max_retries in a config file
constexpr unsigned MaxRetries { 20 };

/// Retry backoff never exceeds this (one hour)
constexpr unsigned MaxRetryDelayMs { 3600u * 1000u };

unsigned backoff_delay_ms( unsigned base_ms, unsigned retry );

/// Tunables for a Lifecycle_controller (Lifecycle config section)
///
struct Lifecycle_options {
    unsigned max_retries { 3 };
    unsigned retry_delay_ms { 2000 };       // base backoff delay
    bool memory_optimization { true };      // periodic eviction sweep
    unsigned cleanup_interval_secs { 30 };
    unsigned memory_budget_mb { DefaultBudgetMB };
    bool auto_initialize { true };          // initialize on start()
    bool cleanup_on_destroy { true };       // cleanup in DTOR
    //
    static Lifecycle_options from_config( Config& );
};


/// Observer of one controller.  Override what you need.
///
class Media_listener {
public:
    virtual ~Media_listener();
    virtual void on_load() {}
    virtual void on_error( const Media_error& ) {}
    virtual void on_progress( double ) {}
    virtual void on_end() {}
    virtual void on_state_change( const Json::Value& ) {}
};

using spMedia_listener = std::shared_ptr<Media_listener>;


/**
 * Orchestrates one player instance on behalf of one caller: creation
 * through the factory, bounded retries with exponential backoff,
 * reset, cleanup, visibility pause, and periodic memory cleanup.
 * All work happens on the io_service; nothing here is thread safe.
 */
class Lifecycle_controller {
private:
    boost::asio::io_service &m_io;
    Player_factory &m_factory;
    Media_config m_config;
    Device_signals m_signals;
    Lifecycle_options m_opts;
    std::vector<spMedia_listener> m_listeners {};
    //
    spPlayer m_instance {};
    bool m_init_requested { false };    // this session's initialize() ran
    bool m_initialized { false };       // instance reached Ready
    bool m_hidden { false };
    unsigned m_retry_count { 0 };
    unsigned m_last_retry_delay_ms { 0 };
    bool m_out_of_retries { false };
    bool m_retry_pending { false };
    boost::optional<Media_error> m_error {};
    Loading_state m_loading {};
    Json::Value m_local_state { Json::objectValue };
    //
    boost::asio::deadline_timer m_retry_timer;
    boost::asio::deadline_timer m_cleanup_timer;
    std::shared_ptr<int> m_alive { std::make_shared<int>(0) };
    std::shared_ptr<unsigned> m_generation {};  // current instance's callbacks
    //
    void arm_cleanup_timer();
    void cancel_retry();
    void destroy_instance();
    void handle_settled( const boost::optional<Media_error>& );
    void handle_progress( const Loading_state& );
    void handle_ended();
    void handle_evicted();
    void surface_error( const Media_error& );
    template<class F> void notify( F );
public:
    Lifecycle_controller( boost::asio::io_service&, Player_factory&,
                          const Media_config&, const Device_signals&,
                          const Lifecycle_options& = Lifecycle_options() );
    ~Lifecycle_controller();
    Lifecycle_controller(const Lifecycle_controller&) = delete;
    void operator=(Lifecycle_controller const&) = delete;
    //
    void add_listener( spMedia_listener );
    void remove_listener( const spMedia_listener& );
    void start();
    void stop_periodic_cleanup();
    //
    void initialize();
    bool retry();
    void reset();
    void cleanup();
    void set_visibility( bool hidden );
    Json::Value get_state() const;
    void set_state( const Json::Value& );
    Json::Value get_stats() const;
    void set_signals( const Device_signals &s ) { m_signals = s; }
    //
    bool initialized() const { return m_initialized; }
    bool out_of_retries() const { return m_out_of_retries; }
    unsigned retry_count() const { return m_retry_count; }
    unsigned last_retry_delay() const { return m_last_retry_delay_ms; }
    bool retry_pending() const { return m_retry_pending; }
    bool hidden() const { return m_hidden; }
    const boost::optional<Media_error>& error() const { return m_error; }
    const Loading_state& loading_state() const { return m_loading; }
    spPlayer instance() const { return m_instance; }
    const Lifecycle_options& options() const { return m_opts; }
};
