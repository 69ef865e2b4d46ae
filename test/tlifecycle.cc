/// Test the Lifecycle_controller: retries, visibility, cleanup, events
///
///    tlifecycle  --log_level=all

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

#define BOOST_TEST_MODULE lifecycle_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <chrono>
#include "logging.hpp"
#include "lifecycle.hpp"
#include "fake_engines.hpp"

struct LogFixture {
    LogFixture() {
        init_logging("tlifecycle","tlifecycle_%5N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

/// Counts events.  With auto_retry it retries every error it hears
/// about, the way the host application does.
///
class Test_listener : public Media_listener {
public:
    Lifecycle_controller *ctl { nullptr };
    bool auto_retry { false };
    unsigned loads { 0 };
    unsigned errors { 0 };
    unsigned progress { 0 };
    unsigned ends { 0 };
    unsigned changes { 0 };
    boost::optional<Media_error> last_error {};
    //
    virtual void on_load() { ++loads; }
    virtual void on_error( const Media_error &e ) {
        ++errors;
        last_error = e;
        if (auto_retry and ctl) ctl->retry();
    }
    virtual void on_progress( double ) { ++progress; }
    virtual void on_end() { ++ends; }
    virtual void on_state_change( const Json::Value& ) { ++changes; }
};

namespace {

Device_signals desktop_signals()
{
    Device_signals sig {};
    sig.connection = Connection_class::wifi;
    return sig;
}

Media_config video_config()
{
    Media_config cfg { Media_type::video };
    Video_payload vp {};
    vp.url = "https://cdn.example.com/a.m3u8";
    cfg.set_video( vp );
    return cfg;
}

Media_config scene_config( bool active )
{
    Media_config cfg { Media_type::engine3d };
    Engine3d_payload ep {};
    ep.project_id = "972311";
    cfg.set_engine3d( ep );
    cfg.set_active( active );
    return cfg;
}

Lifecycle_options quick_options()
{
    Lifecycle_options opts {};
    opts.retry_delay_ms = 1;
    opts.memory_optimization = false;
    return opts;
}

}

//////////////////////////////////////////////////////////////////////////

/// Successful initialization: progress, then one load event
///
BOOST_AUTO_TEST_CASE( Load_events_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Load_events_test";
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               quick_options() };
    auto listener = std::make_shared<Test_listener>();
    ctl.add_listener( listener );

    ctl.start();
    BOOST_TEST( ctl.loading_state().is_loading() );
    BOOST_TEST( not ctl.initialized() );
    // a second initialize in the same session is ignored
    ctl.initialize();
    io.run();
    BOOST_CHECK_EQUAL( provider->counters->made, 1u );
    BOOST_TEST( ctl.initialized() );
    BOOST_CHECK_EQUAL( listener->loads, 1u );
    BOOST_CHECK_EQUAL( listener->errors, 0u );
    BOOST_TEST( listener->progress > 0u );
    BOOST_TEST( not ctl.loading_state().is_loading() );

    Json::Value st = ctl.get_state();
    BOOST_TEST( st["phase"].asString() == "Ready" );
    BOOST_TEST( st["isLoading"].asBool() == false );
    BOOST_CHECK_EQUAL( st["progress"].asDouble(), 1.0 );
    BOOST_TEST( st["error"].isNull() );
    BOOST_TEST( st.isMember("currentTime") );

    provider->fire_video_end();
    BOOST_CHECK_EQUAL( listener->ends, 1u );

    Json::Value partial { Json::objectValue };
    partial["muted"] = true;
    partial["caption"] = "en";
    ctl.set_state( partial );
    BOOST_CHECK_EQUAL( listener->changes, 1u );
    st = ctl.get_state();
    BOOST_TEST( st["muted"].asBool() );
    BOOST_TEST( st["caption"].asString() == "en" );

    Json::Value stats = ctl.get_stats();
    BOOST_CHECK_EQUAL( stats["memory_usage_mb"].asUInt(), 10u );
    BOOST_TEST( stats["is_active"].asBool() );
    BOOST_TEST( stats["type"].asString() == "video" );

    ctl.remove_listener( listener );
    provider->fire_video_end();
    BOOST_CHECK_EQUAL( listener->ends, 1u );
}

/// A persistently failing engine is tried 1 + max_retries times, then
/// the controller gives up with a terminal error.
///
BOOST_AUTO_TEST_CASE( Bounded_retry_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Bounded_retry_test";
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    provider->video.outcome = Engine_errc::network_unreachable;
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               quick_options() };
    auto listener = std::make_shared<Test_listener>();
    listener->ctl = &ctl;
    listener->auto_retry = true;
    ctl.add_listener( listener );

    ctl.start();
    io.run();
    BOOST_CHECK_EQUAL( provider->counters->opened, 4u );
    BOOST_CHECK_EQUAL( ctl.retry_count(), 3u );
    BOOST_TEST( ctl.out_of_retries() );
    BOOST_TEST( not ctl.initialized() );
    BOOST_CHECK_EQUAL( listener->errors, 5u );
    BOOST_REQUIRE( ctl.error() );
    BOOST_TEST( ctl.error()->code() == "retries_exhausted" );
    BOOST_TEST( ctl.error()->message() == "Failed to initialize after 3 retries" );
    BOOST_TEST( not ctl.error()->retryable() );
    // earlier instances were handed back to the factory
    BOOST_CHECK_EQUAL( factory.size(), 1u );

    // once exhausted, further retries are refused
    BOOST_TEST( not ctl.retry() );
    BOOST_TEST( ctl.get_state()["outOfRetries"].asBool() );
}

/// Retry delays double: 2000, 4000, 8000 ms
///
BOOST_AUTO_TEST_CASE( Backoff_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_options opts {};
    opts.memory_optimization = false;
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               opts };
    ctl.initialize();
    BOOST_TEST( ctl.retry() );
    BOOST_CHECK_EQUAL( ctl.last_retry_delay(), 2000u );
    BOOST_TEST( ctl.retry_pending() );
    BOOST_TEST( ctl.retry() );
    BOOST_CHECK_EQUAL( ctl.last_retry_delay(), 4000u );
    BOOST_TEST( ctl.retry() );
    BOOST_CHECK_EQUAL( ctl.last_retry_delay(), 8000u );
    BOOST_TEST( not ctl.retry() );
    BOOST_TEST( ctl.out_of_retries() );
    // cleanup forgets all of it
    ctl.cleanup();
    BOOST_CHECK_EQUAL( ctl.retry_count(), 0u );
    BOOST_TEST( not ctl.out_of_retries() );
    BOOST_TEST( not ctl.retry_pending() );
}

/// A device error is final; retry refuses it.
///
BOOST_AUTO_TEST_CASE( Non_retryable_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Device_signals slow {};
    slow.connection = Connection_class::slow_2g;
    Media_config cfg { Media_type::ar };
    Ar_payload ap {};
    ap.glb_url = "https://cdn.example.com/chair.glb";
    cfg.set_ar( ap );
    Lifecycle_controller ctl { io, factory, cfg, slow, quick_options() };
    auto listener = std::make_shared<Test_listener>();
    ctl.add_listener( listener );
    ctl.start();
    BOOST_REQUIRE( ctl.error() );
    BOOST_TEST( (ctl.error()->kind() == Error_kind::device) );
    BOOST_TEST( not ctl.retry() );
    BOOST_CHECK_EQUAL( ctl.retry_count(), 0u );
    io.run();
    BOOST_CHECK_EQUAL( listener->errors, 1u );
    BOOST_CHECK_EQUAL( provider->counters->made, 0u );
}

/// A malformed config surfaces as an unsupported error event
///
BOOST_AUTO_TEST_CASE( Config_error_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Media_config nourl { Media_type::video };
    nourl.set_video( Video_payload() );
    Lifecycle_controller ctl { io, factory, nourl, desktop_signals(),
                               quick_options() };
    auto listener = std::make_shared<Test_listener>();
    ctl.add_listener( listener );
    ctl.start();
    io.run();
    BOOST_CHECK_EQUAL( listener->errors, 1u );
    BOOST_REQUIRE( listener->last_error );
    BOOST_TEST( (listener->last_error->kind() == Error_kind::unsupported) );
    BOOST_TEST( not ctl.instance() );
    BOOST_CHECK_EQUAL( factory.size(), 0u );
    BOOST_TEST( not ctl.retry() );
}

/// Hiding pauses video but leaves a 3D scene alone
///
BOOST_AUTO_TEST_CASE( Visibility_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_controller vctl { io, factory, video_config(), desktop_signals(),
                                quick_options() };
    Lifecycle_controller sctl { io, factory, scene_config(true),
                                desktop_signals(), quick_options() };
    vctl.start();
    sctl.start();
    io.run();
    vctl.instance()->play();
    sctl.instance()->play();
    BOOST_TEST( not vctl.get_state()["paused"].asBool() );

    vctl.set_visibility( true );
    sctl.set_visibility( true );
    BOOST_TEST( vctl.hidden() );
    BOOST_TEST( vctl.get_state()["paused"].asBool() );
    BOOST_TEST( sctl.get_state()["isRunning"].asBool() );

    // becoming visible does not resume
    vctl.set_visibility( false );
    BOOST_TEST( vctl.get_state()["paused"].asBool() );
}

/// Cleanup releases the instance once and resets local state
///
BOOST_AUTO_TEST_CASE( Cleanup_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               quick_options() };
    ctl.start();
    io.run();
    Json::Value partial { Json::objectValue };
    partial["caption"] = "en";
    ctl.set_state( partial );

    ctl.cleanup();
    ctl.cleanup();
    BOOST_TEST( not ctl.instance() );
    BOOST_TEST( not ctl.initialized() );
    BOOST_CHECK_EQUAL( factory.size(), 0u );
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
    BOOST_TEST( not ctl.get_state().isMember("caption") );
    BOOST_TEST( not ctl.get_state()["isLoading"].asBool() );
}

/// Cleanup while a retry is pending cancels it
///
BOOST_AUTO_TEST_CASE( Cleanup_cancels_retry_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    provider->video.outcome = Engine_errc::timed_out;
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               quick_options() };
    ctl.start();
    io.run();
    BOOST_TEST( ctl.retry() );
    ctl.cleanup();
    io.restart();
    io.run();
    BOOST_CHECK_EQUAL( provider->counters->made, 1u );
    BOOST_TEST( not ctl.instance() );
}

/// Reset starts a fresh session with clean retry bookkeeping
///
BOOST_AUTO_TEST_CASE( Reset_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    provider->video.outcome = Engine_errc::timed_out;
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               quick_options() };
    auto listener = std::make_shared<Test_listener>();
    ctl.add_listener( listener );
    ctl.start();
    io.run();
    BOOST_TEST( ctl.retry() );
    io.restart();
    io.run();
    BOOST_CHECK_EQUAL( ctl.retry_count(), 1u );
    BOOST_REQUIRE( ctl.error() );

    provider->video.outcome = Engine_errc::success;
    ctl.reset();
    io.restart();
    io.run();
    BOOST_TEST( ctl.initialized() );
    BOOST_CHECK_EQUAL( ctl.retry_count(), 0u );
    BOOST_TEST( not ctl.error() );
    BOOST_CHECK_EQUAL( listener->loads, 1u );
    BOOST_CHECK_EQUAL( factory.size(), 1u );
}

/// The periodic sweep evicts an inactive instance over budget
///
BOOST_AUTO_TEST_CASE( Periodic_cleanup_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Periodic_cleanup_test";
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_options opts = quick_options();
    opts.memory_optimization = true;
    opts.cleanup_interval_secs = 1;
    opts.memory_budget_mb = 10;
    Lifecycle_controller ctl { io, factory, scene_config(false),
                               desktop_signals(), opts };
    ctl.start();
    io.run_for( std::chrono::milliseconds(1500) );
    BOOST_CHECK_EQUAL( factory.size(), 0u );
    BOOST_TEST( not ctl.initialized() );
    BOOST_TEST( not ctl.instance() );
    BOOST_TEST( not ctl.error() );
    BOOST_TEST( not ctl.get_state()["isLoading"].asBool() );
    ctl.stop_periodic_cleanup();
    BOOST_CHECK_EQUAL( ctl.get_stats()["memory_usage_mb"].asUInt(), 0u );

    // the next initialize() builds a new instance
    unsigned made = provider->counters->made;
    ctl.initialize();
    BOOST_CHECK_EQUAL( provider->counters->made, made + 1 );
    io.restart();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_TEST( ctl.initialized() );
    BOOST_REQUIRE( ctl.instance() );
    BOOST_TEST( (ctl.instance()->phase() == Instance_phase::Ready) );
    BOOST_CHECK_EQUAL( factory.size(), 1u );
}

/// A sweep run on behalf of someone else still reaches the controller
/// whose instance it evicts.
///
BOOST_AUTO_TEST_CASE( Evicted_by_other_sweep_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_controller idle { io, factory, scene_config(false),
                                desktop_signals(), quick_options() };
    Lifecycle_controller busy { io, factory, video_config(),
                                desktop_signals(), quick_options() };
    idle.initialize();
    busy.initialize();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_TEST( idle.initialized() );
    BOOST_TEST( busy.initialized() );

    BOOST_CHECK_EQUAL( factory.perform_memory_cleanup( 40 ), 1u );
    BOOST_TEST( not idle.initialized() );
    BOOST_TEST( not idle.instance() );
    BOOST_TEST( busy.initialized() );

    unsigned made = provider->counters->made;
    idle.initialize();
    BOOST_CHECK_EQUAL( provider->counters->made, made + 1 );
    io.restart();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_TEST( idle.initialized() );
    BOOST_CHECK_EQUAL( factory.size(), 2u );
}

/// An instance destroyed through the factory directly is noticed by
/// the next initialize().
///
BOOST_AUTO_TEST_CASE( Destroyed_elsewhere_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, video_config(),
                               desktop_signals(), quick_options() };
    ctl.initialize();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_REQUIRE( ctl.instance() );
    BOOST_TEST( factory.destroy_instance( ctl.instance() ) );

    unsigned made = provider->counters->made;
    ctl.initialize();
    BOOST_CHECK_EQUAL( provider->counters->made, made + 1 );
    BOOST_REQUIRE( ctl.instance() );
    BOOST_TEST( (ctl.instance()->phase() != Instance_phase::Destroyed) );
}

/// Eviction in the middle of initialization ends the loading state
/// with a retryable error; retrying brings the player back.
///
BOOST_AUTO_TEST_CASE( Evicted_while_initializing_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Evicted_while_initializing_test";
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    provider->scene.hold = true;
    Player_factory factory { provider };
    Lifecycle_controller ctl { io, factory, scene_config(false),
                               desktop_signals(), quick_options() };
    auto listener = std::make_shared<Test_listener>();
    ctl.add_listener( listener );
    ctl.initialize();
    BOOST_TEST( ctl.loading_state().is_loading() );

    BOOST_CHECK_EQUAL( factory.perform_memory_cleanup( 10 ), 1u );
    BOOST_TEST( not ctl.loading_state().is_loading() );
    BOOST_TEST( not ctl.get_state()["isLoading"].asBool() );
    BOOST_REQUIRE( ctl.error() );
    BOOST_TEST( ctl.error()->code() == "evicted" );
    BOOST_TEST( ctl.error()->retryable() );
    BOOST_TEST( not ctl.instance() );
    io.run_for( std::chrono::milliseconds(20) );
    BOOST_CHECK_EQUAL( listener->errors, 1u );

    // the late completion of the evicted engine is dropped
    provider->release_held();
    BOOST_TEST( not ctl.initialized() );

    provider->scene.hold = false;
    BOOST_TEST( ctl.retry() );
    io.restart();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_TEST( ctl.initialized() );
    BOOST_CHECK_EQUAL( listener->loads, 1u );
}

/// Backoff doubles until it saturates; it never shrinks.
///
BOOST_AUTO_TEST_CASE( Backoff_saturation_test )
{
    LogFixture lf;
    BOOST_CHECK_EQUAL( backoff_delay_ms( 2000, 1 ), 2000u );
    BOOST_CHECK_EQUAL( backoff_delay_ms( 2000, 4 ), 16000u );
    BOOST_CHECK_EQUAL( backoff_delay_ms( 2000, 22 ), MaxRetryDelayMs );
    BOOST_CHECK_EQUAL( backoff_delay_ms( 2000, 40 ), MaxRetryDelayMs );
    BOOST_CHECK_EQUAL( backoff_delay_ms( 4000000u, 1 ), MaxRetryDelayMs );

    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Player_factory factory { provider };
    Lifecycle_options opts {};
    opts.memory_optimization = false;
    opts.max_retries = 40;
    Lifecycle_controller ctl { io, factory, video_config(), desktop_signals(),
                               opts };
    ctl.initialize();
    unsigned prev { 0 };
    for (unsigned i = 0; i < 40; ++i) {
        BOOST_REQUIRE( ctl.retry() );
        BOOST_TEST( ctl.last_retry_delay() >= prev );
        BOOST_TEST( ctl.last_retry_delay() <= MaxRetryDelayMs );
        prev = ctl.last_retry_delay();
    }
    BOOST_CHECK_EQUAL( prev, MaxRetryDelayMs );
    BOOST_TEST( not ctl.retry() );
    BOOST_TEST( ctl.out_of_retries() );
}
