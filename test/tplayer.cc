/// Test the player classes against scripted engines
///
///    tplayer  --log_level=all

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

#define BOOST_TEST_MODULE player_test
#ifndef BOOST_TEST_DYN_LINK
#define BOOST_TEST_DYN_LINK 1
#endif
#include <boost/test/unit_test.hpp>

#include <chrono>
#include "logging.hpp"
#include "videoplayer.hpp"
#include "sceneplayer.hpp"
#include "arplayer.hpp"
#include "silentengine.hpp"
#include "fake_engines.hpp"

struct LogFixture {
    LogFixture() {
        init_logging("tplayer","tplayer_%5N.log",LF_FILE|LF_DEBUG);
    }
    ~LogFixture() {
        finish_logging();
    }
};

/// Records what a player tells its driver
///
struct Recorder {
    unsigned progress_calls { 0 };
    double last_progress { -1.0 };
    unsigned settled_calls { 0 };
    boost::optional<Media_error> outcome {};
    unsigned ended_calls { 0 };
    unsigned evicted_calls { 0 };
    //
    Player_callbacks callbacks() {
        Player_callbacks cbs {};
        cbs.progress = [this]( const Loading_state &ls ) {
            ++progress_calls;
            last_progress = ls.progress();
        };
        cbs.settled = [this]( const boost::optional<Media_error> &e ) {
            ++settled_calls;
            outcome = e;
        };
        cbs.ended = [this]() { ++ended_calls; };
        cbs.evicted = [this]() { ++evicted_calls; };
        return cbs;
    }
};

namespace {

const Device_profile Desktop =
    resolve_profile( false, false, Connection_class::wifi );

Media_config video_config( bool loop = false )
{
    Media_config cfg { Media_type::video };
    Video_payload vp {};
    vp.url = "https://cdn.example.com/a.m3u8";
    vp.loop = loop;
    vp.volume = 0.5;
    cfg.set_video( vp );
    return cfg;
}

Media_config ar_config( bool is_open )
{
    Media_config cfg { Media_type::ar };
    Ar_payload ap {};
    ap.glb_url = "https://cdn.example.com/chair.glb";
    ap.usdz_url = "https://cdn.example.com/chair.usdz";
    ap.is_open = is_open;
    cfg.set_ar( ap );
    return cfg;
}

}

//////////////////////////////////////////////////////////////////////////

/// Initialize a video player, drive its controls, and destroy it.
///
BOOST_AUTO_TEST_CASE( Video_lifecycle_test )
{
    LogFixture lf;
    LOG_INFO(Lgr) << "Unit test: Video_lifecycle_test";
    auto provider = std::make_shared<Fake_provider>();
    Recorder rec {};
    Video_player vp { "video_1", video_config(), Desktop, provider };
    BOOST_TEST( (vp.phase() == Instance_phase::Uninitialized) );
    // controls before Ready do nothing
    vp.play();
    BOOST_TEST( vp.get_state()["paused"].asBool() );

    vp.initialize( rec.callbacks() );
    BOOST_TEST( (vp.phase() == Instance_phase::Ready) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 1u );
    BOOST_TEST( not rec.outcome );
    BOOST_CHECK_EQUAL( rec.progress_calls, 2u );   // begin, then 0.3 only
    BOOST_CHECK_CLOSE( rec.last_progress, 0.3, 1e-9 );
    BOOST_TEST( not vp.loading_state().is_loading() );
    BOOST_CHECK_EQUAL( vp.loading_state().progress(), 1.0 );

    Json::Value st = vp.get_state();
    BOOST_TEST( st["paused"].asBool() );
    BOOST_CHECK_CLOSE( st["volume"].asDouble(), 0.5, 1e-9 );

    vp.play();
    BOOST_TEST( not vp.get_state()["paused"].asBool() );
    vp.seek( 500.0 );
    BOOST_CHECK_CLOSE( vp.get_state()["currentTime"].asDouble(), 120.0, 1e-9 );
    vp.seek( -3.0 );
    BOOST_CHECK_EQUAL( vp.get_state()["currentTime"].asDouble(), 0.0 );
    vp.set_volume( 2.0 );
    BOOST_CHECK_EQUAL( vp.get_state()["volume"].asDouble(), 1.0 );
    vp.toggle_fullscreen();
    BOOST_TEST( vp.get_state()["fullscreen"].asBool() );
    vp.seek( 40.0 );
    vp.stop();
    st = vp.get_state();
    BOOST_TEST( st["paused"].asBool() );
    BOOST_CHECK_EQUAL( st["currentTime"].asDouble(), 0.0 );

    Json::Value partial { Json::objectValue };
    partial["muted"] = true;
    partial["currentTime"] = 12.5;
    vp.set_state( partial );
    st = vp.get_state();
    BOOST_TEST( st["muted"].asBool() );
    BOOST_CHECK_CLOSE( st["currentTime"].asDouble(), 12.5, 1e-9 );

    provider->fire_video_end();
    BOOST_CHECK_EQUAL( rec.ended_calls, 1u );

    vp.cleanup();
    BOOST_TEST( (vp.phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
    provider->fire_video_end();
    BOOST_CHECK_EQUAL( rec.ended_calls, 1u );
}

/// Looping video restarts instead of ending
///
BOOST_AUTO_TEST_CASE( Video_loop_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Recorder rec {};
    Video_player vp { "video_2", video_config(true), Desktop, provider };
    vp.initialize( rec.callbacks() );
    vp.play();
    provider->fire_video_end();
    BOOST_CHECK_EQUAL( rec.ended_calls, 0u );
    Json::Value st = vp.get_state();
    BOOST_TEST( not st["paused"].asBool() );
    BOOST_CHECK_EQUAL( st["currentTime"].asDouble(), 0.0 );
}

/// Cleanup twice is the same as once
///
BOOST_AUTO_TEST_CASE( Cleanup_idempotent_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Video_player vp { "video_3", video_config(), Desktop, provider };
    vp.initialize( Player_callbacks() );
    vp.cleanup();
    vp.cleanup();
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
    BOOST_TEST( not vp.error() );
    // a destroyed player cannot come back
    vp.initialize( Player_callbacks() );
    vp.reset();
    BOOST_TEST( (vp.phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_EQUAL( provider->counters->made, 1u );
}

/// An engine that will not close still leaves the player Destroyed
///
BOOST_AUTO_TEST_CASE( Cleanup_failure_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->video.throw_on_close = true;
    Video_player vp { "video_4", video_config(), Desktop, provider };
    vp.initialize( Player_callbacks() );
    BOOST_CHECK_THROW( vp.cleanup(), Media_cleanup_exception );
    BOOST_TEST( (vp.phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_NO_THROW( vp.cleanup() );
}

/// A failed player recovers with reset()
///
BOOST_AUTO_TEST_CASE( Reset_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->video.outcome = Engine_errc::network_unreachable;
    Recorder rec {};
    Video_player vp { "video_5", video_config(), Desktop, provider };
    vp.initialize( rec.callbacks() );
    BOOST_TEST( (vp.phase() == Instance_phase::Failed) );
    BOOST_REQUIRE( rec.outcome );
    BOOST_TEST( (rec.outcome->kind() == Error_kind::network) );
    BOOST_TEST( rec.outcome->retryable() );
    BOOST_REQUIRE( vp.error() );
    BOOST_TEST( (vp.loading_state().stage() == Load_stage::error) );

    provider->video.outcome = Engine_errc::success;
    vp.reset();
    BOOST_TEST( (vp.phase() == Instance_phase::Ready) );
    BOOST_TEST( not vp.error() );
    BOOST_CHECK_EQUAL( rec.settled_calls, 2u );
    BOOST_TEST( not rec.outcome );
    BOOST_CHECK_EQUAL( provider->counters->made, 2u );
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
}

/// Decode failures are retryable only if there is a lower quality
///
BOOST_AUTO_TEST_CASE( Decode_error_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->video.outcome = Engine_errc::decode_failed;

    Media_config hi = video_config();
    hi.video_payload().quality = Video_quality::q1080p;
    Video_player v1 { "video_6", hi, Desktop, provider };
    v1.initialize( Player_callbacks() );
    BOOST_REQUIRE( v1.error() );
    BOOST_TEST( (v1.error()->kind() == Error_kind::decode) );
    BOOST_TEST( v1.error()->retryable() );

    Media_config lo = video_config();
    lo.video_payload().quality = Video_quality::q480p;
    Video_player v2 { "video_7", lo, Desktop, provider };
    v2.initialize( Player_callbacks() );
    BOOST_REQUIRE( v2.error() );
    BOOST_TEST( not v2.error()->retryable() );
    BOOST_TEST( v2.error()->recoverable() );
}

/// An engine that throws from open() is an unknown, retryable failure
///
BOOST_AUTO_TEST_CASE( Engine_throws_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->scene.throw_on_open = true;
    Media_config cfg { Media_type::engine3d };
    Engine3d_payload ep {};
    ep.project_id = "972311";
    cfg.set_engine3d( ep );
    Recorder rec {};
    Scene_player sp { "engine3d_1", cfg, Desktop, provider };
    sp.initialize( rec.callbacks() );
    BOOST_TEST( (sp.phase() == Instance_phase::Failed) );
    BOOST_REQUIRE( rec.outcome );
    BOOST_TEST( (rec.outcome->kind() == Error_kind::unknown) );
    BOOST_TEST( rec.outcome->retryable() );
    sp.cleanup();
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
}

/// A completion that arrives after cleanup (or after the player is
/// gone) is dropped.
///
BOOST_AUTO_TEST_CASE( Stale_completion_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->video.hold = true;
    Recorder rec {};
    auto vp = std::make_shared<Video_player>( "video_8", video_config(),
                                              Desktop, provider );
    vp->initialize( rec.callbacks() );
    BOOST_TEST( (vp->phase() == Instance_phase::Initializing) );
    BOOST_TEST( vp->loading_state().is_loading() );
    vp->cleanup();
    provider->release_held();
    BOOST_TEST( (vp->phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 0u );

    // again, but the player is destroyed outright
    auto vp2 = std::make_shared<Video_player>( "video_9", video_config(),
                                               Desktop, provider );
    vp2->initialize( rec.callbacks() );
    vp2.reset();
    BOOST_CHECK_NO_THROW( provider->release_held() );
    BOOST_CHECK_EQUAL( rec.settled_calls, 0u );
}

/// Completions posted to an io_service arrive later
///
BOOST_AUTO_TEST_CASE( Async_completion_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    auto provider = std::make_shared<Fake_provider>( &io );
    Recorder rec {};
    Video_player vp { "video_10", video_config(), Desktop, provider };
    vp.initialize( rec.callbacks() );
    BOOST_TEST( (vp.phase() == Instance_phase::Initializing) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 0u );
    io.run();
    BOOST_TEST( (vp.phase() == Instance_phase::Ready) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 1u );
}

/// Scene play and pause toggle the render loop
///
BOOST_AUTO_TEST_CASE( Scene_controls_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Media_config cfg { Media_type::engine3d };
    Engine3d_payload ep {};
    ep.build_path = "/srv/builds/showroom";
    cfg.set_engine3d( ep );
    Scene_player sp { "engine3d_2", cfg, Desktop, provider };
    sp.initialize( Player_callbacks() );
    BOOST_TEST( (sp.phase() == Instance_phase::Ready) );
    sp.pause();
    Json::Value st = sp.get_state();
    BOOST_TEST( not st["isRunning"].asBool() );
    BOOST_CHECK_EQUAL( st["fps"].asDouble(), 0.0 );
    sp.play();
    st = sp.get_state();
    BOOST_TEST( st["isRunning"].asBool() );
    BOOST_TEST( st["fps"].asDouble() > 0.0 );
    Json::Value partial { Json::objectValue };
    partial["isRunning"] = false;
    sp.set_state( partial );
    BOOST_TEST( not sp.get_state()["isRunning"].asBool() );
}

/// AR on a device without AR fails with a device error before any
/// engine is touched.
///
BOOST_AUTO_TEST_CASE( Ar_ineligible_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Device_profile weak = resolve_profile( false, false,
                                           Connection_class::slow_2g );
    Recorder rec {};
    Ar_player ap { "ar_1", ar_config(true), weak, provider };
    ap.initialize( rec.callbacks() );
    BOOST_TEST( (ap.phase() == Instance_phase::Failed) );
    BOOST_REQUIRE( rec.outcome );
    BOOST_TEST( (rec.outcome->kind() == Error_kind::device) );
    BOOST_TEST( not rec.outcome->recoverable() );
    BOOST_TEST( not rec.outcome->retryable() );
    BOOST_CHECK_EQUAL( provider->counters->made, 0u );

    // barred by the optimizer even though the device could do AR
    Media_config barred = ar_config(true);
    barred.ar_payload().session_allowed = false;
    Ar_player ap2 { "ar_2", barred, Desktop, provider };
    ap2.initialize( Player_callbacks() );
    BOOST_REQUIRE( ap2.error() );
    BOOST_TEST( (ap2.error()->kind() == Error_kind::device) );
    BOOST_CHECK_EQUAL( provider->counters->made, 0u );
}

/// AR controls: play needs an open session, stop releases the models
///
BOOST_AUTO_TEST_CASE( Ar_controls_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Ar_player ap { "ar_3", ar_config(false), Desktop, provider };
    ap.initialize( Player_callbacks() );
    BOOST_TEST( (ap.phase() == Instance_phase::Ready) );
    Json::Value st = ap.get_state();
    BOOST_CHECK_EQUAL( st["modelsLoaded"].asUInt(), 2u );
    BOOST_TEST( st["hasSession"].asBool() );

    ap.play();
    BOOST_TEST( not ap.get_state()["isActive"].asBool() );
    Json::Value partial { Json::objectValue };
    partial["isOpen"] = true;
    ap.set_state( partial );
    ap.play();
    BOOST_TEST( ap.get_state()["isActive"].asBool() );
    ap.pause();
    BOOST_TEST( not ap.get_state()["isActive"].asBool() );

    ap.stop();
    st = ap.get_state();
    BOOST_TEST( not st["hasSession"].asBool() );
    BOOST_CHECK_EQUAL( st["modelsLoaded"].asUInt(), 0u );
    ap.cleanup();
    BOOST_CHECK_EQUAL( ap.get_state()["modelsLoaded"].asUInt(), 0u );
}

/// Stopping an AR session that is still opening abandons the open:
/// the instance fails, and the late completion changes nothing.
///
BOOST_AUTO_TEST_CASE( Ar_stop_while_opening_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    provider->ar.hold = true;
    Recorder rec {};
    Ar_player ap { "ar_4", ar_config(true), Desktop, provider };
    ap.initialize( rec.callbacks() );
    BOOST_TEST( (ap.phase() == Instance_phase::Initializing) );

    ap.stop();
    BOOST_TEST( (ap.phase() == Instance_phase::Failed) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 1u );
    BOOST_REQUIRE( rec.outcome );
    BOOST_TEST( rec.outcome->code() == "stopped" );
    BOOST_TEST( rec.outcome->retryable() );
    BOOST_TEST( not ap.loading_state().is_loading() );

    provider->release_held();
    BOOST_TEST( (ap.phase() == Instance_phase::Failed) );
    BOOST_CHECK_EQUAL( rec.settled_calls, 1u );
    Json::Value st = ap.get_state();
    BOOST_TEST( not st["hasSession"].asBool() );
    BOOST_CHECK_EQUAL( st["modelsLoaded"].asUInt(), 0u );
    ap.cleanup();
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
}

/// The silent AR session drops its bootstrap when ended early
///
BOOST_AUTO_TEST_CASE( Silent_ar_end_test )
{
    LogFixture lf;
    boost::asio::io_service io;
    Silent_options so {};
    so.bootstrap_ms = 5;
    Silent_provider provider { io, so };
    std::unique_ptr<Ar_session> session = provider.make_ar();
    Ar_payload ap {};
    ap.glb_url = "https://cdn.example.com/chair.glb";
    unsigned done_calls { 0 };
    session->open( ap, Progress_handler(),
                   [&done_calls]( const boost::system::error_code& ) {
                       ++done_calls;
                   } );
    session->end();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_CHECK_EQUAL( done_calls, 0u );
    BOOST_TEST( not session->has_session() );
    BOOST_CHECK_EQUAL( session->models_loaded(), 0u );

    // an open that is left alone completes
    session->open( ap, Progress_handler(),
                   [&done_calls]( const boost::system::error_code &ec ) {
                       if (not ec) ++done_calls;
                   } );
    io.restart();
    io.run_for( std::chrono::milliseconds(50) );
    BOOST_CHECK_EQUAL( done_calls, 1u );
    BOOST_TEST( session->has_session() );
    BOOST_CHECK_EQUAL( session->models_loaded(), 1u );
    session->close();
}

/// Eviction destroys the instance and reports it once
///
BOOST_AUTO_TEST_CASE( Evict_test )
{
    LogFixture lf;
    auto provider = std::make_shared<Fake_provider>();
    Recorder rec {};
    Video_player vp { "video_10", video_config(), Desktop, provider };
    vp.initialize( rec.callbacks() );
    BOOST_TEST( (vp.phase() == Instance_phase::Ready) );
    vp.evict();
    BOOST_TEST( (vp.phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_EQUAL( rec.evicted_calls, 1u );
    BOOST_CHECK_EQUAL( provider->counters->closed, 1u );
    vp.evict();
    BOOST_CHECK_EQUAL( rec.evicted_calls, 1u );

    // reported even when the engine fails to close
    provider->video.throw_on_close = true;
    Video_player vp2 { "video_11", video_config(), Desktop, provider };
    vp2.initialize( rec.callbacks() );
    BOOST_CHECK_THROW( vp2.evict(), Media_cleanup_exception );
    BOOST_TEST( (vp2.phase() == Instance_phase::Destroyed) );
    BOOST_CHECK_EQUAL( rec.evicted_calls, 2u );
}
