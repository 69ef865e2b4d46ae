/**
 * Media_host : compose the media lifecycle core into a long running
 * process driven by the configuration file and POSIX signals.
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

#include <chrono>
#include "mediahost.hpp"
#include "main.hpp"
#include "silentengine.hpp"
#include "logging.hpp"

namespace po = boost::program_options;

namespace {

/// Logs what one controller reports and retries recoverable failures.
///
class Host_listener : public Media_listener {
private:
    std::string m_name;
    Lifecycle_controller *m_ctl;
public:
    Host_listener( const std::string &name, Lifecycle_controller *ctl )
        : m_name(name), m_ctl(ctl) {}
    virtual void on_load() {
        LOG_INFO(Lgr) << m_name << " loaded";
    }
    virtual void on_error( const Media_error &e ) {
        LOG_WARNING(Lgr) << m_name << " " << e;
        if (e.retryable() and not m_ctl->out_of_retries()) {
            m_ctl->retry();
        } else if (m_ctl->out_of_retries()) {
            LOG_ERROR(Lgr) << m_name << " gave up";
        }
    }
    virtual void on_progress( double p ) {
        LOG_DEBUG(Lgr) << m_name << " progress " << p;
    }
    virtual void on_end() {
        LOG_INFO(Lgr) << m_name << " ended";
    }
    virtual void on_state_change( const Json::Value &state ) {
        LOG_DEBUG(Lgr) << m_name << " state " << state.toStyledString();
    }
};

}


/// CTOR
///
Media_host::Media_host( bool test )
    : m_config( std::make_unique<Config>() ),
      m_test(test)
{ }

/// DTOR.  Controllers go before the factory they refer to.
///
Media_host::~Media_host()
{
    m_controllers.clear();
    m_listeners.clear();
    m_factory.reset();
}

/// Read the file at p and check its identity: schema, application
/// name and a declared version.  Nothing of the running host changes.
/// * May throw Config_error and friends
///
std::unique_ptr<Config> Media_host::load_config( const std::string &p )
{
    constexpr const char* GSection { "General" };
    auto cfg = std::make_unique<Config>();
    cfg->set_config_path( p );
    cfg->read_config();    // may throw

    if (cfg->get_schema() != "1.0") {
        LOG_ERROR(Lgr) << "Invalid schema '" << cfg->get_schema()
                       << "' for file " << p;
        throw Config_error();
    }
    std::string appname {};
    if (not cfg->get_string( GSection, "application", appname )
        or appname != Main::AppName) {
        LOG_ERROR(Lgr) << "Invalid application in config file " << p;
        throw Config_error();
    }
    std::string version {};
    if (not cfg->get_string( GSection, "version", version )) {
        LOG_ERROR(Lgr) << "No declared version in config file " << p;
        throw Config_error();
    }
    return cfg;
}

/// Build the provider, factory and controllers from m_config.
/// * May throw Config_error
///
void Media_host::apply_config()
{
    m_config->get_string( "General", "version", m_cfgversion );
    m_config->log_about();
    m_lopts = Lifecycle_options::from_config( *m_config );
    if (m_budget_override) {
        m_lopts.memory_budget_mb = *m_budget_override;
        LOG_INFO(Lgr) << "Memory budget " << m_lopts.memory_budget_mb
                      << "MB from command line";
    }
    m_signals = Device_signals::from_config( *m_config );
    m_provider = std::make_shared<Silent_provider>(
        m_io, Silent_options::from_config( *m_config ) );
    m_factory = std::make_unique<Player_factory>(
        m_provider, App_defaults::from_config( *m_config ) );
    load_players();
}

/// Configure the application from a file indicated by p with
/// a program options variables map vm (which may override settings
/// in the config file).
/// * May throw Config_error and friends
///
void Media_host::configure( const std::string &p, const po::variables_map &vm )
{
    m_config = load_config( p );
    if (vm.count("budget")) {
        m_budget_override = vm["budget"].as<unsigned>();
    }
    apply_config();
    if (m_test) {
        LOG_INFO(Lgr) << "Test mode: " << m_controllers.size()
                      << " players will be created once";
    }
}

/// Clean up and drop every controller, then the factory and provider.
///
void Media_host::teardown()
{
    for (auto &ctl : m_controllers) {
        ctl->stop_periodic_cleanup();
        ctl->cleanup();
    }
    m_controllers.clear();
    m_listeners.clear();
    if (m_factory) {
        m_factory->destroy_all_instances();
    }
    m_factory.reset();
    m_provider.reset();
}

/// Replace the running players with those of the changed config file.
/// A file that fails its checks leaves the running players alone.
///
void Media_host::reload()
{
    std::unique_ptr<Config> fresh {};
    try {
        fresh = load_config( m_config->get_path().string() );
    }
    catch (const Config_error&) {
        LOG_ERROR(Lgr) << "Changed configuration rejected, keeping players";
        return;
    }
    catch (const Config_file_error&) {
        LOG_ERROR(Lgr) << "Changed configuration unreadable, keeping players";
        return;
    }
    teardown();
    m_config = std::move( fresh );
    apply_config();    // may throw
    for (auto &ctl : m_controllers) {
        ctl->start();
    }
    LOG_INFO(Lgr) << "Reloaded " << m_controllers.size()
                  << " players, config version " << m_cfgversion;
}

/// Build a controller for each entry of the "players" array.  A
/// malformed entry is logged and skipped; it never reaches the factory.
/// * May throw Config_error
///
void Media_host::load_players()
{
    const Json::Value &jplayers = m_config->get_root()["players"];
    if (jplayers.isNull()) {
        LOG_WARNING(Lgr) << "No players configured";
        return;
    }
    if (not jplayers.isArray()) {
        LOG_ERROR(Lgr) << "Config 'players' must be an array";
        throw Config_error();
    }
    unsigned i = 0;
    for (const auto &jp : jplayers) {
        std::string name { "player[" + std::to_string(i++) + "]" };
        try {
            Media_config cfg = Media_config::from_json( jp );
            cfg.validate();
            auto ctl = std::make_unique<Lifecycle_controller>(
                m_io, *m_factory, cfg, m_signals, m_lopts );
            auto listener = std::make_shared<Host_listener>( name, ctl.get() );
            ctl->add_listener( listener );
            m_listeners.push_back( listener );
            m_controllers.push_back( std::move(ctl) );
            LOG_INFO(Lgr) << name << " " << media_type_name(cfg.type())
                          << " configured";
        }
        catch (const Media_config_exception &e) {
            LOG_ERROR(Lgr) << name << " skipped: " << e.error();
        }
    }
}

void Media_host::log_stats()
{
    Json::StreamWriterBuilder wb;
    wb["indentation"] = "";
    LOG_INFO(Lgr) << "Factory stats: "
                  << Json::writeString( wb, m_factory->get_stats() );
    for (const auto &ctl : m_controllers) {
        LOG_INFO(Lgr) << "Controller stats: "
                      << Json::writeString( wb, ctl->get_stats() );
    }
}

/// HUP: reload if the config file changed, else reset every controller
///
void Media_host::reset_all()
{
    Main::ResetReq = false;
    if (m_config->file_has_changed()) {
        LOG_INFO(Lgr) << "Config file " << m_config->get_path()
                      << " changed on disk";
        reload();
        return;
    }
    LOG_INFO(Lgr) << "Resetting all players on signal";
    for (auto &ctl : m_controllers) {
        ctl->reset();
    }
}

/// USR1: toggle hidden/visible
///
void Media_host::toggle_visibility()
{
    Main::VisibilityReq = false;
    m_hidden = not m_hidden;
    LOG_INFO(Lgr) << "Host now " << (m_hidden ? "hidden" : "visible");
    for (auto &ctl : m_controllers) {
        ctl->set_visibility( m_hidden );
    }
}

/// Run the event loop until Terminate is flagged.  Signal flags are
/// examined between slices of the loop.
///
void Media_host::run()
{
    boost::asio::io_service::work work { m_io };
    for (auto &ctl : m_controllers) {
        ctl->start();
    }
    LOG_INFO(Lgr) << "Running " << m_controllers.size() << " players.";
    for (;;) {
        if (Main::Terminate) { break; }
        m_io.run_for( std::chrono::milliseconds(250) );
        if (Main::Terminate) { break; }
        if (Main::ResetReq) { reset_all(); }
        if (Main::VisibilityReq) { toggle_visibility(); }
        if (m_io.stopped()) { m_io.restart(); }
        log_banner( false );
    }
    LOG_INFO(Lgr) << "Stopping players.";
    log_stats();
    teardown();
}

/// Test mode: create the players once, let their bootstrap complete,
/// log statistics, and clean up.
///
void Media_host::run_test()
{
    for (auto &ctl : m_controllers) {
        ctl->initialize();
    }
    m_io.restart();
    m_io.run_for( std::chrono::seconds(2) );
    m_factory->perform_memory_cleanup( m_lopts.memory_budget_mb );
    log_stats();
    for (auto &ctl : m_controllers) {
        ctl->cleanup();
    }
}
