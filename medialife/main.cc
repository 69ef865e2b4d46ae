/**
 * medialife host application.  Creates a media player for each entry
 * in its configuration and keeps them alive: retrying failures,
 * evicting inactive players over the memory budget.
 *
 * Expects a configuration file, by default
 * ~/.config/medialife/medialife.json
 *
 * It responds to signals at runtime:
 *    TERM, INT (^c), QUIT -- clean up all players and exit
 *    HUP  -- reset every player
 *    USR1 -- toggle hidden/visible (hidden pauses video)
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

#include <cerrno>
#include <cstring>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <signal.h>

#include <boost/program_options.hpp>

#include "version.h"
#include "main.hpp"
#include "mediahost.hpp"
#include "logging.hpp"
#include "configutil.hpp"

namespace po = boost::program_options;

namespace Main {
    std::unique_ptr<Media_host> host {};

    /// Our official name, also required in the config file
    const char *AppName { "medialife" };

    /// Config file unless changed on the command line
    std::string DefaultConfigPath { "~/.config/medialife/medialife.json" };

    volatile bool Terminate = false;
    volatile bool VisibilityReq = false;
    volatile bool ResetReq = false;
    volatile int  gTermSignal = 0;
}

namespace {

const char *BuildStamp { VERSION_STR "  built " __DATE__ " " __TIME__ };

/// Flag-only handler; the host loop does the work.
///
void on_signal( int sig )
{
    switch (sig) {
    case SIGHUP:
        Main::ResetReq = true;
        break;
    case SIGUSR1:
        Main::VisibilityReq = true;
        break;
    default:
        Main::gTermSignal = sig;
        Main::Terminate = true;
        break;
    }
}

/// Install on_signal for every signal the host responds to.
///
void install_signal_handlers()
{
    struct sigaction sa;
    memset( &sa, 0, sizeof(sa) );
    sa.sa_handler = on_signal;
    for (int sig : { SIGTERM, SIGINT, SIGQUIT, SIGHUP, SIGUSR1 }) {
        if (sigaction( sig, &sa, nullptr ) != 0) {
            std::cerr << "Cannot handle signal " << sig << ": "
                      << strerror(errno) << std::endl;
        }
    }
}

}

/// Log the application name and build. Unless forced, this happens at
/// most once per 10 minutes so that each rotated log file names the
/// build that wrote it.
///
void log_banner( bool force )
{
    static time_t last_banner { 0 };
    const time_t now = time( nullptr );
    if (force or (now - last_banner) >= 600) {
        LOG_INFO(Lgr) << Main::AppName << " version " << BuildStamp;
        last_banner = now;
    }
}


namespace {

/// Parse the command line.  Exits for --help, --version, or an
/// unparseable command line.
///
po::variables_map parse_command( int ac, char **av )
{
    po::options_description general { "General" };
    general.add_options()
        ("help", "show these options and exit")
        ("version", "show the version and exit")
        ("config", po::value<std::string>()->default_value(Main::DefaultConfigPath),
         "configuration file")
        ("console", "copy log records to the console")
        ("debug", "include debug records in the log");
    po::options_description host { "Host" };
    host.add_options()
        ("budget", po::value<unsigned>(), "memory budget in MB, overriding the config")
        ("test", "create the players once, log statistics, and exit");
    po::options_description all {};
    all.add( general ).add( host );

    po::variables_map vm {};
    try {
        po::store( po::parse_command_line( ac, av, all ), vm );
        po::notify( vm );
    }
    catch (const po::error &err) {
        std::cerr << Main::AppName << ": " << err.what() << "\n" << all << std::endl;
        exit(13);
    }
    if (vm.count("help")) {
        std::cout << all << std::endl;
        exit(0);
    }
    if (vm.count("version")) {
        std::cout << Main::AppName << " version " << BuildStamp << std::endl;
        exit(0);
    }
    return vm;
}

/// Start logging as the options direct.  Test mode logs to the
/// console only.
///
void start_logging( const po::variables_map &vm, bool test_mode )
{
    std::string pattern {};
    try {
        pattern = expand_home( "~/logs/medialife_%5N.log" ).string();
    }
    catch (const std::invalid_argument &ex) {
        std::cerr << "No place for the log file: " << ex.what() << std::endl;
        exit(14);
    }
    int mode { LF_FILE };
    if (test_mode) {
        mode = LF_CONSOLE;
    } else if (vm.count("console")) {
        mode |= LF_CONSOLE;
    }
    if (vm.count("debug")) {
        mode |= LF_DEBUG;
    }
    init_logging( Main::AppName, pattern.c_str(), mode );
    log_banner( true );
}

/// Configure and run the host.  Returns the process exit code:
/// 0 normal, 1 configuration fault, 2 runtime fault.
///
int run_host( const po::variables_map &vm, bool test_mode )
{
    try {
        Main::host = std::make_unique<Media_host>( test_mode );
        Main::host->configure( vm["config"].as<std::string>(), vm );
        if (test_mode) {
            Main::host->run_test();
        } else {
            Main::host->run();      // until a terminating signal
        }
    }
    catch (const Config_error &ex) {
        LOG_ERROR(Lgr) << "Configuration rejected: " << ex.what();
        return 1;
    }
    catch (const Config_file_error &ex) {
        LOG_ERROR(Lgr) << "Configuration unreadable: " << ex.what();
        return 1;
    }
    catch (const std::exception &ex) {
        LOG_ERROR(Lgr) << "Host stopped by error: " << ex.what();
        return 2;
    }
    return 0;
}

}


/// Parse options, start logging, and run the host until a signal
/// stops it (or once, in test mode).
///
int main( int ac, char **av )
{
    po::variables_map vm = parse_command( ac, av );
    const bool test_mode = (vm.count("test") > 0);
    install_signal_handlers();
    start_logging( vm, test_mode );

    int status = run_host( vm, test_mode );
    Main::host.reset();

    if (Main::gTermSignal) {
        LOG_INFO(Lgr) << "Stopped by signal " << Main::gTermSignal;
    }
    LOG_INFO(Lgr) << Main::AppName << " exit status " << status;
    finish_logging();
    return status;
}
