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
#include <string>
#include <vector>

#include <boost/asio.hpp>
#include <boost/optional.hpp>
#include <boost/program_options.hpp>

#include "config.hpp"
#include "lifecycle.hpp"


///////////////////////////////// Media_host //////////////////////////////


/// The application context: owns the configuration, the event loop,
/// the engine provider, the one Player_factory, and a
/// Lifecycle_controller per configured player.
///
class Media_host {
private:
    std::unique_ptr<Config> m_config;       // current configuration object
    boost::asio::io_service m_io {};
    spEngine_provider m_provider {};
    std::unique_ptr<Player_factory> m_factory {};
    std::vector<std::unique_ptr<Lifecycle_controller>> m_controllers {};
    std::vector<spMedia_listener> m_listeners {};
    Device_signals m_signals {};
    Lifecycle_options m_lopts {};
    bool m_test;                            // true: create once and exit
    bool m_hidden { false };
    std::string m_cfgversion {"?"};        // config file's version
    boost::optional<unsigned> m_budget_override {};  // from command line
    //
    std::unique_ptr<Config> load_config( const std::string& );
    void apply_config();
    void load_players();
    void teardown();
    void reload();
    void log_stats();
    void reset_all();
    void toggle_visibility();
public:
    explicit Media_host( bool test );
    Media_host(const Media_host&) = delete;
    void operator=(Media_host const&) = delete;
    ~Media_host();
    //
    void configure( const std::string&,
                    const boost::program_options::variables_map& );
    const std::string& get_config_version() const { return m_cfgversion; }
    size_t controller_count() const { return m_controllers.size(); }
    void run();
    void run_test();
};
