#pragma once
/**
 * Create, track and retire player instances.
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

#include <vector>
#include "player.hpp"
#include "engine.hpp"
#include "optimizer.hpp"

/// Default memory budget for eviction, MB
constexpr unsigned DefaultBudgetMB { 200 };


/// The factory is the sole owner of the registry of live instances,
/// kept in creation order.  Callers hold shared pointers to instances
/// but only the factory (or eviction) removes them.
///
class Player_factory {
private:
    spEngine_provider m_provider;
    App_defaults m_defaults;
    std::vector<spPlayer> m_registry {};
    unsigned long m_serial { 0 };
    spPlayer instantiate( const Media_config&, const Device_profile& );
    void remove( const Player* );
public:
    Player_factory( spEngine_provider, const App_defaults& = App_defaults() );
    ~Player_factory();
    Player_factory(const Player_factory&) = delete;
    void operator=(Player_factory const&) = delete;
    //
    spPlayer create_player( const Media_config&, const Device_signals&,
                            const Player_callbacks& = Player_callbacks() );
    std::vector<spPlayer> get_active_instances() const;
    std::vector<spPlayer> get_instances_by_type( Media_type ) const;
    bool destroy_instance( const spPlayer& );
    void destroy_all_instances();
    unsigned perform_memory_cleanup( unsigned budget_mb = DefaultBudgetMB );
    Json::Value get_stats() const;
    unsigned estimated_memory_mb() const;
    size_t size() const { return m_registry.size(); }
    //
    const App_defaults& defaults() const { return m_defaults; }
    void set_defaults( const App_defaults &d ) { m_defaults = d; }
    static unsigned cost_mb( Media_type );
};
