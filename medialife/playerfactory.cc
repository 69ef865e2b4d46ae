/**
 * Player_factory : validate, optimize and instantiate players; keep
 * the registry; evict inactive players when over the memory budget.
 *
 * See the comments marked *EXTEND* for the sections that must be
 * updated when media types are added.
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
#include <initializer_list>
#include <iterator>
#include "playerfactory.hpp"
#include "logging.hpp"

////////////////////////////////////////////////////////////////////////////
/// *EXTEND*

#include "videoplayer.hpp"
#include "sceneplayer.hpp"
#include "arplayer.hpp"

/// Coarse static memory estimates per media type, MB.  Not measured.
///
unsigned Player_factory::cost_mb( Media_type t )
{
    switch (t) {
    case Media_type::video: return 10;
    case Media_type::engine3d: return 50;
    case Media_type::ar: return 30;
    // *EXTEND*
    }
    return 0;
}

/// Construct the player class for cfg's media type.
///
spPlayer Player_factory::instantiate( const Media_config &cfg,
                                      const Device_profile &prof )
{
    std::string id { std::string(media_type_name(cfg.type())) + "_"
                     + std::to_string(++m_serial) };
    switch (cfg.type()) {
    case Media_type::video:
        return std::make_shared<Video_player>( id, cfg, prof, m_provider );
    case Media_type::engine3d:
        return std::make_shared<Scene_player>( id, cfg, prof, m_provider );
    case Media_type::ar:
        return std::make_shared<Ar_player>( id, cfg, prof, m_provider );
    // *EXTEND*
    }
    LOG_ERROR(Lgr) << "Player_factory: no player for media type";
    throw Media_type_exception();
}

////////////////////////////////////////////////////////////////////////////
///                             Player_factory

/// CTOR
Player_factory::Player_factory( spEngine_provider provider,
                                const App_defaults &defs )
    : m_provider(provider),
      m_defaults(defs)
{ }

/// DTOR retires every remaining instance
Player_factory::~Player_factory()
{
    destroy_all_instances();
}

/// Create, register and initialize a player:
///  1. validate cfg
///  2. resolve a device profile from signals (never cached)
///  3. optimize cfg for the profile
///  4. instantiate, register, then initialize
/// Steps 1-3 fail without touching the registry.  A player whose
/// initialization fails stays registered (in phase Failed).
/// * May throw Media_config_exception
///
spPlayer Player_factory::create_player( const Media_config &cfg,
                                        const Device_signals &signals,
                                        const Player_callbacks &cbs )
{
    cfg.validate();
    Device_profile prof = resolve_profile( signals );
    Media_config eff = optimize( cfg, m_defaults, prof );
    spPlayer player = instantiate( eff, prof );
    m_registry.push_back( player );
    LOG_INFO(Lgr) << "Player_factory: registered " << player->id()
                  << " (tier " << tier_name(prof.tier) << ", "
                  << (eff.is_active() ? "active" : "inactive") << ")";
    player->initialize( cbs );
    return player;
}

/// Snapshot of every live registered instance.
///
std::vector<spPlayer> Player_factory::get_active_instances() const
{
    return m_registry;
}

/// Snapshot of the live instances of type t.
///
std::vector<spPlayer> Player_factory::get_instances_by_type( Media_type t ) const
{
    std::vector<spPlayer> found {};
    std::copy_if( m_registry.begin(), m_registry.end(),
                  std::back_inserter(found),
                  [t]( const spPlayer &p ) { return p->type() == t; } );
    return found;
}

void Player_factory::remove( const Player *pp )
{
    m_registry.erase(
        std::remove_if( m_registry.begin(), m_registry.end(),
                        [pp]( const spPlayer &p ) { return p.get() == pp; } ),
        m_registry.end() );
}

/// Find player by identity, remove it from the registry and clean it
/// up.  Returns false (doing nothing) if it is not registered.
/// * May throw Media_cleanup_exception (the player is removed anyway)
///
bool Player_factory::destroy_instance( const spPlayer &player )
{
    if (not player) return false;
    auto it = std::find( m_registry.begin(), m_registry.end(), player );
    if (it == m_registry.end()) {
        return false;
    }
    spPlayer keep { player };
    m_registry.erase( it );
    LOG_INFO(Lgr) << "Player_factory: destroying " << keep->id();
    keep->cleanup();
    return true;
}

/// Clean up every instance and empty the registry.  Cleanup failures
/// are logged.
///
void Player_factory::destroy_all_instances()
{
    std::vector<spPlayer> doomed;
    doomed.swap( m_registry );
    for (auto &p : doomed) {
        try {
            p->cleanup();
        }
        catch (const std::exception &e) {
            LOG_ERROR(Lgr) << "Player_factory: cleanup of " << p->id()
                           << " failed: " << e.what();
        }
    }
}

/// Sum of static costs of registered instances, MB
///
unsigned Player_factory::estimated_memory_mb() const
{
    unsigned total { 0 };
    for (const auto &p : m_registry) {
        total += cost_mb( p->type() );
    }
    return total;
}

/// Evict inactive instances (config active=false), oldest first, one
/// at a time until the estimate is at most 80% of budget_mb or no
/// inactive instance remains.  Active instances are never evicted.
/// Does nothing if the estimate is already within budget.  A cleanup
/// failure is logged and the sweep continues.
/// Returns the number of instances evicted.
///
unsigned Player_factory::perform_memory_cleanup( unsigned budget_mb )
{
    unsigned total = estimated_memory_mb();
    if (total <= budget_mb) {
        return 0;
    }
    LOG_WARNING(Lgr) << "Player_factory: estimated " << total
                     << "MB exceeds budget " << budget_mb << "MB";
    std::vector<spPlayer> order { m_registry };
    std::stable_partition( order.begin(), order.end(),
                           []( const spPlayer &p ) {
                               return not p->config().is_active(); } );
    unsigned evicted { 0 };
    for (auto &p : order) {
        if ((10ul * total) <= (8ul * budget_mb)) break;
        if (p->config().is_active()) break;   // only actives remain
        remove( p.get() );
        ++evicted;
        LOG_INFO(Lgr) << "Player_factory: evicting " << p->id();
        try {
            p->evict();
        }
        catch (const std::exception &e) {
            LOG_ERROR(Lgr) << "Player_factory: eviction cleanup of "
                           << p->id() << " failed: " << e.what();
        }
        total = estimated_memory_mb();
    }
    LOG_INFO(Lgr) << "Player_factory: evicted " << evicted
                  << ", estimate now " << total << "MB";
    return evicted;
}

/// {total_instances, by_type: {video, engine3d, ar}, memory_usage_mb}
///
Json::Value Player_factory::get_stats() const
{
    Json::Value jv { Json::objectValue };
    Json::Value by_type { Json::objectValue };
    for (Media_type t : { Media_type::video, Media_type::engine3d,
                          Media_type::ar }) {
        by_type[ media_type_name(t) ] =
            static_cast<Json::UInt>( get_instances_by_type(t).size() );
    }
    jv["total_instances"] = static_cast<Json::UInt>( m_registry.size() );
    jv["by_type"] = by_type;
    jv["memory_usage_mb"] = estimated_memory_mb();
    return jv;
}
