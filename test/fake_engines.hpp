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

#pragma once

/// Scriptable engines for the unit tests.  Every handle made by a
/// Fake_provider reports into the provider's shared Fake_counters, so
/// tests can see how many handles were made, opened and closed even
/// after the handles are gone.

#include <boost/asio.hpp>
#include "engine.hpp"
#include "engineerror.hpp"

/// What a fake handle does when opened
struct Fake_script {
    Engine_errc outcome { Engine_errc::success };
    bool throw_on_open { false };
    bool throw_on_close { false };
    bool hold { false };            // never complete on its own
};

class Fake_video;

struct Fake_counters {
    unsigned made { 0 };
    unsigned opened { 0 };
    unsigned closed { 0 };
    Fake_video *live_video { nullptr };     // most recently opened video
    Done_handler held_done {};              // completion of a held handle
};

/// Provider.  With an io_service, completions are posted to it;
/// without one they run inside open().
///
class Fake_provider : public Engine_provider {
private:
    boost::asio::io_service *m_io;
public:
    Fake_script video {};
    Fake_script scene {};
    Fake_script ar {};
    std::shared_ptr<Fake_counters> counters { std::make_shared<Fake_counters>() };
    //
    explicit Fake_provider( boost::asio::io_service *io = nullptr ) : m_io(io) {}
    virtual ~Fake_provider();
    virtual std::unique_ptr<Video_decoder> make_video();
    virtual std::unique_ptr<Scene_engine> make_scene();
    virtual std::unique_ptr<Ar_session> make_ar();
    //
    void fire_video_end();
    void release_held( Engine_errc = Engine_errc::success );
};
