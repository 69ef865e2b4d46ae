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

#include <boost/asio.hpp>
#include "engine.hpp"

class Config;

/// Settings for the silent engines (Silent_engine config section)
///
struct Silent_options {
    unsigned bootstrap_ms { 50 };   // simulated bootstrap time
    bool fullscreen { false };      // is fullscreen "available"?
    unsigned clip_secs { 0 };       // video length; 0 is endless
    //
    static Silent_options from_config( Config& );
};


/// Headless engines: no output, but they follow the handle contract,
/// completing bootstrap on the io_service after bootstrap_ms.  These
/// are placeholders where no native engine is linked.
///
class Silent_provider : public Engine_provider {
private:
    boost::asio::io_service &m_io;
    Silent_options m_opts;
public:
    Silent_provider( boost::asio::io_service&, const Silent_options& );
    virtual ~Silent_provider();
    Silent_provider(const Silent_provider&) = delete;
    void operator=(Silent_provider const&) = delete;
    //
    virtual std::unique_ptr<Video_decoder> make_video();
    virtual std::unique_ptr<Scene_engine> make_scene();
    virtual std::unique_ptr<Ar_session> make_ar();
};
