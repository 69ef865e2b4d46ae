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

#include "baseplayer.hpp"

/// Augmented reality session.  Never attempted on a device whose
/// profile disables AR: initialize() fails with a device error before
/// any session handle is acquired.
///
class Ar_player : public Base_player {
private:
    std::unique_ptr<Ar_session> m_session {};
protected:
    virtual bool precheck( Media_error& );
    virtual void acquire_handle();
    virtual void open_handle( Progress_handler, Done_handler );
    virtual void release_handle();
public:
    Ar_player( const std::string&, const Media_config&,
               const Device_profile&, spEngine_provider );
    virtual ~Ar_player();
    //
    virtual void play();
    virtual void pause();
    virtual void stop();
    virtual Json::Value get_state() const;
    virtual void set_state( const Json::Value& );
};
