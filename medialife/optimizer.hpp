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

#include "mediaconfig.hpp"
#include "devprofile.hpp"

class Config;

/// Application-wide defaults for optional config fields.
///
struct App_defaults {
    bool default_active { true };
    bool show_controls { true };
    bool adaptive_streaming { true };
    Video_quality max_video_quality { Video_quality::q4k };
    double default_volume { 1.0 };
    //
    static App_defaults from_config( Config& );
};

extern Media_config optimize( const Media_config&,
                              const App_defaults&,
                              const Device_profile& );
