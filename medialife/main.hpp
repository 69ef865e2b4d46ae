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

#include <memory>
#include <string>

class Media_host;

extern void log_banner(bool);

namespace Main {
    // The (unique) host instance
    extern std::unique_ptr<Media_host> host;
    extern const char *AppName;
    extern std::string DefaultConfigPath;
    // Set by the signal handler, examined in the host's loop
    extern volatile bool Terminate;
    extern volatile bool VisibilityReq;
    extern volatile bool ResetReq;
    extern volatile int  gTermSignal;
}
