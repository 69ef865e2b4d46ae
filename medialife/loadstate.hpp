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

#include <string>

namespace Json {
    class Value;
}

/// Stages of loading reported to callers
enum class Load_stage {
    initializing,
    loading,
    processing,
    ready,
    error
};

/// Loading progress of one initialization attempt. Progress never
/// decreases until begin() starts a new attempt.
///
class Loading_state {
private:
    bool m_loading { false };
    double m_progress { 0.0 };
    Load_stage m_stage { Load_stage::initializing };
    std::string m_message {};
public:
    bool is_loading() const { return m_loading; }
    double progress() const { return m_progress; }
    Load_stage stage() const { return m_stage; }
    const std::string& message() const { return m_message; }
    //
    void begin( const std::string& );
    bool advance( double, Load_stage, const std::string& );
    void finish_ready();
    void finish_error( const std::string& );
    void clear();
    Json::Value to_json() const;
};

extern const char* load_stage_name( Load_stage );
