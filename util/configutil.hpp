#pragma once

/* Small helpers for configuration handling.
 */

/*   Part of the medialife package.
 *
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
 *
 */

#include <string>
#include <boost/filesystem.hpp>

namespace Json {
    class Value;
}

boost::filesystem::path expand_home(boost::filesystem::path);
bool parse_json_text( const std::string&, Json::Value&, std::string& );
