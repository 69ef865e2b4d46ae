

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


#include <cstdlib>
#include <string>
#include <memory>
#include <stdexcept>
#include <jsoncpp/json/json.h>
#include "configutil.hpp"

namespace fs = boost::filesystem;
using namespace std;

////////////////////////////////////////////////////////////////////////


/// Expand a leading '~' to the home directory in the argument path,
/// and return the result.  This relies on *nix specific environment
/// variable HOME. Only the forms "~" and "~/..." are handled; "~user"
/// is returned unchanged.
/// Will throw invalid_argument error if HOME is needed but not set.
///
fs::path expand_home(fs::path inpath)
{
    if (inpath.size() < 1) return inpath;
    string out { inpath.c_str() };
    if ((out[0] == '~') and ((out.size() == 1) or (out[1] == '/'))) {
        char const* phome = getenv("HOME");
        if (nullptr == phome) {
            throw invalid_argument("HOME not set in environment.");
        }
        out.replace(0, 1, phome);
        return fs::path(out);
    }
    return inpath;
}

////////////////////////////////////////////////////////////////////////

/// Parse JSON text into jvalue. Returns true on success; on failure
/// the parser diagnostics are left in errs and jvalue is unspecified.
/// * Will not throw
///
bool parse_json_text( const std::string &text, Json::Value &jvalue,
                      std::string &errs )
{
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader( builder.newCharReader() );
    const char *begin = text.data();
    return reader->parse( begin, begin+text.size(), &jvalue, &errs );
}
