#pragma once


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

#include <ctime>
#include <string>
#include <boost/filesystem.hpp>
#include <jsoncpp/json/json.h>

/// Defects in the configuration
struct Config_error : std::exception {
    const char *what() const noexcept {
        return "Defective configuration file.";
    }
};

/// Error reading a config file.
///
struct Config_file_error : std::exception {
    const char *what() const noexcept {
        return "Missing or unreadable configuration file.";
    }
};

/* Configuration object. Loads a JSON document from a file (or text)
 * and makes parameters available by name within section.  Arrays and
 * nested objects are read from get_root().
 */
class Config {
private:
    std::time_t m_file_writetime {0};
    Json::Value m_croot {};
    std::string m_schema {};
    boost::filesystem::path m_config_path {};
    void extract_schema();
    const Json::Value* lookup( const char*, const char*, Json::ValueType ) const;
public:
    // each returns true iff section.param is present, leaving value
    // alone otherwise; a present value of the wrong type throws
    bool get_bool(const char*, const char*, bool&);
    bool get_double(const char*, const char*, double&);
    bool get_string(const char*, const char*, std::string&);
    bool get_unsigned(const char*, const char *, unsigned &);
    const std::string& get_schema() const { return m_schema; }
    const Json::Value& get_root() const { return m_croot; }
    const boost::filesystem::path& get_path() const { return m_config_path; }
    //
    bool file_has_changed() const;
    void log_about() const;
    void read_config();
    void read_text( const std::string& );
    void set_config_path( const std::string& );
    //
    Config();
    explicit Config(const char*); // config file pathname
};
