/**
 * Methods for the configuration class Config
 * This uses a simplified JSON with a 2-level structure
 * consisting of (1) section, and (2) parameter within section.
 * Top level arrays (e.g. "players") are read from get_root().
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

#include <ctime>
#include <iomanip>
#include <boost/filesystem/fstream.hpp>

#include "logging.hpp"
#include "config.hpp"
#include "configutil.hpp"

namespace fs = boost::filesystem;


Config::Config()
{ }

/// CTOR with config path
///
Config::Config(const char* pathname)
{
    set_config_path(pathname);
}

/// Sets the configuration path.  This does *not* verify that
/// the file exists.
/// * May throw std::invalid_argument (no HOME for a ~ path)
///
void Config::set_config_path( const std::string& p )
{
    m_config_path = expand_home(p);
}

/// Read the configuration file named by m_config_path, replacing any
/// document loaded before.
/// * May throw Config_file_error
///
void Config::read_config()
{
    if (not fs::exists(m_config_path)) {
        LOG_ERROR(Lgr) << "Config no such file: " << m_config_path;
        throw Config_file_error();
    }
    Json::Value root;
    try {
        fs::ifstream sfile(m_config_path);
        sfile >> root;       // n.b. may throw a Json::RuntimeError
    }
    catch (std::exception &e) {
        LOG_ERROR(Lgr) << "Config error reading from "
                       << m_config_path << ": " << e.what();
        throw Config_file_error();
    }
    if (not root.isObject()) {
        LOG_ERROR(Lgr) << "Config file " << m_config_path
                       << " does not hold a JSON object";
        throw Config_file_error();
    }
    m_croot = root;
    m_file_writetime = fs::last_write_time(m_config_path);
    extract_schema();
}

/// Read configuration from JSON text rather than a file. The path
/// and write time are left alone.
/// * May throw Config_error
///
void Config::read_text( const std::string &text )
{
    std::string errs;
    Json::Value root;
    if (not parse_json_text( text, root, errs )) {
        LOG_ERROR(Lgr) << "Config error parsing text: " << errs;
        throw Config_error();
    }
    if (not root.isObject()) {
        LOG_ERROR(Lgr) << "Config text is not a JSON object";
        throw Config_error();
    }
    m_croot = root;
    extract_schema();
}

/// Record the declared schema, or "unknown".
///
void Config::extract_schema()
{
    const Json::Value &sch = m_croot["schema"];
    m_schema = sch.isString() ? sch.asString() : std::string("unknown");
}

/// Log the file name, its last write time, and the declared schema
///
void Config::log_about() const
{
    LOG_INFO(Lgr) << "Config loaded file " << m_config_path;
    if (m_file_writetime > 0) {
        std::string lwt = std::ctime(&m_file_writetime);
        lwt.pop_back();
        LOG_INFO(Lgr) << "Config schema " << m_schema
                      << ", last written " << lwt;
    } else {
        LOG_INFO(Lgr) << "Config schema " << m_schema;
    }
}

/// True if the file on disk is newer than the one loaded.  False if
/// nothing was ever loaded from a file, or the file is gone.
/// * Will not throw
///
bool Config::file_has_changed() const
{
    if (m_file_writetime <= 0) { return false; }
    boost::system::error_code ec;
    std::time_t mtime = fs::last_write_time( m_config_path, ec );
    if (ec) { return false; }
    return (mtime > m_file_writetime);
}

////////////////////////////////////////////////////////////////////////

/// Locate section.param.  Returns nullptr if absent.  A present value
/// that cannot be read as JSON type jt is logged and rejected.
/// * May throw Config_error
///
const Json::Value*
Config::lookup( const char *section, const char *param,
                Json::ValueType jt ) const
{
    const Json::Value &sec = m_croot[section];
    if (not sec.isObject()) { return nullptr; }
    const Json::Value &val = sec[param];
    if (val.isNull()) { return nullptr; }
    bool ok = val.isConvertibleTo(jt);
    if (jt == Json::stringValue) { ok = val.isString(); }
    if ((jt == Json::booleanValue) and not val.isBool()) { ok = false; }
    if (not ok) {
        LOG_ERROR(Lgr) << "Config " << section << "." << param
                       << " has the wrong type: " << val.toStyledString();
        throw Config_error();
    }
    return &val;
}

bool Config::get_bool( const char *section, const char *param, bool &value )
{
    const Json::Value *jv = lookup( section, param, Json::booleanValue );
    if (not jv) { return false; }
    value = jv->asBool();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "="
                  << (value ? "true" : "false");
    return true;
}

bool Config::get_double( const char *section, const char *param, double &value )
{
    const Json::Value *jv = lookup( section, param, Json::realValue );
    if (not jv) { return false; }
    value = jv->asDouble();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "="
                  << std::showpoint << value;
    return true;
}

bool Config::get_unsigned( const char *section, const char *param,
                           unsigned &value )
{
    const Json::Value *jv = lookup( section, param, Json::uintValue );
    if (not jv) { return false; }
    value = jv->asUInt();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    return true;
}

bool Config::get_string( const char *section, const char *param,
                         std::string &value )
{
    const Json::Value *jv = lookup( section, param, Json::stringValue );
    if (not jv) { return false; }
    value = jv->asString();
    LOG_INFO(Lgr) << "Config " << section << "." << param << "=" << value;
    return true;
}
