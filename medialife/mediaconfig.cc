/**
 * Media_config: loading from JSON, validation, and rendering.
 */

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

#include <initializer_list>
#include "mediaconfig.hpp"
#include "logging.hpp"

namespace {

/// Reject the configuration with an unsupported-kind error.
/// * Will throw Media_config_exception
///
[[noreturn]] void reject( const std::string &msg )
{
    LOG_ERROR(Lgr) << "Media config rejected: " << msg;
    throw Media_config_exception( Media_error::unsupported(msg) );
}

/// Fetch optional string member key of jv into s.
///
void opt_string( const Json::Value &jv, const char *key, std::string &s )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    if (not m.isString()) {
        reject( std::string("'") + key + "' must be a string" );
    }
    s = m.asString();
}

void opt_bool( const Json::Value &jv, const char *key, bool &b )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    if (not m.isBool()) {
        reject( std::string("'") + key + "' must be a boolean" );
    }
    b = m.asBool();
}

void opt_bool( const Json::Value &jv, const char *key,
               boost::optional<bool> &b )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    bool val { false };
    opt_bool( jv, key, val );
    b = val;
}

void opt_unsigned( const Json::Value &jv, const char *key, unsigned &u )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    if (not m.isUInt()) {
        reject( std::string("'") + key + "' must be a nonnegative integer" );
    }
    u = m.asUInt();
}

void opt_double( const Json::Value &jv, const char *key,
                 boost::optional<double> &d )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    if (not m.isNumeric()) {
        reject( std::string("'") + key + "' must be a number" );
    }
    d = m.asDouble();
}

void opt_list( const Json::Value &jv, const char *key, Json::Value &lst )
{
    const Json::Value &m = jv[key];
    if (m.isNull()) return;
    if (not m.isArray()) {
        reject( std::string("'") + key + "' must be a list" );
    }
    lst = m;
}

Video_payload load_video( const Json::Value &jv )
{
    Video_payload p {};
    opt_string( jv, "url", p.url );
    opt_string( jv, "poster", p.poster );
    opt_string( jv, "title", p.title );
    opt_bool( jv, "autoplay", p.autoplay );
    opt_bool( jv, "loop", p.loop );
    opt_bool( jv, "muted", p.muted );
    opt_bool( jv, "controls", p.controls );
    opt_bool( jv, "adaptive", p.adaptive );
    opt_double( jv, "volume", p.volume );
    std::string qstr {};
    opt_string( jv, "quality", qstr );
    if (not qstr.empty()) {
        try {
            p.quality = strtoquality( qstr );
        } catch (const Media_exception&) {
            reject( "unknown video quality '" + qstr + "'" );
        }
    }
    return p;
}

Engine3d_payload load_engine3d( const Json::Value &jv )
{
    Engine3d_payload p {};
    opt_string( jv, "project_id", p.project_id );
    opt_string( jv, "build_path", p.build_path );
    const Json::Value &sc = jv["scene_config"];
    if (not sc.isNull()) {
        if (not sc.isObject()) {
            reject( "'scene_config' must be an object" );
        }
        p.scene_config = sc;
    }
    return p;
}

Ar_payload load_ar( const Json::Value &jv )
{
    Ar_payload p {};
    opt_string( jv, "glb_url", p.glb_url );
    opt_string( jv, "usdz_url", p.usdz_url );
    opt_list( jv, "markers", p.markers );
    opt_list( jv, "locations", p.locations );
    opt_bool( jv, "is_open", p.is_open );
    opt_unsigned( jv, "max_fps", p.max_fps );
    std::string mstr {};
    opt_string( jv, "mode", mstr );
    if (not mstr.empty()) {
        try {
            p.mode = strtoarmode( mstr );
        } catch (const Media_exception&) {
            reject( "unknown AR mode '" + mstr + "'" );
        }
    }
    return p;
}

}

//////////////////////////// Utility ////////////////////////////////////

const char* quality_name( Video_quality q )
{
    switch(q) {
    case Video_quality::q480p: return "480p";
    case Video_quality::q720p: return "720p";
    case Video_quality::q1080p: return "1080p";
    case Video_quality::q4k: return "4k";
    default: return "?";
    }
}

/// Parse a quality name.
/// * May throw Media_exception
///
Video_quality strtoquality( const std::string &s )
{
    if (s == "480p") return Video_quality::q480p;
    if (s == "720p") return Video_quality::q720p;
    if (s == "1080p") return Video_quality::q1080p;
    if (s == "4k") return Video_quality::q4k;
    LOG_ERROR(Lgr) << "Unknown video quality '" << s << "'";
    throw Media_exception();
}

const char* ar_mode_name( Ar_mode m )
{
    switch(m) {
    case Ar_mode::automatic: return "auto";
    case Ar_mode::object: return "object";
    case Ar_mode::marker: return "marker";
    case Ar_mode::location: return "location";
    default: return "?";
    }
}

/// Parse an AR mode name.
/// * May throw Media_exception
///
Ar_mode strtoarmode( const std::string &s )
{
    if (s == "auto") return Ar_mode::automatic;
    if (s == "object") return Ar_mode::object;
    if (s == "marker") return Ar_mode::marker;
    if (s == "location") return Ar_mode::location;
    LOG_ERROR(Lgr) << "Unknown AR mode '" << s << "'";
    throw Media_exception();
}

/// Number of model references (glb, usdz) named by the payload
///
unsigned Ar_payload::model_count() const
{
    return (glb_url.empty() ? 0 : 1) + (usdz_url.empty() ? 0 : 1);
}

//////////////////////////// Media_config ///////////////////////////////

/// Build a config from JSON shaped as
///   { "type": "video", "active": true, "video": {...} }
/// Any payload members present are loaded, whether or not they match
/// the type; validate() judges that.
/// * May throw Media_config_exception
///
Media_config Media_config::from_json( const Json::Value &jv )
{
    if (not jv.isObject()) {
        reject( "configuration is not an object" );
    }
    const Json::Value &jtype = jv["type"];
    if (not jtype.isString()) {
        reject( "configuration has no type" );
    }
    Media_config cfg {};
    try {
        cfg.m_type = strtomediatype( jtype.asString() );
    } catch (const Media_type_exception&) {
        reject( "unknown media type '" + jtype.asString() + "'" );
    }
    opt_bool( jv, "active", cfg.m_active );
    // "playcanvas" is the older name of the engine3d payload
    for (const char *key : { "video", "engine3d", "playcanvas", "ar" }) {
        const Json::Value &jp = jv[key];
        if (jp.isNull()) continue;
        if (not jp.isObject()) {
            reject( std::string("payload '") + key + "' is not an object" );
        }
        if (std::string(key) == "video") {
            cfg.m_video = load_video( jp );
        } else if (std::string(key) == "ar") {
            cfg.m_ar = load_ar( jp );
        } else {
            if (cfg.m_engine3d) {
                reject( "both engine3d and playcanvas payloads given" );
            }
            cfg.m_engine3d = load_engine3d( jp );
        }
    }
    return cfg;
}

/// Video payload for modification.
/// * May throw Media_config_exception if there is none
///
Video_payload& Media_config::video_payload()
{
    if (not m_video) { reject( "no video payload" ); }
    return *m_video;
}

Engine3d_payload& Media_config::engine3d_payload()
{
    if (not m_engine3d) { reject( "no engine3d payload" ); }
    return *m_engine3d;
}

Ar_payload& Media_config::ar_payload()
{
    if (not m_ar) { reject( "no ar payload" ); }
    return *m_ar;
}

/// Describe the first shape defect found, if any: exactly one payload
/// must be present, it must match the type, and its required fields
/// must be populated.
/// * Will not throw
///
boost::optional<Media_error> Media_config::defect() const
{
    unsigned npayloads = (m_video ? 1 : 0) + (m_engine3d ? 1 : 0)
        + (m_ar ? 1 : 0);
    std::string tname { media_type_name(m_type) };
    if (npayloads > 1) {
        return Media_error::unsupported( "multiple payloads in a "
                                         + tname + " config" );
    }
    switch (m_type) {
    case Media_type::video:
        if (not m_video) {
            return Media_error::unsupported( "video config lacks video payload" );
        }
        if (m_video->url.empty()) {
            return Media_error::unsupported( "video payload requires a url" );
        }
        break;
    case Media_type::engine3d:
        if (not m_engine3d) {
            return Media_error::unsupported(
                "engine3d config lacks engine3d payload" );
        }
        if (m_engine3d->project_id.empty() and m_engine3d->build_path.empty()
            and m_engine3d->scene_config.isNull()) {
            return Media_error::unsupported(
                "engine3d payload requires project_id, build_path or scene_config" );
        }
        break;
    case Media_type::ar:
        if (not m_ar) {
            return Media_error::unsupported( "ar config lacks ar payload" );
        }
        if (m_ar->glb_url.empty() and m_ar->usdz_url.empty()
            and m_ar->markers.empty() and m_ar->locations.empty()) {
            return Media_error::unsupported(
                "ar payload requires a model, marker or location reference" );
        }
        break;
    }
    return boost::none;
}

/// Check shape.
/// * May throw Media_config_exception
///
void Media_config::validate() const
{
    auto err = defect();
    if (err) {
        LOG_ERROR(Lgr) << "Media config rejected: " << err->message();
        throw Media_config_exception( *err );
    }
}

/// Render in the same shape from_json() accepts, plus optimizer fields.
///
Json::Value Media_config::to_json() const
{
    Json::Value jv { Json::objectValue };
    jv["type"] = media_type_name(m_type);
    if (m_active) {
        jv["active"] = *m_active;
    }
    if (m_video) {
        Json::Value &p = jv["video"];
        p["url"] = m_video->url;
        if (not m_video->poster.empty()) p["poster"] = m_video->poster;
        if (not m_video->title.empty()) p["title"] = m_video->title;
        p["autoplay"] = m_video->autoplay;
        p["loop"] = m_video->loop;
        p["muted"] = m_video->muted;
        if (m_video->controls) p["controls"] = *m_video->controls;
        if (m_video->adaptive) p["adaptive"] = *m_video->adaptive;
        if (m_video->volume) p["volume"] = *m_video->volume;
        if (m_video->quality) p["quality"] = quality_name(*m_video->quality);
        p["max_buffer_bytes"] = Json::UInt64(m_video->max_buffer_bytes);
        p["back_buffer_secs"] = m_video->back_buffer_secs;
        p["max_buffer_secs"] = m_video->max_buffer_secs;
    }
    if (m_engine3d) {
        Json::Value &p = jv["engine3d"];
        if (not m_engine3d->project_id.empty()) {
            p["project_id"] = m_engine3d->project_id;
        }
        if (not m_engine3d->build_path.empty()) {
            p["build_path"] = m_engine3d->build_path;
        }
        if (not m_engine3d->scene_config.isNull()) {
            p["scene_config"] = m_engine3d->scene_config;
        }
        p["antialias"] = m_engine3d->antialias;
        p["prefer_gpu"] = m_engine3d->prefer_gpu;
        p["preload"] = m_engine3d->preload;
        p["high_performance"] = m_engine3d->high_performance;
        p["fill_window"] = m_engine3d->fill_window;
    }
    if (m_ar) {
        Json::Value &p = jv["ar"];
        if (not m_ar->glb_url.empty()) p["glb_url"] = m_ar->glb_url;
        if (not m_ar->usdz_url.empty()) p["usdz_url"] = m_ar->usdz_url;
        if (not m_ar->markers.empty()) p["markers"] = m_ar->markers;
        if (not m_ar->locations.empty()) p["locations"] = m_ar->locations;
        p["mode"] = ar_mode_name(m_ar->mode);
        p["is_open"] = m_ar->is_open;
        p["performance"] =
            (m_ar->performance == Ar_performance::low) ? "low" : "high";
        p["max_fps"] = m_ar->max_fps;
        p["lighting"] = m_ar->lighting;
        p["occlusion"] = m_ar->occlusion;
        p["session_allowed"] = m_ar->session_allowed;
    }
    return jv;
}
