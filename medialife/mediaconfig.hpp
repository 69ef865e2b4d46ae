#pragma once

/// Declarative player configurations. A Media_config names one media
/// type and should carry exactly the payload for that type.  Configs
/// arriving from callers may be defective; validate() detects that.

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
#include <boost/optional.hpp>
#include <jsoncpp/json/json.h>
#include "common.hpp"
#include "mediaerror.hpp"


/// Video resolution ceilings, ordered
enum class Video_quality {
    q480p,
    q720p,
    q1080p,
    q4k
};

/// AR interaction modes
enum class Ar_mode {
    automatic,  // "auto": engine picks
    object,
    marker,
    location
};

enum class Ar_performance {
    low,
    high
};

extern const char* quality_name( Video_quality );
extern Video_quality strtoquality( const std::string& );
extern const char* ar_mode_name( Ar_mode );
extern Ar_mode strtoarmode( const std::string& );


/// Streaming video.  Buffer fields are filled in by the optimizer.
///
struct Video_payload {
    std::string url {};
    std::string poster {};
    std::string title {};
    bool autoplay { false };
    bool loop { false };
    bool muted { false };
    boost::optional<bool> controls {};
    boost::optional<Video_quality> quality {};
    boost::optional<bool> adaptive {};
    boost::optional<double> volume {};
    unsigned long max_buffer_bytes { 0 };
    unsigned back_buffer_secs { 0 };
    unsigned max_buffer_secs { 0 };
};

/// Real-time 3D engine viewport.  Render fields are set by the optimizer.
///
struct Engine3d_payload {
    std::string project_id {};
    std::string build_path {};
    Json::Value scene_config {};   // opaque to us
    bool antialias { true };
    bool prefer_gpu { true };
    bool preload { true };
    bool high_performance { false };
    bool fill_window { true };
};

/// Augmented reality session: model references plus tracking targets.
///
struct Ar_payload {
    std::string glb_url {};
    std::string usdz_url {};
    Json::Value markers { Json::arrayValue };
    Json::Value locations { Json::arrayValue };
    Ar_mode mode { Ar_mode::automatic };
    bool is_open { false };
    Ar_performance performance { Ar_performance::high };
    unsigned max_fps { 60 };
    bool lighting { true };
    bool occlusion { true };
    bool session_allowed { true };
    //
    unsigned model_count() const;
};


/// One player configuration.  Unset active means: use the app default.
///
class Media_config {
private:
    Media_type m_type { Media_type::video };
    boost::optional<bool> m_active {};
    boost::optional<Video_payload> m_video {};
    boost::optional<Engine3d_payload> m_engine3d {};
    boost::optional<Ar_payload> m_ar {};
public:
    Media_config() {}
    explicit Media_config( Media_type t ) : m_type(t) {}
    static Media_config from_json( const Json::Value& );
    //
    Media_type type() const { return m_type; }
    const boost::optional<bool>& active_flag() const { return m_active; }
    bool is_active() const { return m_active.value_or(true); }
    void set_active( bool a ) { m_active = a; }
    //
    const boost::optional<Video_payload>& video() const { return m_video; }
    const boost::optional<Engine3d_payload>& engine3d() const { return m_engine3d; }
    const boost::optional<Ar_payload>& ar() const { return m_ar; }
    Video_payload& video_payload();
    Engine3d_payload& engine3d_payload();
    Ar_payload& ar_payload();
    void set_video( const Video_payload &p ) { m_video = p; }
    void set_engine3d( const Engine3d_payload &p ) { m_engine3d = p; }
    void set_ar( const Ar_payload &p ) { m_ar = p; }
    //
    boost::optional<Media_error> defect() const;
    void validate() const;
    Json::Value to_json() const;
};
