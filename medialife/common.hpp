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

/// Some elementary definitions used in multiple sources...

#include <exception>
#include <string>


/// Kinds of player instance. One Player class implements each.
///
enum class Media_type {
    video,      // streaming video through a decoder
    engine3d,   // real-time 3D engine viewport
    ar          // augmented reality session with loaded models
};


/// Phases of a player instance:
///   Uninitialized : created, no engine handle yet
///   Initializing  : engine handle acquired, bootstrap in progress
///   Ready         : bootstrap succeeded, controls functional
///   Failed        : bootstrap failed, Media_error is populated
///   Destroyed     : handle released; terminal
///
enum class Instance_phase {
    Uninitialized,
    Initializing,
    Ready,
    Failed,
    Destroyed
};


/// Thrown on problems with players. Specialized in other sources.
///
struct Media_exception : public std::exception {
    const char* what() const throw() { return "Generic media player exception"; }
};

/// Problem releasing a native engine handle
struct Media_cleanup_exception : public Media_exception {
    const char* what() const throw() { return "Media engine cleanup exception"; }
};

/// Unknown media type name
struct Media_type_exception : public Media_exception {
    const char* what() const throw() { return "Unknown media type"; }
};


extern const char* media_type_name( Media_type );
extern Media_type strtomediatype( const std::string& );
extern const char* phase_name( Instance_phase );
