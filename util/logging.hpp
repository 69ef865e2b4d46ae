#pragma once

/* Logging for the medialife host, its core library and the unit tests.
 *
 * Every component writes through the one global severity logger Lgr
 * with the LOG_* macros.  Records carry a timestamp, the severity and
 * the application name given to init_logging: "medialife" for the host,
 * the suite name for a test executable.  The host logs to rotating
 * files collected under DefaultLogCollectDir, optionally echoed to the
 * console; in --test mode and in the tests the choice is made per call.
 * Player ids (e.g. "video_3") and "Lifecycle:" prefixes identify the
 * component inside the message text.
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

/// Include ahead of other Boost.Log headers; the library is linked shared.
#ifndef BOOST_LOG_DYN_LINK
#define BOOST_LOG_DYN_LINK 1
#endif

#include <boost/log/trivial.hpp>
#include <boost/log/sources/severity_logger.hpp>

namespace lt = boost::log::trivial;

typedef
   boost::log::sources::severity_logger< lt::severity_level >
   medialife_logger_t;

extern medialife_logger_t  Lgr;  // global log source

#define LOG_DEBUG(_logger) BOOST_LOG_SEV(_logger,lt::debug)
#define LOG_INFO(_logger) BOOST_LOG_SEV(_logger,lt::info)
#define LOG_WARNING(_logger) BOOST_LOG_SEV(_logger,lt::warning)
#define LOG_ERROR(_logger) BOOST_LOG_SEV(_logger,lt::error)

/* init_logging flags: which sinks to attach (rotating file, std::clog)
 * and whether debug records pass the filter.  The host maps --console
 * and --debug onto these.
 */
#define LF_FILE    1
#define LF_CONSOLE 2
#define LF_DEBUG   4

/// Rotated files end up here, pruned to a week's worth
constexpr const char* DefaultLogCollectDir { "~/.local/state/medialife/old" };

/// app names every record; file_pattern is a Boost.Log file name
/// pattern such as "medialife_%5N.log".
void init_logging( const char* app, const char* file_pattern,
                   int flags=LF_FILE,
                   const char* collect_dir = DefaultLogCollectDir );
void set_debug_logging( bool );
void finish_logging();

