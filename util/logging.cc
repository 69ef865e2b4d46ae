/**
 * Boost logging setup and teardown functions.
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


#ifndef BOOST_LOG_DYN_LINK
#define BOOST_LOG_DYN_LINK 1
#endif

#include <iostream>
#include <stdexcept>
#include <string>

#include <boost/log/trivial.hpp>
#include <boost/log/expressions.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/log/sources/severity_logger.hpp>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/utility/setup/file.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/support/date_time.hpp>

#include <boost/core/null_deleter.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/sync_frontend.hpp>


namespace logging = boost::log;
namespace triv = boost::log::trivial;
namespace keywords = boost::log::keywords;
namespace sinks = boost::log::sinks;
namespace expr = boost::log::expressions;

#include "logging.hpp"
#include "configutil.hpp"

/// Name shown in every record, settable by init_logging
static std::string LogAppName { "medialife" };

/// Global log source for medialife:
medialife_logger_t  Lgr;

namespace {

/// Record layout:  2026-10-19 14:02:11.503129 <info> [medialife] text
///
void record_format( logging::record_view const& rec,
                    logging::formatting_ostream& strm )
{
    auto stamp = expr::stream
        << expr::format_date_time< boost::posix_time::ptime >
               ( "TimeStamp", "%Y-%m-%d %H:%M:%S.%f" );
    stamp( rec, strm );
    strm << " <" << rec[lt::severity] << "> [" << LogAppName << "] "
         << rec[expr::smessage];
}

/// Wrap a backend in a synchronous frontend using record_format and
/// register it with the core.  Returns the frontend.
///
template<typename Backend>
boost::shared_ptr< sinks::synchronous_sink<Backend> >
attach_sink( boost::shared_ptr<Backend> backend )
{
    using frontend_t = sinks::synchronous_sink<Backend>;
    auto sink = boost::make_shared<frontend_t>( backend );
    sink->set_formatter( &record_format );
    logging::core::get()->add_sink( sink );
    return sink;
}

/// Rotated files are moved to collect_dir and pruned there, keeping at
/// most 7 files and 16MB.  Collection is skipped if collect_dir cannot
/// be expanded (no HOME).
///
void collect_rotated( sinks::text_file_backend &backend, const char* collect_dir )
{
    boost::filesystem::path target {};
    try {
        target = expand_home( collect_dir );
    }
    catch (const std::invalid_argument &ex) {
        std::cerr << "Log collection disabled: " << ex.what() << std::endl;
        return;
    }
    backend.set_file_collector( sinks::file::make_collector(
        keywords::target = target.string(),
        keywords::max_size = 16 * 1024 * 1024,
        keywords::min_free_space = 100 * 1024 * 1024,
        keywords::max_files = 7 ) );
    backend.scan_for_files();
}

/// File backend rotating daily at midnight or beyond 5MB.
///
boost::shared_ptr< sinks::text_file_backend >
make_file_backend( const char* file_pattern, const char* collect_dir )
{
    auto backend = boost::make_shared< sinks::text_file_backend >(
        keywords::file_name = file_pattern,
        keywords::rotation_size = 5 * 1024 * 1024,
        keywords::time_based_rotation =
            sinks::file::rotation_at_time_point( 0, 0, 0 ) );
    backend->auto_flush( true );
    collect_rotated( *backend, collect_dir );
    return backend;
}

/// Stream backend writing to std::clog, which we do not own.
///
boost::shared_ptr< sinks::text_ostream_backend > make_console_backend()
{
    auto backend = boost::make_shared< sinks::text_ostream_backend >();
    backend->add_stream(
        boost::shared_ptr< std::ostream >( &std::clog, boost::null_deleter() ) );
    backend->auto_flush( true );
    return backend;
}

}

/// Start logging to a file and/or the console, as selected by flags.
/// Typical file_pattern: "medialife_%5N.log"
///
void init_logging( const char* appname, const char* file_pattern, int flags,
                   const char* collect_dir )
{
    if (appname) { LogAppName = appname; }
    if (flags & LF_FILE) {
        attach_sink( make_file_backend( file_pattern, collect_dir ) );
    }
    if (flags & LF_CONSOLE) {
        attach_sink( make_console_backend() );
    }
    logging::add_common_attributes();
    set_debug_logging( flags & LF_DEBUG );
}

/// Debug records pass only when debug is true.
/// Usable any time after init_logging.
///
void set_debug_logging( bool debug )
{
    auto core = logging::core::get();
    if (debug) {
        core->reset_filter();
    } else {
        core->set_filter( triv::severity >= triv::info );
    }
}

/// Flush and detach every sink.
///
void finish_logging()
{
    auto core = logging::core::get();
    core->flush();
    core->remove_all_sinks();
}
