#pragma once
#include <iostream>
#include <ctime>
#include <sstream>
#include <string>

#ifdef DWELL_DEBUG
#define DWELL_DEBUG_BOOL true
#else
#define DWELL_DEBUG_BOOL false
#endif

#ifdef DWELL_DEBUG
// Chop everything before the last 'dwell/' off of __FILE__ so that log lines stay readable
namespace dwell {
inline std::string _DEBUG__FILE__(const char *f) {
    std::string file(f);
    auto e = file.rfind("/dwell/");
    return e == std::string::npos ? file : file.substr(e+1);
}
}
#define _dwell__FILE__ dwell::_DEBUG__FILE__(__FILE__)
#else
#define _dwell__FILE__ ""
#endif

#define _dwell_dbg(prefix, stuff) std::ostringstream s; s << prefix << _dwell__FILE__ << ":" << __LINE__ << ":" << __func__ << "(): " << stuff << "\n"; std::cerr << s.str() << std::flush

/** Logging macro.  DWELL_DBG(a << b << c); sends a << b << c into std::cerr when debugging is
 * enabled, and does nothing otherwise.  The output has the file/line/function prepended, and a
 * newline appended.
 *
 * Does nothing unless compiled with `-DDWELL_DEBUG` (the DWELL_DEBUG CMake option).
 */
#define DWELL_DBG(stuff) do { if (DWELL_DEBUG_BOOL) { _dwell_dbg("", stuff); } } while (0)

/** Logging macro just like `DWELL_DBG`, but also prefixes output with the current date and time. */
#define DWELL_TDBG(stuff) do { if (DWELL_DEBUG_BOOL) { \
    std::time_t t = std::time(nullptr); char tstr[100]; std::strftime(tstr, sizeof(tstr), "[%c] ", std::localtime(&t)); \
    _dwell_dbg(tstr, stuff); } } while (0)
