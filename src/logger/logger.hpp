/**
 * Copyright (c) 2009 Carnegie Mellon University.
 *     All rights reserved.
 *
 *  Licensed under the Apache License, Version 2.0 (the "License");
 *  you may not use this file except in compliance with the License.
 *  You may obtain a copy of the License at
 *
 *      http://www.apache.org/licenses/LICENSE-2.0
 *
 *  Unless required by applicable law or agreed to in writing,
 *  software distributed under the License is distributed on an "AS
 *  IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either
 *  express or implied.  See the License for the specific language
 *  governing permissions and limitations under the License.
 *
 */


/**
 * @file logger.hpp
 * Usage:
 * Include logger.hpp and write either
 *
 *   logstream(LOG_INFO) << "Loaded " << n << " rows" << std::endl;
 *
 * or the printf-style
 *
 *   logger(LOG_INFO, "Loaded %d rows", n);
 *
 * There are 2 output levels. A "soft" level set at runtime with
 * global_logger().set_log_level(), and a "hard" level OUTPUTLEVEL fixed at
 * compile time. A line is written only if its level passes both.
 *
 * A LOG_FATAL stream line is written out and then raised as
 * vodrec::fatal_error when std::endl is reached.
 */

#ifndef VODREC_LOG_LOG_HPP
#define VODREC_LOG_LOG_HPP
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <cstdio>
#include <iostream>
#include <cstring>
#include <cstdarg>
#include <string>
#include <pthread.h>

#include "api/errors.hpp"

/**
 * \def LOG_FATAL
 *   Used for fatal and probably irrecoverable conditions
 * \def LOG_ERROR
 *   Used for errors which are recoverable within the scope of the function
 * \def LOG_WARNING
 *   Logs interesting conditions which are probably not fatal
 * \def LOG_INFO
 *   Used for providing general useful information
 * \def LOG_DEBUG
 *   Debugging purposes only
 */
#define LOG_NONE 5
#define LOG_FATAL 4
#define LOG_ERROR 3
#define LOG_WARNING 2
#define LOG_INFO 1
#define LOG_DEBUG 0

#ifndef OUTPUTLEVEL
#define OUTPUTLEVEL LOG_DEBUG
#endif
/// If set, logs to screen will be printed in color
#define COLOROUTPUT


#if OUTPUTLEVEL == LOG_NONE
// totally disable logging
#define logger(lvl,fmt,...)
#define logstream(lvl) (null_stream())
#else

#define logger(lvl,fmt,...)                 \
    (log_dispatch<(lvl >= OUTPUTLEVEL)>::exec(lvl,__FILE__, __func__ ,__LINE__,fmt,##__VA_ARGS__))

#define logstream(lvl)                      \
    (log_stream_dispatch<(lvl >= OUTPUTLEVEL)>::exec(lvl,__FILE__, __func__ ,__LINE__) )
#endif

static const char* log_level_names[] = {  "DEBUG:    ",
    "INFO:     ",
    "WARNING:  ",
    "ERROR:    ",
    "FATAL:    "};

namespace logger_impl {
struct streambuff_tls_entry {
  std::stringstream streambuffer;
  bool streamactive;
  int streamloglevel;
  streambuff_tls_entry() : streamactive(false), streamloglevel(LOG_INFO) {}
};
}


/**
  logging class.
  This writes to a file, and/or the system console.
*/
class file_logger {
 public:

  file_logger() {
    log_file = "";
    log_to_console = true;
    log_level = LOG_DEBUG;
    pthread_mutex_init(&mut, NULL);
    pthread_key_create(&streambuffkey, streambuffdestructor);
  }

  ~file_logger() {
    if (fout.is_open()) {
      fout.flush();
      fout.close();
    }
    pthread_mutex_destroy(&mut);
  }

  /** Closes the current log file if one exists. If 'file' is not empty it
      is opened (truncated) and receives all subsequent output.
      Returns false if the file could not be opened. */
  bool set_log_file(std::string file) {
    if (fout.is_open()) {
      fout.flush();
      fout.close();
      log_file = "";
    }
    if (file.length() > 0) {
      fout.open(file.c_str());
      if (fout.fail()) return false;
      log_file = file;
    }
    return true;
  }

  /// If consolelog is true, subsequent logger output will be written to stderr
  void set_log_to_console(bool consolelog) {
    log_to_console = consolelog;
  }

  int get_log_level() const {
    return log_level;
  }

  /** Lines below new_log_level are not written. */
  void set_log_level(int new_log_level) {
    log_level = new_log_level;
  }

  template <typename T>
  file_logger& operator<<(const T & a) {
    logger_impl::streambuff_tls_entry* entry = tls_entry();
    if (entry != NULL && entry->streamactive) entry->streambuffer << a;
    return *this;
  }

  file_logger& operator<<(const char* a) {
    logger_impl::streambuff_tls_entry* entry = tls_entry();
    if (entry != NULL && entry->streamactive) {
      entry->streambuffer << a;
      size_t len = strlen(a);
      if (len > 0 && a[len-1] == '\n') {
        stream_flush();
      }
    }
    return *this;
  }

  file_logger& operator<<(std::ostream& (*f)(std::ostream&)) {
    logger_impl::streambuff_tls_entry* entry = tls_entry();
    if (entry == NULL) return *this;
    typedef std::ostream& (*endltype)(std::ostream&);
    if (entry->streamactive && endltype(f) == endltype(std::endl)) {
      entry->streambuffer << "\n";
      std::string msg = entry->streambuffer.str();
      int lvl = entry->streamloglevel;
      stream_flush();
      if (lvl == LOG_FATAL) {
        throw vodrec::fatal_error(msg);
      }
    }
    return *this;
  }

  void _log(int lineloglevel, const char* file, const char* function,
            int line, const char* fmt, va_list ap) {
    if (lineloglevel < 0 || lineloglevel > LOG_FATAL || lineloglevel < log_level)
      return;
    file = basename_of(file);
    char str[1024];
    int byteswritten = snprintf(str, 1024, "%s%s(%s:%d): ",
                                log_level_names[lineloglevel], file, function, line);
    if (byteswritten < 0) return;
    if (byteswritten < 1022)
      byteswritten += vsnprintf(str + byteswritten, 1022 - byteswritten, fmt, ap);
    if (byteswritten > 1022) byteswritten = 1022;
    str[byteswritten] = '\n';
    str[byteswritten+1] = 0;
    _lograw(lineloglevel, str, byteswritten + 1);
  }

  void _lograw(int lineloglevel, const char* buf, int len) {
    pthread_mutex_lock(&mut);
    if (fout.is_open() && fout.good()) {
      fout.write(buf, len);
      fout.flush();
    }
    if (log_to_console) {
#ifdef COLOROUTPUT
      if (lineloglevel >= LOG_ERROR) {
        textcolor(stderr, BRIGHT, RED);
      } else if (lineloglevel == LOG_WARNING) {
        textcolor(stderr, BRIGHT, GREEN);
      }
#endif
      std::cerr.write(buf, len);
      std::cerr.flush();
#ifdef COLOROUTPUT
      reset_color(stderr);
#endif
    }
    pthread_mutex_unlock(&mut);
  }

  file_logger& start_stream(int lineloglevel, const char* file, const char* function, int line) {
    logger_impl::streambuff_tls_entry* entry = tls_entry();
    if (entry == NULL) {
      entry = new logger_impl::streambuff_tls_entry;
      pthread_setspecific(streambuffkey, entry);
    }
    file = basename_of(file);
    if (lineloglevel >= log_level || lineloglevel == LOG_FATAL) {
      if (entry->streambuffer.str().length() == 0) {
        entry->streambuffer << log_level_names[lineloglevel] << file
                            << "(" << function << ":" << line << "): ";
      }
      entry->streamactive = true;
      entry->streamloglevel = lineloglevel;
    } else {
      entry->streamactive = false;
    }
    return *this;
  }

  void stream_flush() {
    logger_impl::streambuff_tls_entry* entry = tls_entry();
    if (entry != NULL) {
      std::string s = entry->streambuffer.str();
      _lograw(entry->streamloglevel, s.c_str(), (int)s.length());
      entry->streambuffer.str("");
    }
  }

 private:
  enum { BRIGHT = 1 };
  enum { RED = 1, GREEN = 2 };

  static void streambuffdestructor(void* v) {
    delete reinterpret_cast<logger_impl::streambuff_tls_entry*>(v);
  }

  logger_impl::streambuff_tls_entry* tls_entry() {
    return reinterpret_cast<logger_impl::streambuff_tls_entry*>(pthread_getspecific(streambuffkey));
  }

  static const char * basename_of(const char * file) {
    const char * slash = strrchr(file, '/');
    return slash ? slash + 1 : file;
  }

  static void textcolor(FILE* handle, int attr, int fg) {
    fprintf(handle, "%c[%d;%dm", 0x1B, attr, fg + 30);
  }

  static void reset_color(FILE* handle) {
    fprintf(handle, "%c[0m", 0x1B);
  }

  std::ofstream fout;
  std::string log_file;
  pthread_key_t streambuffkey;
  pthread_mutex_t mut;
  bool log_to_console;
  int log_level;
};


static file_logger& global_logger();

/**
Wrapper to generate 0 code if the output level is lower than the log level
*/
template <bool dostuff>
struct log_dispatch {};

template <>
struct log_dispatch<true> {
  inline static void exec(int loglevel, const char* file, const char* function,
                          int line, const char* fmt, ... ) {
    va_list argp;
    va_start(argp, fmt);
    global_logger()._log(loglevel, file, function, line, fmt, argp);
    va_end(argp);
  }
};

template <>
struct log_dispatch<false> {
  inline static void exec(int loglevel, const char* file, const char* function,
                          int line, const char* fmt, ... ) {}
};


struct null_stream {
  template<typename T>
  inline null_stream operator<<(const T & t) { return null_stream(); }
  inline null_stream operator<<(const char* a) { return null_stream(); }
  inline null_stream operator<<(std::ostream& (*f)(std::ostream&)) { return null_stream(); }
};


template <bool dostuff>
struct log_stream_dispatch {};

template <>
struct log_stream_dispatch<true> {
  inline static file_logger& exec(int lineloglevel, const char* file, const char* function, int line) {
    return global_logger().start_stream(lineloglevel, file, function, line);
  }
};

template <>
struct log_stream_dispatch<false> {
  inline static null_stream exec(int lineloglevel, const char* file, const char* function, int line) {
    return null_stream();
  }
};

static file_logger& global_logger() {
  static file_logger l;
  return l;
}


#endif
