#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <string>
#include <syslog.h>

#include "log.hpp"

namespace util {

static FILE* g_stream = nullptr;
static bool g_syslog = false;

static const char* prio_name(int prio){
  switch (prio) {
    case LOG_DEBUG:   return "debug";
    case LOG_INFO:    return "info";
    case LOG_NOTICE:  return "notice";
    case LOG_WARNING: return "warning";
    case LOG_ERR:     return "err";
    default:          return "crit";
  }
}

void log_set_stream(FILE* f){
  g_stream = f;
}

int log_open_syslog(const char* ident, int facility){
  openlog(ident, LOG_PID, facility);
  g_syslog = true;
  return 0;
}

void log_close(){
  if (g_syslog) closelog();
  g_syslog = false;
}

void log_msg(int prio, const char* fmt, ...){
  va_list ap;
  va_start(ap, fmt);
  if (g_syslog) {
    vsyslog(prio, fmt, ap);
  } else {
    FILE* out = g_stream ? g_stream : stdout;
    std::fprintf(out, "[%s] ", prio_name(prio));
    std::vfprintf(out, fmt, ap);
    std::fputc('\n', out);
    std::fflush(out);
  }
  va_end(ap);
}

int parse_facility(const std::string& name, int& out){
  static const struct { const char* name; int fac; } table[] = {
    {"auth", LOG_AUTH},     {"authpriv", LOG_AUTHPRIV}, {"cron", LOG_CRON},
    {"daemon", LOG_DAEMON}, {"kern", LOG_KERN},         {"lpr", LOG_LPR},
    {"mail", LOG_MAIL},     {"news", LOG_NEWS},         {"syslog", LOG_SYSLOG},
    {"user", LOG_USER},     {"uucp", LOG_UUCP},
    {"local0", LOG_LOCAL0}, {"local1", LOG_LOCAL1},     {"local2", LOG_LOCAL2},
    {"local3", LOG_LOCAL3}, {"local4", LOG_LOCAL4},     {"local5", LOG_LOCAL5},
    {"local6", LOG_LOCAL6}, {"local7", LOG_LOCAL7},
  };
  for (const auto& e : table) {
    if (name == e.name) { out = e.fac; return 0; }
  }
  return -EINVAL;
}

}
