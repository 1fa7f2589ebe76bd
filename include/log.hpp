#pragma once
#include <cstdio>
#include <string>
#include <syslog.h>

namespace util {

// Messages go to the stream as "[prio] text" until log_open_syslog().
void log_set_stream(FILE* f);
int  log_open_syslog(const char* ident, int facility);
void log_close();

void log_msg(int prio, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

// "user", "daemon", "local0".."local7", ...; 0 or -EINVAL
int parse_facility(const std::string& name, int& out);

}
