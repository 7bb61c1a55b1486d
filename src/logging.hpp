#ifndef ASEMETA_LOGGING_H
#define ASEMETA_LOGGING_H

#include <string>
using namespace std;

void init_logging(string loglevel, string logfile);
void log_debug(const string& s);
void log_info(const string& s);
void log_warning(const string& s);
void log_error(const string& s, const int& die = 0);

// 12345678 -> "12,345,678"
string format_count(long long n);

#endif
