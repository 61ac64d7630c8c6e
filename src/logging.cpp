// Facility Layout - Logging
// by Frank Gennari
// 10/18/26

#include "facility_layout.h"
#include "logger.h"

logger_t global_logger;

void set_log_filename(string const &fn) {global_logger.set_filename(fn);}

void log_warning(string const &str) { // to both the console and the log file
	cerr << "Warning: " << str << endl;
	global_logger.log_str("Warning: " + str);
}
