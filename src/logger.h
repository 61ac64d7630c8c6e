// Facility Layout - Simple File Logger
// by Frank Gennari
// 10/18/26
#pragma once

#include <string>
#include <iostream>
#include <fstream>

class logger_t {
	std::ofstream log;
	std::string fn;

	void open_log_file() { // open file on first write
		if (log.is_open()) return; // already open
		log.open(fn);
	}
public:
	logger_t(std::string const &fn_="facility_layout.log") : fn(fn_) {}

	void set_filename(std::string const &fn_) {
		if (log.is_open()) {log.close();} // reopened on next write
		fn = fn_;
	}
	void log_str(std::string const &str, bool add_newline=1) {
		open_log_file();
		log << str;
		if (add_newline) {log << std::endl;}
	}
	template <typename T> logger_t& operator<<(const T& v) {
		open_log_file();
		log << v;
		return *this;
	}
	logger_t& operator<<(std::ostream& (*manip)(std::ostream&)) { // overload for manipulators like std::endl
		open_log_file();
		manip(log);
		return *this;
	}
	~logger_t() {log.close();}
};

extern logger_t global_logger;
