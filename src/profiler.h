// Facility Layout - Performance Timing Profiler
// by Frank Gennari
// 10/18/26
#pragma once

#include <string>
#include <chrono>

using namespace std::chrono;

class highres_timer_t {
	std::string name;
	bool enabled;
	high_resolution_clock::time_point timer1;
	high_resolution_clock clock;
public:
	highres_timer_t(char const *const name_,  bool enabled_=1) : name(name_), enabled(enabled_), timer1(clock.now()) {}
	highres_timer_t(std::string const &name_, bool enabled_=1) : name(name_), enabled(enabled_), timer1(clock.now()) {}
	~highres_timer_t() {end();}
	void end();
};

inline float get_delta_secs(high_resolution_clock::time_point b, high_resolution_clock::time_point a) {return duration_cast<duration<float>>(b - a).count();}

void set_timing_profiler_enabled(bool enabled);
void timing_profiler_stats();
