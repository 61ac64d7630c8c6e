// Facility Layout - Performance Timing Profiler
// by Frank Gennari
// 10/18/26

#include "facility_layout.h"
#include "profiler.h"
#include "logger.h"


class stage_profiler_t { // per generation stage, in the order the stages first ran

	struct stage_t {
		string name;
		unsigned count=0;
		float total_ms=0.0, max_ms=0.0;
		stage_t(string const &name_) : name(name_) {}
	};
	vector<stage_t> stages;
	map<string, unsigned> name_to_ix;

public:
	bool enabled=0; // accumulate instead of printing each time

	void clear() {stages.clear(); name_to_ix.clear();}

	void register_time(string const &name, float ms) {
		if (!enabled) {cout << name << " time = " << ms << "ms" << endl; return;}
		auto it(name_to_ix.find(name));

		if (it == name_to_ix.end()) {
			it = name_to_ix.insert(make_pair(name, unsigned(stages.size()))).first;
			stages.emplace_back(name);
		}
		stage_t &s(stages[it->second]);
		++s.count;
		s.total_ms += ms;
		s.max_ms    = max(s.max_ms, ms);
	}
	void stats(std::ostream &out) const {
		if (stages.empty()) return;
		unsigned max_name(0);
		for (auto i = stages.begin(); i != stages.end(); ++i) {max_name = max(max_name, (unsigned)i->name.size());}
		out << "stage" << string((max_name > 5) ? (max_name - 5) : 0, ' ') << ": count total_ms max_ms" << endl;

		for (auto i = stages.begin(); i != stages.end(); ++i) {
			out << i->name << string((max_name - i->name.size()), ' ') << ": " << i->count << "\t" << i->total_ms << "\t" << i->max_ms << endl;
		}
	}
};

stage_profiler_t global_stage_profiler;

void set_timing_profiler_enabled(bool enabled) {global_stage_profiler.enabled = enabled;}

void timing_profiler_stats() { // to the console and the log
	std::ostringstream oss;
	global_stage_profiler.stats(oss);
	cout << oss.str();
	if (!oss.str().empty()) {global_logger.log_str(oss.str(), 0);}
	global_stage_profiler.clear();
}

void highres_timer_t::end() {
	if (!enabled || name.empty()) return;
	global_stage_profiler.register_time(name, 1000.0*get_delta_secs(clock.now(), timer1));
	name.clear(); // only count once
}
