// Facility Layout - Main Driver
// by Frank Gennari
// 10/18/26

#include "layout.h"
#include "logger.h"
#include "profiler.h"


string const defaults_file("facility.txt"); // searched in the run dir, then in scene_config/


int main(int argc, char** argv) {

	cout << "Starting Facility Layout" << endl;
	string const config_file((argc >= 2) ? argv[1] : defaults_file);
	layout_config_t cfg;

	if (!load_layout_config(config_file, cfg)) {
		cerr << "Failed to load config file " << config_file << endl;
		return 1;
	}
	set_timing_profiler_enabled(1); // accumulate, then print a table at the end
	vect_placed_inst_t insts;

	try {
		compile_layout(cfg, make_seeded_rand_source(cfg.seed), insts);
	}
	catch (config_error_t const &e) {
		cerr << "Config error: " << e.what() << endl;
		global_logger << "Config error: " << e.what() << endl;
		return 1;
	}
	layout_stats_t const stats(get_layout_stats(insts));
	stats.print(cout);
	if (cfg.print_timing) {timing_profiler_stats();}
	global_logger << "Seed " << cfg.seed << ": " << insts.size() << " instances" << endl;
	return 0;
}
