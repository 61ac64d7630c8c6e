// Facility Layout - Layout Compilation: Ports, Parking, and Site Objects
// by Frank Gennari
// 10/18/26

#include "layout.h"
#include "logger.h"
#include "profiler.h"


void compile_layout(layout_config_t const &cfg, rand_source_t const &rand_src, vect_placed_inst_t &insts) {

	cfg.validate(); // fail before anything is added
	highres_timer_t timer("Compile Layout", cfg.print_timing);
	size_t const start_sz(insts.size());
	frame_geom_t const fg(compute_frame_geom(cfg.structure));
	vect_placed_inst_t port_insts;

	{ // structures and solar arrays
		highres_timer_t timer2("Structure and Solar", cfg.print_timing);

		for (unsigned p = 0; p < cfg.site.port_offsets.size(); ++p) { // every port shares the same frame and panel layout
			port_insts.clear();
			build_structure(cfg.structure, fg, port_insts);
			place_solar_panels(cfg.solar, fg, port_insts);
			vector3d const offset(cfg.site.port_offsets[p], 0.0, 0.0);

			for (auto i = port_insts.begin(); i != port_insts.end(); ++i) {
				i->translate(offset);
				i->tag = uint8_t(p);
			}
			insts.insert(insts.end(), port_insts.begin(), port_insts.end());
		} // for p
	}
	{
		highres_timer_t timer2("Parking", cfg.print_timing);
		plan_parking(cfg.parking, cfg.structure.length, rand_src, insts);
	}
	{
		highres_timer_t timer2("Site Objects", cfg.print_timing);
		place_site_objects(cfg.site, cfg.structure, rand_src, insts);
	}
	global_logger << "Compiled layout: " << (insts.size() - start_sz) << " instances, " << cfg.site.port_offsets.size()
		<< " ports, pitch " << TO_DEG*fg.pitch << " degrees, " << get_column_count(cfg.structure) << " column lines" << endl;
}

layout_stats_t get_layout_stats(vect_placed_inst_t const &insts) {
	layout_stats_t stats;
	for (auto i = insts.begin(); i != insts.end(); ++i) {stats.add(*i);}
	return stats;
}
