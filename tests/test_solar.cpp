// Facility Layout - Solar Array Placement Self-Test
// by Frank Gennari
// 10/18/26

#include "test_util.h"


int test_panel_count() {
	int error(0);
	structure_params_t const st;
	frame_geom_t const fg(compute_frame_geom(st));
	solar_params_t sp;
	vect_placed_inst_t insts;
	place_solar_panels(sp, fg, insts);
	error += check((get_num_panels(sp) == 498), "3 rows x 83 panels x 2 slopes");
	error += check((insts.size() == get_num_panels(sp)), "emitted panel count");
	error += check((count_kind(insts, INST_SOLAR_PANEL) == insts.size()), "only panels emitted");

	sp.rows_per_slope = 1;
	sp.panels_per_row = 7;
	insts.clear();
	place_solar_panels(sp, fg, insts);
	error += check((insts.size() == 14), "1 row x 7 panels x 2 slopes");

	sp.rows_per_slope = 0;
	insts.clear();
	place_solar_panels(sp, fg, insts);
	error += check(insts.empty(), "no rows, no panels");
	return error;
}

int test_panel_offsets() {
	int error(0);
	solar_params_t sp;
	float x_off(0.0), z_off(0.0);
	get_panel_offsets(sp, 0, 0, x_off, z_off);
	error += check(approx_eq(x_off, -sp.panel_length), "first row offset");
	error += check(approx_eq(z_off, -0.5*sp.panels_per_row*sp.panel_width, 1.0E-3), "first column offset");
	get_panel_offsets(sp, 2, 82, x_off, z_off);
	error += check(approx_eq(x_off, sp.panel_length + 2.0*sp.gap_along_slope), "last row offset");
	error += check(approx_eq(z_off, 82.0*(sp.panel_width + sp.gap_along_length) - 0.5*sp.panels_per_row*sp.panel_width, 1.0E-3), "last column offset");

	// grid means: the gaps and the half panel width shift the raw grid off zero
	double x_sum(0.0), z_sum(0.0);
	unsigned const num(sp.rows_per_slope*sp.panels_per_row);

	for (unsigned r = 0; r < sp.rows_per_slope; ++r) {
		for (unsigned c = 0; c < sp.panels_per_row; ++c) {
			get_panel_offsets(sp, r, c, x_off, z_off);
			x_sum += x_off;
			z_sum += z_off;
		}
	}
	error += check(approx_eq(x_sum/num, 0.5*(sp.rows_per_slope - 1)*sp.gap_along_slope, 1.0E-3), "mean slope offset");
	error += check(approx_eq(z_sum/num, -0.5*sp.panel_width + 0.5*(sp.panels_per_row - 1)*sp.gap_along_length, 1.0E-3), "mean length offset");

	sp.gap_along_slope = sp.gap_along_length = 0.0;
	x_sum = z_sum = 0.0;

	for (unsigned r = 0; r < sp.rows_per_slope; ++r) {
		for (unsigned c = 0; c < sp.panels_per_row; ++c) {
			get_panel_offsets(sp, r, c, x_off, z_off);
			x_sum += x_off;
			z_sum += z_off;
		}
	}
	error += check(approx_eq(x_sum/num, 0.0, 1.0E-3), "gapless rows centered on the slope");
	error += check(approx_eq(z_sum/num, -0.5*sp.panel_width, 1.0E-3), "gapless columns start at -cols*width/2");
	return error;
}

int test_slope_placement() {
	int error(0);
	structure_params_t const st;
	frame_geom_t const fg(compute_frame_geom(st));
	solar_params_t const sp;
	vect_placed_inst_t insts;
	place_solar_panels(sp, fg, insts);
	unsigned const per_slope(sp.rows_per_slope*sp.panels_per_row);
	if (insts.size() != 2*per_slope) {return check(0, "panel count for slope placement");}
	float const dx(cos(fg.pitch)*sp.overhang_fix), dy(sin(fg.pitch)*sp.overhang_fix);

	for (unsigned i = 0; i < per_slope; ++i) {
		placed_instance_t const &l(insts[i]), &r(insts[i + per_slope]); // same row and column on each slope
		error += check((l.rot_axis == plus_z && r.rot_axis == plus_z), "panels rotate about the length axis");
		error += check((approx_eq(l.rot_angle, fg.pitch) && approx_eq(r.rot_angle, -fg.pitch)), "panel rotation matches slope pitch");
		error += check((l.pos.x < 0.0 && r.pos.x > 0.0), "left panels at -x, right panels at +x");
		error += check((l.size == vector3d(sp.panel_length, sp.panel_thick, sp.panel_width)), "panel box size");
		// the right slope mirrors the left, then shifts down-slope by overhang_fix
		error += check(approx_eq(r.pos.x, (-l.pos.x + dx), 1.0E-3), "right panel x mirrored plus down-slope shift");
		error += check(approx_eq(r.pos.y, (l.pos.y - dy), 1.0E-3), "right panel y lowered by down-slope shift");
		error += check(approx_eq(r.pos.z, l.pos.z, 1.0E-3), "both slopes share z offsets");
	}
	// first left panel: anchor + offset rotated by +pitch
	float x_off(0.0), z_off(0.0);
	get_panel_offsets(sp, 0, 0, x_off, z_off);
	point const expect((-0.5*fg.half_span + x_off*cos(fg.pitch)), (fg.get_slope_mid_y() + sp.panel_standoff + x_off*sin(fg.pitch)), z_off);
	error += check(approx_eq(insts[0].pos, expect, 1.0E-3), "first left panel position");
	return error;
}

int test_slope_overflow() { // too many rows for the slope is accepted, not clamped
	int error(0);
	structure_params_t const st;
	frame_geom_t const fg(compute_frame_geom(st));
	solar_params_t sp;
	sp.rows_per_slope = 5;
	error += check((get_row_extent(sp) > fg.slope_len), "5 rows overflow the slope");
	vect_placed_inst_t insts;
	set_log_filename("test_solar.log");
	place_solar_panels(sp, fg, insts);
	error += check((insts.size() == get_num_panels(sp)), "all panels emitted on overflow");
	solar_params_t const def;
	error += check((get_row_extent(def) <= fg.slope_len), "default rows fit on the slope");
	error += check(approx_eq(get_row_extent(def), 3.0*1.762 + 2.0*0.05), "row extent");
	return error;
}

int main() {
	int error(0);
	error += test_panel_count();
	error += test_panel_offsets();
	error += test_slope_placement();
	error += test_slope_overflow();
	return finish_test(error, "test_solar");
}
